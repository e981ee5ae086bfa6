// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ColouredPTN/petri_net.hpp"
#include "ColouredPTN/reachability.hpp"

using Net = cptn::PetriNet<>;
using Token = cptn::ColouredToken;

static std::string paddedID(const std::string &prefix, int i) {
  std::ostringstream oss;
  oss << prefix << std::setw(3) << std::setfill('0') << i;
  return oss.str();
}

class MondProcess {
private:
  Net net_;

  void addPlaces() {
    const std::vector<std::string> names = {"P_feed_ore",
                                            "P_crush",
                                            "P_leach",
                                            "P_concentrate",
                                            "P_impure_Ni",
                                            "P_CO_feed",
                                            "P_carbonylation",
                                            "P_NiCO4_gas",
                                            "P_condenser",
                                            "P_transfer_to_decomp",
                                            "P_decomposer",
                                            "P_pure_Ni",
                                            "P_CO_recycle",
                                            "P_scrubber",
                                            "P_offgas",
                                            "P_quality_check",
                                            "P_storage"};
    for (const auto &name : names) {
      // the condenser holds 5 tokens at most
      net_.addPlace(name, name == "P_condenser" ? std::optional<std::size_t>(5) : std::nullopt);
    }
  }

  void addInitialMarking() {
    std::vector<Token> ore;
    for (int i = 1; i <= 10; ++i) {
      ore.emplace_back("Ni_ore", paddedID("ORE", i), 1.0, std::nullopt, 0.6);
    }
    net_.addTokens("P_feed_ore", std::move(ore));

    std::vector<Token> co;
    for (int i = 1; i <= 40; ++i) {
      co.emplace_back("CO", paddedID("CO", i));
    }
    net_.addTokens("P_CO_feed", std::move(co));
  }

  void addTransitions() {
    net_.addTransition({"T1", {}, {{"P_feed_ore", cptn::typed(1, "Ni_ore", "ORE-")}}, nullptr,
                        "Receive ore (external)."});
    net_.addTransition(
        {"T2", {{"P_feed_ore", 1}}, {{"P_crush", cptn::transfer()}}, nullptr, "Crush/grind."});
    net_.addTransition({"T3", {{"P_crush", 1}}, {{"P_concentrate", cptn::transfer()}}, nullptr,
                        "Leach/concentrate."});
    net_.addTransition({"T4", {{"P_concentrate", 1}}, {{"P_impure_Ni", cptn::transfer()}}, nullptr,
                        "Prepare impure Ni feed."});
    net_.addTransition({"T5", {}, {{"P_CO_feed", cptn::typed(4, "CO", "CO-")}}, nullptr,
                        "Introduce/replenish CO (external)."});

    // Carbonylation needs an ore of acceptable purity
    auto carbonylation_guard = [](const Net &, const Net::SelectionT &selected) {
      const auto &ni = selected.at("P_impure_Ni");
      if (ni.empty()) {
        return false;
      }
      return !ni.front().purity || *ni.front().purity >= 0.5;
    };
    auto create_nico4 = [](const Net::SelectionT &selected, cptn::FiringContext<Token> &ctx) {
      const auto &ni = selected.at("P_impure_Ni").front();
      return std::vector<Token>{Token("NiCO4", "NC-" + ctx.nextBatchID(), ni.mass, 25.0)};
    };
    net_.addTransition({"T6",
                        {{"P_impure_Ni", 1}, {"P_CO_feed", 4}},
                        {{"P_NiCO4_gas", cptn::computed(create_nico4)}},
                        carbonylation_guard,
                        "Carbonylation: Ni + CO -> Ni(CO)4"});

    net_.addTransition({"T7", {{"P_NiCO4_gas", 1}}, {{"P_condenser", cptn::transfer()}}, nullptr,
                        "Transfer to condenser."});
    net_.addTransition({"T8", {{"P_condenser", 1}}, {{"P_transfer_to_decomp", cptn::transfer()}},
                        nullptr, "Condense/collect Ni(CO)4."});
    net_.addTransition({"T9", {{"P_transfer_to_decomp", 1}}, {{"P_decomposer", cptn::transfer()}},
                        nullptr, "Transfer to decomposer."});

    // Decomposition yields pure nickel and recycles the 4 CO
    auto decompose = [](const Net::SelectionT &selected, cptn::FiringContext<Token> &ctx) {
      const auto &nico4 = selected.at("P_decomposer").front();
      std::vector<Token> co;
      for (int i = 0; i < 4; ++i) {
        co.emplace_back("CO", "RCO-" + ctx.nextBatchID());
      }
      ctx.emit("P_CO_recycle", std::move(co));
      return std::vector<Token>{Token("Ni_pure", "NP-" + ctx.nextBatchID(), nico4.mass, 25.0, 0.99)};
    };
    net_.addTransition({"T10",
                        {{"P_decomposer", 1}},
                        {{"P_pure_Ni", cptn::computed(decompose)}},
                        [](const Net &, const Net::SelectionT &selected) {
                          return !selected.at("P_decomposer").empty();
                        },
                        "Decomposition: NiCO4 -> Ni + CO"});

    net_.addTransition({"T11", {{"P_CO_recycle", 1}}, {{"P_CO_feed", cptn::transfer()}}, nullptr,
                        "CO recycle to feed."});

    // Quality check passes with a probability equal to the purity
    auto quality_check = [](const Net::SelectionT &selected, cptn::FiringContext<Token> &ctx) {
      const auto &ni = selected.at("P_pure_Ni").front();
      const double pass = ni.purity ? *ni.purity : 0.95;
      if (ctx.uniform() <= pass) {
        ctx.emit("P_storage", ni);
        ctx.count("qc_passed");
      } else {
        ctx.emit("P_scrubber", ni);
        ctx.count("qc_failed");
      }
      return std::vector<Token>{};
    };
    net_.addTransition({"T12", {{"P_pure_Ni", 1}}, {{"P_storage", cptn::computed(quality_check)}},
                        nullptr, "Quality check (probabilistic)."});

    net_.addTransition({"T13", {{"P_scrubber", 1}}, {{"P_offgas", cptn::transfer()}}, nullptr,
                        "Scrap/waste handling."});
    net_.addTransition({"T14", {{"P_NiCO4_gas", 1}}, {{"P_scrubber", cptn::transfer()}}, nullptr,
                        "Emergency vent - route to scrubber."});
  }

public:
  MondProcess() {
    this->addPlaces();
    this->addInitialMarking();
    this->addTransitions();
  }

  Net &net() { return net_; }
};

int main() {
  spdlog::set_level(spdlog::level::info);

  std::cout << "Building Mond Process Petri Net..." << std::endl;
  MondProcess process;
  Net &net = process.net();
  const Net initial = net;

  std::cout << "Initial status:" << std::endl;
  net.printStatus();

  std::cout << "Running automatic simulation (policy: prioritise T6/T10) ..." << std::endl;
  cptn::RunOptions options;
  options.policy = cptn::Policy::k_prioritise;
  options.priority = {"T6", "T10", "T11", "T8", "T7"};
  try {
    auto report = net.autoRun(200, options);
    std::cout << "Steps: " << report.steps << ", fired: " << report.fired
              << ", rejected: " << report.rejected << std::endl;
  } catch (const cptn::CapacityExceeded &e) {
    std::cerr << "Simulation stopped: " << e.what() << std::endl;
  }

  std::cout << "\nAfter auto-run status:" << std::endl;
  net.printStatus();

  while (net.place("P_pure_Ni").count() > 0) {
    if (!net.stepFire("T12")) {
      break;
    }
  }

  std::cout << "After QC routing:" << std::endl;
  net.printStatus();

  std::cout << "=== Summary stats ===" << std::endl;
  for (const auto &[key, value] : net.getStats()) {
    std::cout << key << ": " << value << std::endl;
  }
  std::cout << "=====================" << std::endl;

  std::cout << "\nSearching a sequence that yields P_crush >= 1 from the initial marking"
            << " (max depth 3)" << std::endl;
  cptn::SearchStats stats;
  auto sequence = cptn::findSequenceBFS(
      initial, [](const cptn::Snapshot &snapshot) { return snapshot.at("P_crush") >= 1; }, 3,
      &stats);
  if (sequence) {
    std::cout << "Found sequence:";
    for (const auto &id : *sequence) {
      std::cout << " " << id;
    }
    std::cout << " (" << stats.visited << " states visited)" << std::endl;
  } else {
    std::cout << "No sequence found within depth." << std::endl;
  }

  return 0;
}
