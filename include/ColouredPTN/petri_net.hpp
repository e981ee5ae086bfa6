// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the PetriNet class

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_PETRI_NET_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_PETRI_NET_HPP_

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "firing.hpp"
#include "log.hpp"
#include "place.hpp"
#include "token.hpp"
#include "transition.hpp"

namespace cptn {

///
///\brief Place ID -> token count
///
using Snapshot = std::map<std::string, std::size_t>;

///
///\brief Summary of one PetriNet::autoRun()
///
struct RunReport {
  ///\brief iterations executed (clock ticks)
  std::size_t steps = 0;

  std::size_t fired = 0;
  std::size_t rejected = 0;

  ///\brief true if the run halted because nothing was enabled
  bool deadlocked = false;
};

///
///\brief Class representing a coloured PTN
///
/// This is the only class which has to be instanciated by the user.
/// Places and Transitions are meant to be initialized via this class.
///
/// A PetriNet is a value: copying it copies every Place, token,
/// Transition, counter, the clock and the random generator state, so a copy
/// can be fired independently of the original. Output rules and guards
/// receive the net they run on and must not capture a net by reference.
///
///\tparam Token the token type (must provide the public members type, batch_id, mass and age)
///
template <typename Token = ColouredToken> class PetriNet {
  template <typename A> friend class Transition;
  template <typename A> friend class FiringContext;

public:
  using IDT = std::string;
  using TokenT = Token;
  using PlaceT = Place<TokenT>;
  using TransitionT = Transition<TokenT>;
  using SelectionT = SelectionMap<TokenT>;
  using ResultT = FiringResult<TokenT>;
  using SnapshotT = Snapshot;

  ///
  ///\brief A descriptive Structure for Transitions used as a blueprint
  ///
  struct TransitionSketch {
    ///\brief the desired id
    IDT id;

    ///\brief all input arcs {placeId, weight[, select]}
    std::vector<typename TransitionT::InputT> ingoing;

    ///\brief all output places {placeId, rule}
    std::vector<typename TransitionT::OutputPairT> outgoing;

    ///\brief optional guard
    typename TransitionT::GuardT guard;

    std::string description;
  };

private:
  // deque keeps references stable while the net grows
  std::deque<PlaceT> places_;
  std::deque<TransitionT> transitions_;
  std::map<std::string, std::uint64_t> stats_;
  double clock_ = 0.0;
  std::uint64_t batch_counter_ = 0;
  unsigned batch_id_width_;
  std::mt19937 rng_;
  std::shared_ptr<spdlog::logger> logger_;

  ///
  ///\brief Apply a firing that passed all checks
  ///
  /// Validates every target Place and the capacities of the final marking
  /// first, then removes the selected tokens by position and adds the
  /// produced tokens. Positions index the marking the guard and the output
  /// rules saw, which only get a const net.
  ///
  ///\throws UnknownPlace if an output rule emitted to an unknown Place
  ///\throws CapacityExceeded if a Place would overflow, nothing is changed then
  ///
  void commitFiring(TransitionT &transition, const typename TransitionT::PositionsT &selected,
                    FiringContext<TokenT> &ctx) noexcept(false) {
    std::map<IDT, std::size_t> added;
    for (const auto &[place_id, tokens] : ctx.produced_) {
      (void)this->place(place_id);
      added[place_id] += tokens.size();
    }

    for (const auto &[place_id, n] : added) {
      const auto &target = this->place(place_id);
      if (!target.getCapacity()) {
        continue;
      }
      std::size_t removed = 0;
      auto it = selected.find(place_id);
      if (it != selected.end()) {
        removed = it->second.size();
      }
      if (target.count() - removed + n > *target.getCapacity()) {
        throw CapacityExceeded(place_id, *target.getCapacity());
      }
    }

    for (const auto &[place_id, positions] : selected) {
      this->place(place_id).removeAt(positions);
    }
    for (auto &[place_id, tokens] : ctx.produced_) {
      this->place(place_id).addTokens(std::move(tokens));
    }
    for (const auto &[key, n] : ctx.counters_) {
      this->stats_[key] += n;
    }

    ++transition.fired_count_;
    ++this->stats_["fired::" + transition.getID()];
  }

  ///
  ///\brief Look up a Place or Transition by ID in places_ or transitions_
  ///
  ///\return a pointer with the constness of items, nullptr if the ID was not found
  ///
  template <typename Items>
  static auto findByID(Items &items, const IDT &id) noexcept(true) -> decltype(&items.front()) {
    auto it = std::find_if(begin(items), end(items),
                           [&](const auto &item) { return item.getID() == id; });
    return it != end(items) ? &*it : nullptr;
  }

  ///
  ///\brief Pick one of the enabled transitions according to the policy
  ///
  const IDT &choose(const std::vector<IDT> &enabled, const RunOptions &options) {
    if (options.policy == Policy::k_prioritise) {
      for (const auto &id : options.priority) {
        auto it = std::find(cbegin(enabled), cend(enabled), id);
        if (it != cend(enabled)) {
          return *it;
        }
      }
    }
    std::uniform_int_distribution<std::size_t> pick(0, enabled.size() - 1);
    return enabled[pick(this->rng_)];
  }

public:
  ///
  ///\brief Construct a new PetriNet
  ///
  ///\param options seed, batch id format and logger
  ///
  explicit PetriNet(const NetOptions &options = NetOptions{})
      : batch_id_width_(options.batch_id_width),
        rng_(options.seed),
        logger_(options.logger != nullptr ? options.logger : log::get()) {}

  ///
  ///\brief find a Place with the given ID
  ///
  ///\param id  the ID
  ///\return PlaceT* may be nullptr if the ID was not found
  ///
  [[nodiscard]] PlaceT *findPlace(const IDT &id) noexcept(true) {
    return findByID(this->places_, id);
  }

  [[nodiscard]] const PlaceT *findPlace(const IDT &id) const noexcept(true) {
    return findByID(this->places_, id);
  }

  ///
  ///\brief find a Transition with the given ID
  ///
  ///\param id the ID
  ///\return TransitionT* may be nullptr if the ID was not found
  ///
  [[nodiscard]] TransitionT *findTransition(const IDT &id) noexcept(true) {
    return findByID(this->transitions_, id);
  }

  [[nodiscard]] const TransitionT *findTransition(const IDT &id) const noexcept(true) {
    return findByID(this->transitions_, id);
  }

  ///
  ///\brief get the Place with the given ID
  ///
  ///\throws UnknownPlace if the ID was not found
  ///
  PlaceT &place(const IDT &id) noexcept(false) {
    auto *ptr = this->findPlace(id);
    if (ptr == nullptr) {
      throw UnknownPlace(id);
    }
    return *ptr;
  }

  const PlaceT &place(const IDT &id) const noexcept(false) {
    const auto *ptr = this->findPlace(id);
    if (ptr == nullptr) {
      throw UnknownPlace(id);
    }
    return *ptr;
  }

  ///
  ///\brief get the Transition with the given ID
  ///
  ///\throws UnknownTransition if the ID was not found
  ///
  TransitionT &transition(const IDT &id) noexcept(false) {
    auto *ptr = this->findTransition(id);
    if (ptr == nullptr) {
      throw UnknownTransition(id);
    }
    return *ptr;
  }

  const TransitionT &transition(const IDT &id) const noexcept(false) {
    const auto *ptr = this->findTransition(id);
    if (ptr == nullptr) {
      throw UnknownTransition(id);
    }
    return *ptr;
  }

  [[nodiscard]] const std::deque<PlaceT> &getPlaces() const noexcept(true) {
    return this->places_;
  }

  [[nodiscard]] const std::deque<TransitionT> &getTransitions() const noexcept(true) {
    return this->transitions_;
  }

  ///
  ///\brief Add a new Place
  ///
  ///\param place the Place, possibly holding an initial marking
  ///\return PlaceT& the stored Place
  ///\throws std::invalid_argument if the ID already exists
  ///
  PlaceT &addPlace(PlaceT place) noexcept(false) {
    // Do not allow duplicate IDs
    if (this->findPlace(place.getID()) != nullptr) {
      throw std::invalid_argument("PlaceID already exists");
    }
    this->places_.push_back(std::move(place));
    return this->places_.back();
  }

  ///
  ///\brief Add a new empty Place
  ///
  ///\param id the Place's ID
  ///\param capacity the maximum number of tokens, unbounded if unset
  ///\throws std::invalid_argument if the ID already exists
  ///
  PlaceT &addPlace(const IDT &id, std::optional<std::size_t> capacity = std::nullopt) noexcept(
      false) {
    return this->addPlace(PlaceT(id, capacity));
  }

  ///
  ///\brief Add a new Transition
  ///
  ///\param sketch the transition blueprint
  ///\return TransitionT& the stored Transition
  ///\throws std::invalid_argument if the ID already exists, any referenced Place ID is
  /// non-existent, an input Place is listed twice or an output rule is empty
  ///
  TransitionT &addTransition(TransitionSketch sketch) noexcept(false) {
    // Do not allow duplicate IDs
    if (this->findTransition(sketch.id) != nullptr) {
      throw std::invalid_argument("TransitionID already exists");
    }

    std::set<IDT> seen;
    for (const auto &input : sketch.ingoing) {
      if (this->findPlace(input.place) == nullptr) {
        throw std::invalid_argument("Sketch contains invalid IDs");
      }
      if (!seen.insert(input.place).second) {
        throw std::invalid_argument("Sketch lists an input place twice");
      }
    }

    for (const auto &[pid, rule] : sketch.outgoing) {
      if (this->findPlace(pid) == nullptr) {
        throw std::invalid_argument("Sketch contains invalid IDs");
      }
      const auto *fixed_rule = std::get_if<FixedOutput<TokenT>>(&rule);
      const auto *computed_rule = std::get_if<ComputedOutput<TokenT>>(&rule);
      if ((fixed_rule != nullptr && fixed_rule->make == nullptr) ||
          (computed_rule != nullptr && computed_rule->produce == nullptr)) {
        throw std::invalid_argument("Sketch contains an empty output rule");
      }
    }

    this->transitions_.push_back(TransitionT(sketch.id, std::move(sketch.ingoing),
                                             std::move(sketch.outgoing), std::move(sketch.guard),
                                             std::move(sketch.description)));
    return this->transitions_.back();
  }

  ///
  ///\brief Seed tokens onto a Place (initial marking)
  ///
  ///\throws UnknownPlace if the ID was not found
  ///\throws CapacityExceeded if the tokens do not fit
  ///
  void addTokens(const IDT &place_id, std::vector<TokenT> tokens) noexcept(false) {
    this->place(place_id).addTokens(std::move(tokens));
  }

  ///
  ///\brief Check if a Transition is enabled (counts only, no guard)
  ///
  ///\throws UnknownTransition if the ID was not found
  ///
  [[nodiscard]] bool isEnabled(const IDT &id) const noexcept(false) {
    return this->transition(id).isEnabled(*this);
  }

  ///
  ///\brief Get the IDs of all enabled Transitions in declaration order
  ///
  [[nodiscard]] std::vector<IDT> getEnabledTransitions() const {
    std::vector<IDT> enabled;
    for (const auto &transition : this->transitions_) {
      if (transition.isEnabled(*this)) {
        enabled.push_back(transition.getID());
      }
    }
    return enabled;
  }

  ///
  ///\brief Try to fire one Transition
  ///
  ///\param id the Transition ID
  ///\return ResultT fired or the rejection reason
  ///\throws UnknownTransition if the ID was not found
  ///\throws CapacityExceeded if the outputs do not fit
  ///
  ResultT stepFire(const IDT &id) noexcept(false) {
    auto result = this->transition(id).fire(*this);
    if (result) {
      this->logger_->debug("Fired {}", id);
    } else {
      this->logger_->debug("Transition {} rejected: {}", id, result.reason);
    }
    return result;
  }

  ///
  ///\brief Fire up to steps transitions chosen by a policy
  ///
  /// Every iteration recomputes the enabled set, picks one Transition,
  /// tries to fire it and advances the clock by one tick whether or not the
  /// firing succeeded. The run halts early when nothing is enabled.
  ///
  ///\param steps the maximum number of iterations
  ///\param options policy, priority list and verbosity
  ///\return RunReport
  ///
  RunReport autoRun(std::size_t steps, const RunOptions &options = RunOptions{}) noexcept(false) {
    RunReport report;
    const auto level = options.verbose ? spdlog::level::info : spdlog::level::debug;

    for (std::size_t step = 0; step < steps; ++step) {
      auto enabled = this->getEnabledTransitions();
      if (enabled.empty()) {
        report.deadlocked = true;
        this->logger_->log(level, "[time {}] No enabled transitions. Halting at step {}.",
                           this->clock_, step);
        break;
      }

      const IDT chosen = this->choose(enabled, options);
      auto result = this->transition(chosen).fire(*this);
      if (result) {
        ++report.fired;
        this->logger_->log(level, "[step {}] Fired {}.", step, chosen);
      } else {
        ++report.rejected;
        this->logger_->log(level, "[step {}] Failed attempt to fire {}: {}", step, chosen,
                           result.reason);
      }

      this->advanceClock(1.0);
      ++report.steps;
    }

    return report;
  }

  ///
  ///\brief Advance the logical clock and age every resident token
  ///
  ///\param dt elapsed time
  ///\throws std::invalid_argument if dt is negative
  ///
  void advanceClock(double dt) noexcept(false) {
    if (dt < 0.0) {
      throw std::invalid_argument("Clock cannot go backwards");
    }
    this->clock_ += dt;
    for (auto &place : this->places_) {
      place.age(dt);
    }
  }

  [[nodiscard]] double getClock() const noexcept(true) { return this->clock_; }

  ///
  ///\brief Get the token count of every Place
  ///
  [[nodiscard]] SnapshotT statusSnapshot() const {
    SnapshotT snapshot;
    for (const auto &place : this->places_) {
      snapshot[place.getID()] = place.count();
    }
    return snapshot;
  }

  ///
  ///\brief Print token counts grouped by type for every Place
  ///
  void printStatus(std::ostream &os = std::cout) const {
    os << "=== Petri Net Status (grouped) ===\n";
    for (const auto &place : this->places_) {
      std::vector<std::pair<std::string, std::size_t>> counts;
      for (const auto &token : place.getTokens()) {
        auto it = std::find_if(begin(counts), end(counts),
                               [&](const auto &entry) { return entry.first == token.type; });
        if (it == end(counts)) {
          counts.emplace_back(token.type, 1);
        } else {
          ++it->second;
        }
      }

      // formatted apart so the caller's stream flags stay untouched
      std::ostringstream line;
      line << std::left << std::setw(20) << place.getID() << ": ";
      for (std::size_t i = 0; i < counts.size(); ++i) {
        line << (i > 0 ? ", " : "") << counts[i].first << ":" << counts[i].second;
      }
      os << line.str() << "\n";
    }
  }

  ///
  ///\brief Allocate the next batch id of this net
  ///
  ///\return std::string zero-padded counter, e.g. "0001"
  ///
  std::string nextBatchID() {
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(this->batch_id_width_)) << std::setfill('0')
        << ++this->batch_counter_;
    return oss.str();
  }

  ///
  ///\brief Get the statistics counters ("fired::<id>" and counters of output rules)
  ///
  [[nodiscard]] const std::map<std::string, std::uint64_t> &getStats() const noexcept(true) {
    return this->stats_;
  }

  [[nodiscard]] std::uint64_t getStat(const std::string &key) const {
    auto it = this->stats_.find(key);
    return it != this->stats_.end() ? it->second : 0;
  }

  ///
  ///\brief Reseed the random generator
  ///
  /// Two nets with the same structure, marking and seed make the same random choices.
  ///
  void seed(std::uint32_t value) { this->rng_.seed(value); }

  [[nodiscard]] const std::shared_ptr<spdlog::logger> &getLogger() const noexcept(true) {
    return this->logger_;
  }
};

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_PETRI_NET_HPP_
