// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//

#include "ColouredPTN/reachability.hpp"

#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using Net = cptn::PetriNet<>;
using Token = cptn::ColouredToken;

// P0 -> P1 -> ... -> P5, goal place is P5
static Net makeChain() {
  Net net;
  for (int i = 0; i <= 5; ++i) {
    net.addPlace("P" + std::to_string(i));
  }
  net.addTokens("P0", {Token("x", "x0")});
  for (int i = 0; i < 5; ++i) {
    net.addTransition({"T" + std::to_string(i + 1),
                       {{"P" + std::to_string(i), 1}},
                       {{"P" + std::to_string(i + 1), cptn::transfer()}}});
  }
  return net;
}

static bool reachedX(const cptn::Snapshot &snapshot) { return snapshot.at("P5") >= 1; }

TEST_CASE("cptn::findSequenceBFS depth bound", "[CPTN][Reachability]") {
  GIVEN("A goal reachable at depth 5") {
    const Net net = makeChain();

    WHEN("searching with max_depth 3") {
      THEN("no sequence is found") { REQUIRE_FALSE(cptn::findSequenceBFS(net, reachedX, 3)); }
    }

    WHEN("searching with max_depth 6") {
      cptn::SearchStats stats;
      auto sequence = cptn::findSequenceBFS(net, reachedX, 6, &stats);

      THEN("the 5-step sequence is returned") {
        REQUIRE(sequence.has_value());
        REQUIRE(*sequence == cptn::SequenceT{"T1", "T2", "T3", "T4", "T5"});
        REQUIRE(stats.visited == 6);
        REQUIRE(stats.generated == 5);
        REQUIRE(stats.pruned == 0);
      }
      THEN("replaying it reaches the goal") {
        auto final_state = cptn::replaySequence(net, *sequence);
        REQUIRE(reachedX(final_state.statusSnapshot()));
      }
      THEN("the searched net is unchanged") {
        REQUIRE(net.place("P0").count() == 1);
        REQUIRE(net.place("P5").count() == 0);
        REQUIRE(net.transition("T1").getFiredCount() == 0);
      }
    }

    WHEN("the goal already holds") {
      auto sequence = cptn::findSequenceBFS(
          net, [](const cptn::Snapshot &snapshot) { return snapshot.at("P0") == 1; }, 0);
      THEN("the empty sequence is returned") {
        REQUIRE(sequence.has_value());
        REQUIRE(sequence->empty());
      }
    }
  }
}

TEST_CASE("cptn::findSequenceBFS minimal length", "[CPTN][Reachability]") {
  GIVEN("A long and a short route to the goal") {
    Net net = makeChain();
    net.addTransition({"shortcut", {{"P1", 1}}, {{"P5", cptn::transfer()}}});

    THEN("the shortest sequence is found") {
      auto sequence = cptn::findSequenceBFS(net, reachedX, 8);
      REQUIRE(sequence.has_value());
      REQUIRE(*sequence == cptn::SequenceT{"T1", "shortcut"});
    }
  }
}

TEST_CASE("cptn::findSequenceBFS guards and capacities", "[CPTN][Reachability]") {
  GIVEN("A guarded route and an overflowing route") {
    Net net;
    net.addPlace("src");
    net.addPlace("full", 1);
    net.addPlace("goal");
    net.addTokens("src", {Token("A", "a0")});
    net.addTokens("full", {Token("F", "f0")});
    net.addTransition({"overflow", {{"src", 1}}, {{"full", cptn::transfer()}}});
    net.addTransition({"blocked",
                       {{"src", 1}},
                       {{"goal", cptn::transfer()}},
                       [](const Net &, const Net::SelectionT &) { return false; }});

    WHEN("searching for the goal") {
      cptn::SearchStats stats;
      auto sequence = cptn::findSequenceBFS(
          net, [](const cptn::Snapshot &snapshot) { return snapshot.at("goal") >= 1; }, 4,
          &stats);

      THEN("no sequence exists and the overflow branch was pruned") {
        REQUIRE_FALSE(sequence.has_value());
        REQUIRE(stats.pruned == 1);
        REQUIRE(stats.generated == 0);
        REQUIRE(stats.visited == 1);
      }
    }
  }
}

TEST_CASE("cptn::replaySequence", "[CPTN][Reachability]") {
  GIVEN("A chain") {
    const Net net = makeChain();

    THEN("a sequence that is not fireable throws") {
      REQUIRE_THROWS_AS(cptn::replaySequence(net, {"T2"}), std::runtime_error);
      REQUIRE_THROWS_AS(cptn::replaySequence(net, {"nope"}), cptn::UnknownTransition);
    }
  }
}
