// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the bounded reachability search

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_REACHABILITY_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_REACHABILITY_HPP_

#include <cstddef>
#include <functional>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "petri_net.hpp"

namespace cptn {

using GoalT = std::function<bool(const Snapshot &)>;
using SequenceT = std::vector<std::string>;

///
///\brief Counters of one findSequenceBFS() call
///
struct SearchStats {
  ///\brief states dequeued and checked against the goal
  std::size_t visited = 0;

  ///\brief states produced by a successful firing
  std::size_t generated = 0;

  ///\brief firings dropped because an output Place would overflow
  std::size_t pruned = 0;
};

///
///\brief Breadth-first search for a firing sequence reaching goal
///
/// Every state is an independent deep copy of net, the given net is never
/// changed. The first sequence found has minimal length. Every enabled
/// Transition is branched on at every level, so the cost grows
/// combinatorially with depth: use it on small nets only.
///
///\param net the initial state
///\param goal predicate over statusSnapshot()
///\param max_depth the maximum sequence length
///\param stats optional counters
///\return std::optional<SequenceT> the Transition IDs, std::nullopt if none was found
///
template <typename Token>
std::optional<SequenceT> findSequenceBFS(const PetriNet<Token> &net, const GoalT &goal,
                                         std::size_t max_depth = 8,
                                         SearchStats *stats = nullptr) {
  SearchStats local;
  SearchStats &counters = stats != nullptr ? *stats : local;
  counters = SearchStats{};

  std::queue<std::pair<PetriNet<Token>, SequenceT>> queue;
  queue.emplace(net, SequenceT{});

  while (!queue.empty()) {
    auto [current, sequence] = std::move(queue.front());
    queue.pop();
    ++counters.visited;

    if (goal(current.statusSnapshot())) {
      net.getLogger()->debug("BFS found a sequence of length {} after {} states",
                             sequence.size(), counters.visited);
      return sequence;
    }
    if (sequence.size() >= max_depth) {
      continue;
    }

    for (const auto &id : current.getEnabledTransitions()) {
      PetriNet<Token> next = current;
      try {
        if (!next.transition(id).fire(next)) {
          continue;
        }
      } catch (const CapacityExceeded &e) {
        ++counters.pruned;
        net.getLogger()->debug("BFS pruned {}: {}", id, e.what());
        continue;
      }

      ++counters.generated;
      SequenceT extended = sequence;
      extended.push_back(id);
      queue.emplace(std::move(next), std::move(extended));
    }
  }

  net.getLogger()->debug("BFS found no sequence within depth {} ({} states)", max_depth,
                         counters.visited);
  return std::nullopt;
}

///
///\brief Fire a sequence on a copy of net
///
///\param net the initial state
///\param sequence the Transition IDs to fire in order
///\return PetriNet<Token> the final state
///\throws std::runtime_error if a firing is rejected
///\throws UnknownTransition if an ID was not found
///
template <typename Token>
PetriNet<Token> replaySequence(const PetriNet<Token> &net, const SequenceT &sequence) {
  PetriNet<Token> copy = net;
  for (const auto &id : sequence) {
    auto result = copy.stepFire(id);
    if (!result) {
      throw std::runtime_error("Replay of " + id + " rejected: " + result.reason);
    }
  }
  return copy;
}

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_REACHABILITY_HPP_
