// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the run and net options

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_CONFIG_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_CONFIG_HPP_

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cptn {

///
///\brief How autoRun() picks one transition out of the enabled set
///
enum class Policy {
  k_random,     ///< uniform choice
  k_prioritise  ///< first enabled ID of RunOptions::priority, random otherwise
};

///
///\brief Parse a policy name ("random" or "prioritise")
///
///\throws std::invalid_argument on any other name
///
inline Policy parsePolicy(const std::string &name) noexcept(false) {
  if (name == "random") {
    return Policy::k_random;
  }
  if (name == "prioritise") {
    return Policy::k_prioritise;
  }
  throw std::invalid_argument("Unknown policy: " + name);
}

inline std::string toString(Policy policy) {
  return policy == Policy::k_prioritise ? "prioritise" : "random";
}

///
///\brief Options of PetriNet::autoRun()
///
struct RunOptions {
  ///\brief the selection policy
  Policy policy = Policy::k_random;

  ///\brief transition IDs in descending priority (k_prioritise only)
  std::vector<std::string> priority;

  ///\brief log every step at info level instead of debug
  bool verbose = false;
};

///
///\brief Options of a PetriNet
///
struct NetOptions {
  ///\brief seed of the net's random generator (random policy, output rules)
  std::uint32_t seed = 5489u;

  ///\brief number of digits nextBatchID() pads to
  unsigned batch_id_width = 4;

  ///\brief the logger, nullptr selects cptn::log::get()
  std::shared_ptr<spdlog::logger> logger;
};

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_CONFIG_HPP_
