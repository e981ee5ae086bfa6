// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the firing results, the firing context and the output rules

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_FIRING_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_FIRING_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "token.hpp"

namespace cptn {

template <typename Token> class PetriNet;
template <typename Token> class Transition;

///
///\brief The tokens selected for one firing, keyed by input Place ID
///
template <typename Token> using SelectionMap = std::map<std::string, std::vector<Token>>;

///
///\brief Why a firing attempt was rejected
///
enum class Rejection { k_none, k_insufficient_tokens, k_selection_failed, k_guard_blocked };

inline const char *toString(Rejection rejection) noexcept(true) {
  switch (rejection) {
    case Rejection::k_insufficient_tokens:
      return "insufficient tokens";
    case Rejection::k_selection_failed:
      return "selection failed";
    case Rejection::k_guard_blocked:
      return "guard blocked";
    case Rejection::k_none:
      break;
  }
  return "";
}

///
///\brief Outcome of one firing attempt
///
/// Rejections are ordinary results, the net is untouched when fired is false.
///
template <typename Token> struct FiringResult {
  bool fired = false;
  Rejection rejection = Rejection::k_none;
  std::string reason;

  ///\brief the consumed tokens (empty when rejected)
  SelectionMap<Token> selected;

  static FiringResult rejected(Rejection why) {
    FiringResult result;
    result.rejection = why;
    result.reason = toString(why);
    return result;
  }

  explicit operator bool() const noexcept(true) { return this->fired; }
};

///
///\brief Handed to output rules while a transition fires
///
/// Everything emitted here is buffered and only committed to the net once
/// the whole firing is known to fit, so callers never observe a
/// half-applied firing.
///
template <typename Token> class FiringContext {
  template <typename A> friend class PetriNet;
  template <typename A> friend class Transition;

public:
  using ProducedT = std::vector<std::pair<std::string, std::vector<Token>>>;

private:
  PetriNet<Token> &net_;
  ProducedT produced_;
  std::map<std::string, std::uint64_t> counters_;

  explicit FiringContext(PetriNet<Token> &net) : net_(net) {}

public:
  ///
  ///\brief Read-only access to the net (inputs are not removed yet)
  ///
  [[nodiscard]] const PetriNet<Token> &net() const noexcept(true) { return this->net_; }

  ///
  ///\brief Allocate the next batch id of the net
  ///
  std::string nextBatchID() { return this->net_.nextBatchID(); }

  ///
  ///\brief Draw from the net's random generator
  ///
  ///\return double uniformly distributed in [0,1)
  ///
  double uniform() { return std::uniform_real_distribution<double>(0.0, 1.0)(this->net_.rng_); }

  ///
  ///\brief Put a token onto any Place of the net
  ///
  void emit(const std::string &place_id, Token token) {
    std::vector<Token> tokens;
    tokens.push_back(std::move(token));
    this->emit(place_id, std::move(tokens));
  }

  void emit(const std::string &place_id, std::vector<Token> tokens) {
    if (!tokens.empty()) {
      this->produced_.emplace_back(place_id, std::move(tokens));
    }
  }

  ///
  ///\brief Increment a statistics counter of the net
  ///
  void count(const std::string &key, std::uint64_t n = 1) { this->counters_[key] += n; }

  [[nodiscard]] const ProducedT &getProduced() const noexcept(true) { return this->produced_; }
};

///
///\brief Output rule producing weight tokens from a declared factory
///
template <typename Token> struct FixedOutput {
  using MakeT = std::function<Token(FiringContext<Token> &)>;

  std::size_t weight = 1;
  MakeT make;
};

///
///\brief Output rule computing tokens from the consumed ones
///
/// The returned tokens go to the declared output Place. A rule may instead
/// emit() into other places itself and return nothing.
///
template <typename Token> struct ComputedOutput {
  using ProduceT =
      std::function<std::vector<Token>(const SelectionMap<Token> &, FiringContext<Token> &)>;

  ProduceT produce;
};

template <typename Token> using OutputRule = std::variant<FixedOutput<Token>, ComputedOutput<Token>>;

///
///\brief Produce weight tokens from make on every firing
///
template <typename Token = ColouredToken>
FixedOutput<Token> fixed(std::size_t weight, typename FixedOutput<Token>::MakeT make) {
  return FixedOutput<Token>{weight, std::move(make)};
}

///
///\brief Produce weight fresh tokens of a declared type
///
/// Batch ids are prefix + PetriNet::nextBatchID().
///
inline FixedOutput<ColouredToken> typed(std::size_t weight, std::string type,
                                        std::string prefix = "B-", double mass = 1.0) {
  return FixedOutput<ColouredToken>{
      weight, [type = std::move(type), prefix = std::move(prefix),
               mass](FiringContext<ColouredToken> &ctx) {
        return ColouredToken(type, prefix + ctx.nextBatchID(), mass);
      }};
}

template <typename Token = ColouredToken>
ComputedOutput<Token> computed(typename ComputedOutput<Token>::ProduceT produce) {
  return ComputedOutput<Token>{std::move(produce)};
}

///
///\brief Move the consumed tokens unchanged to the declared output Place
///
template <typename Token = ColouredToken> ComputedOutput<Token> transfer() {
  return ComputedOutput<Token>{[](const SelectionMap<Token> &selected, FiringContext<Token> &) {
    std::vector<Token> moved;
    for (const auto &[place_id, tokens] : selected) {
      (void)place_id;
      moved.insert(moved.end(), tokens.begin(), tokens.end());
    }
    return moved;
  }};
}

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_FIRING_HPP_
