// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the Transition class

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_TRANSITION_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_TRANSITION_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "firing.hpp"
#include "place.hpp"

namespace cptn {

///
///\brief One input arc of a Transition
///
template <typename Token> struct TransitionInput {
  ///\brief the input Place ID
  std::string place;

  ///\brief the number of tokens consumed
  std::size_t weight = 1;

  ///\brief optional condition the consumed tokens must satisfy
  typename Place<Token>::PredicateT select;
};

///
///\brief Class representing a coloured PTN Transition
///
/// Objects of this class shall not be instanciated directly, \see cptn::PetriNet
///
///\tparam Token the token type
///
template <typename Token = ColouredToken> class Transition {
  template <typename A> friend class PetriNet;

public:
  using IDT = std::string;
  using TokenT = Token;
  using PlaceT = Place<TokenT>;
  using NetT = PetriNet<TokenT>;
  using InputT = TransitionInput<TokenT>;
  using OutputRuleT = OutputRule<TokenT>;
  using OutputPairT = std::pair<IDT, OutputRuleT>;
  using SelectionT = SelectionMap<TokenT>;
  using ResultT = FiringResult<TokenT>;
  using ContextT = FiringContext<TokenT>;
  using PositionsT = std::map<IDT, std::vector<std::size_t>>;

  ///
  ///\brief Guard predicate over a read-only net and the selected tokens
  ///
  using GuardT = std::function<bool(const NetT &, const SelectionT &)>;

private:
  IDT id_;
  std::vector<InputT> ingoing_;
  std::vector<OutputPairT> outgoing_;
  GuardT guard_;
  std::string description_;
  std::uint64_t fired_count_ = 0;

  ///
  ///\brief Construct a new Transition
  ///
  ///\param id the Transition ID
  ///\param ingoing the input arcs
  ///\param outgoing the output Places with their rules
  ///\param guard the guard (may be empty)
  ///\param description free text
  ///
  Transition(const IDT &id, std::vector<InputT> ingoing, std::vector<OutputPairT> outgoing,
             GuardT guard, std::string description)
      : id_(id),
        ingoing_(std::move(ingoing)),
        outgoing_(std::move(outgoing)),
        guard_(std::move(guard)),
        description_(std::move(description)) {}

  ///
  ///\brief Select the first weight matching tokens of every input Place
  ///
  ///\param net the net owning this Transition
  ///\param positions receives the index of every selected token in its Place
  ///\return std::optional<SelectionT> empty if any input cannot be satisfied
  ///
  std::optional<SelectionT> selectTokens(const NetT &net, PositionsT &positions) const {
    SelectionT selected;
    for (const auto &input : this->ingoing_) {
      auto selection = net.place(input.place).findTokens(input.select, input.weight);
      std::vector<TokenT> tokens;
      std::vector<std::size_t> at;
      for (auto it = selection.begin(); it != selection.end(); ++it) {
        tokens.push_back(*it);
        at.push_back(it.position());
      }
      if (tokens.size() < input.weight) {
        return std::nullopt;
      }
      selected[input.place] = std::move(tokens);
      positions[input.place] = std::move(at);
    }
    return selected;
  }

  ///
  ///\brief Run every output rule into the context buffer
  ///
  void produce(const SelectionT &selected, ContextT &ctx) const {
    for (const auto &[place_id, rule] : this->outgoing_) {
      if (const auto *fixed_rule = std::get_if<FixedOutput<TokenT>>(&rule)) {
        std::vector<TokenT> made;
        made.reserve(fixed_rule->weight);
        for (std::size_t i = 0; i < fixed_rule->weight; ++i) {
          made.push_back(fixed_rule->make(ctx));
        }
        ctx.emit(place_id, std::move(made));
      } else {
        ctx.emit(place_id, std::get<ComputedOutput<TokenT>>(rule).produce(selected, ctx));
      }
    }
  }

public:
  ///
  ///\brief Check if every input Place holds enough tokens
  ///
  /// The guard is not evaluated, an enabled Transition may still be
  /// rejected by fire().
  ///
  ///\return true enabled
  ///\return false not enabled
  ///
  [[nodiscard]] bool isEnabled(const NetT &net) const noexcept(false) {
    for (const auto &input : this->ingoing_) {
      if (net.place(input.place).count() < input.weight) {
        return false;
      }
    }
    return true;
  }

  ///
  ///\brief Evaluate the guard against a selection
  ///
  ///\return true if there is no guard or the guard accepts
  ///
  [[nodiscard]] bool evaluateGuard(const NetT &net, const SelectionT &selected) const {
    return this->guard_ == nullptr || this->guard_(net, selected);
  }

  ///
  ///\brief Try to fire this Transition on net
  ///
  /// Counts are checked, tokens selected and the guard evaluated before
  /// anything is changed. On success the selection is consumed and the
  /// outputs are committed at once.
  ///
  ///\param net the net owning this Transition
  ///\return ResultT fired or the rejection reason
  ///\throws std::invalid_argument if net does not own this Transition
  ///\throws CapacityExceeded if the outputs do not fit, the net is unchanged then
  ///
  ResultT fire(NetT &net) noexcept(false) {
    if (net.findTransition(this->id_) != this) {
      throw std::invalid_argument("Transition " + this->id_ + " does not belong to this net");
    }

    if (!this->isEnabled(net)) {
      return ResultT::rejected(Rejection::k_insufficient_tokens);
    }

    PositionsT positions;
    auto selected = this->selectTokens(net, positions);
    if (!selected) {
      return ResultT::rejected(Rejection::k_selection_failed);
    }

    if (!this->evaluateGuard(net, *selected)) {
      return ResultT::rejected(Rejection::k_guard_blocked);
    }

    ContextT ctx(net);
    this->produce(*selected, ctx);
    net.commitFiring(*this, positions, ctx);

    ResultT result;
    result.fired = true;
    result.selected = std::move(*selected);
    return result;
  }

  ///
  ///\brief get the Transition's ID
  ///
  ///\return const IDT&
  ///
  [[nodiscard]] const IDT &getID() const noexcept(true) { return this->id_; }

  [[nodiscard]] const std::string &getDescription() const noexcept(true) {
    return this->description_;
  }

  [[nodiscard]] std::uint64_t getFiredCount() const noexcept(true) { return this->fired_count_; }

  [[nodiscard]] const std::vector<InputT> &getIngoing() const noexcept(true) {
    return this->ingoing_;
  }

  [[nodiscard]] const std::vector<OutputPairT> &getOutgoing() const noexcept(true) {
    return this->outgoing_;
  }

  [[nodiscard]] bool hasGuard() const noexcept(true) { return this->guard_ != nullptr; }
};

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_TRANSITION_HPP_
