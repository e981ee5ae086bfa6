// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the Place class

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_PLACE_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_PLACE_HPP_

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "token.hpp"

namespace cptn {

template <typename Token> class PetriNet;

///
///\brief Class representing a coloured PTN Place
///
/// A Place owns its tokens. Token order is the insertion order and only
/// matters for deterministic first-match selection.
///
///\tparam Token the token type (must provide the public members type, batch_id, mass and age)
///
template <typename Token = ColouredToken> class Place final {
  template <typename A> friend class PetriNet;

public:
  using IDT = std::string;
  using TokenT = Token;
  using PredicateT = std::function<bool(const TokenT &)>;

  ///
  ///\brief Lazy first-match view over the tokens of a Place
  ///
  /// Nothing is evaluated until iteration, and begin() may be called again
  /// to restart. The view and its iterators are invalidated by any change to
  /// the Place, iterators may outlive the view itself.
  ///
  class Selection {
    const std::vector<TokenT> *tokens_;
    PredicateT predicate_;
    std::optional<std::size_t> limit_;

  public:
    class const_iterator {
      using BaseIt = typename std::vector<TokenT>::const_iterator;

      const std::vector<TokenT> *tokens_ = nullptr;
      PredicateT predicate_;
      std::optional<std::size_t> limit_;
      BaseIt it_;
      std::size_t yielded_ = 0;

      // Move to the next matching token, or to the end once the limit is hit
      void settle() {
        const auto end = this->tokens_->cend();
        if (this->limit_ && this->yielded_ >= *this->limit_) {
          this->it_ = end;
          return;
        }
        while (this->it_ != end && this->predicate_ != nullptr && !this->predicate_(*this->it_)) {
          ++this->it_;
        }
      }

    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = TokenT;
      using difference_type = std::ptrdiff_t;
      using pointer = const TokenT *;
      using reference = const TokenT &;

      const_iterator() = default;
      const_iterator(const Selection &selection, BaseIt it)
          : tokens_(selection.tokens_),
            predicate_(selection.predicate_),
            limit_(selection.limit_),
            it_(it) {
        this->settle();
      }

      reference operator*() const { return *this->it_; }
      pointer operator->() const { return &*this->it_; }

      ///
      ///\brief Index of the current token within Place::getTokens()
      ///
      [[nodiscard]] std::size_t position() const {
        return static_cast<std::size_t>(this->it_ - this->tokens_->cbegin());
      }

      const_iterator &operator++() {
        ++this->yielded_;
        ++this->it_;
        this->settle();
        return *this;
      }

      const_iterator operator++(int) {
        auto prev = *this;
        ++(*this);
        return prev;
      }

      bool operator==(const const_iterator &other) const { return this->it_ == other.it_; }
      bool operator!=(const const_iterator &other) const { return !(*this == other); }
    };

    Selection(const std::vector<TokenT> &tokens, PredicateT predicate,
              std::optional<std::size_t> limit)
        : tokens_(&tokens), predicate_(std::move(predicate)), limit_(limit) {}

    [[nodiscard]] const_iterator begin() const { return const_iterator(*this, tokens_->cbegin()); }
    [[nodiscard]] const_iterator end() const { return const_iterator(*this, tokens_->cend()); }

    ///
    ///\brief Materialise the selection
    ///
    ///\return std::vector<TokenT> copies of the selected tokens
    ///
    [[nodiscard]] std::vector<TokenT> collect() const {
      return std::vector<TokenT>(this->begin(), this->end());
    }

    [[nodiscard]] std::size_t size() const {
      return static_cast<std::size_t>(std::distance(this->begin(), this->end()));
    }

    [[nodiscard]] bool empty() const { return this->begin() == this->end(); }
  };

private:
  IDT id_;
  std::vector<TokenT> tokens_;
  std::optional<std::size_t> capacity_;

  ///
  ///\brief Age every resident token
  ///
  ///\param dt elapsed time (non-negative)
  ///
  void age(double dt) noexcept(true) {
    for (auto &token : this->tokens_) {
      token.age += dt;
    }
  }

  ///
  ///\brief Throw if n more tokens would not fit
  ///
  void checkCapacity(std::size_t n) const noexcept(false) {
    if (this->capacity_ && this->tokens_.size() + n > *this->capacity_) {
      throw CapacityExceeded(this->id_, *this->capacity_);
    }
  }

  ///
  ///\brief Remove the tokens at the given positions
  ///
  /// Positions index getTokens() as it is now, duplicates count once.
  ///
  void removeAt(const std::vector<std::size_t> &positions) {
    std::vector<bool> drop(this->tokens_.size(), false);
    for (auto position : positions) {
      drop.at(position) = true;
    }
    std::vector<TokenT> remaining;
    remaining.reserve(this->tokens_.size());
    for (std::size_t i = 0; i < this->tokens_.size(); ++i) {
      if (!drop[i]) {
        remaining.push_back(std::move(this->tokens_[i]));
      }
    }
    this->tokens_ = std::move(remaining);
  }

public:
  ///
  ///\brief Construct a new Place
  ///
  ///\param id the id
  ///\param capacity the maximum number of tokens, unbounded if unset
  ///
  explicit Place(const IDT &id, std::optional<std::size_t> capacity = std::nullopt)
      : id_(id), capacity_(capacity) {}

  ///
  ///\brief Get the Place's ID
  ///
  ///\return const IDT&
  ///
  [[nodiscard]] const IDT &getID() const noexcept(true) { return this->id_; }

  [[nodiscard]] const std::optional<std::size_t> &getCapacity() const noexcept(true) {
    return this->capacity_;
  }

  ///
  ///\brief Get the tokens on this Place, in insertion order
  ///
  [[nodiscard]] const std::vector<TokenT> &getTokens() const noexcept(true) {
    return this->tokens_;
  }

  [[nodiscard]] std::size_t count() const noexcept(true) { return this->tokens_.size(); }

  ///
  ///\brief Count the tokens of one type
  ///
  [[nodiscard]] std::size_t count(const std::string &type) const {
    std::size_t n = 0;
    for (const auto &token : this->tokens_) {
      if (token.type == type) {
        ++n;
      }
    }
    return n;
  }

  ///
  ///\brief Get the summed mass of all tokens
  ///
  [[nodiscard]] double mass() const {
    double total = 0.0;
    for (const auto &token : this->tokens_) {
      total += token.mass;
    }
    return total;
  }

  ///
  ///\brief Get the summed mass of the tokens of one type
  ///
  [[nodiscard]] double mass(const std::string &type) const {
    double total = 0.0;
    for (const auto &token : this->tokens_) {
      if (token.type == type) {
        total += token.mass;
      }
    }
    return total;
  }

  ///
  ///\brief Add a single token
  ///
  ///\throws CapacityExceeded if the Place is full
  ///
  void addTokens(TokenT token) noexcept(false) {
    this->checkCapacity(1);
    this->tokens_.push_back(std::move(token));
  }

  ///
  ///\brief Add a batch of tokens (all or nothing)
  ///
  ///\throws CapacityExceeded if the whole batch does not fit, no token is added then
  ///
  void addTokens(std::vector<TokenT> tokens) noexcept(false) {
    this->checkCapacity(tokens.size());
    this->tokens_.reserve(this->tokens_.size() + tokens.size());
    for (auto &token : tokens) {
      this->tokens_.push_back(std::move(token));
    }
  }

  ///
  ///\brief Remove tokens by identity (batch_id)
  ///
  /// Each given token matches the first resident token with the same
  /// batch_id that was not matched already.
  ///
  ///\param tokens the tokens to remove
  ///\throws TokenNotFound if any token is absent, no token is removed then
  ///
  void removeTokens(const std::vector<TokenT> &tokens) noexcept(false) {
    std::vector<bool> matched(this->tokens_.size(), false);
    for (const auto &token : tokens) {
      bool found = false;
      for (std::size_t i = 0; i < this->tokens_.size(); ++i) {
        if (!matched[i] && this->tokens_[i].batch_id == token.batch_id) {
          matched[i] = true;
          found = true;
          break;
        }
      }
      if (!found) {
        throw TokenNotFound(this->id_, token.batch_id);
      }
    }

    std::vector<TokenT> remaining;
    remaining.reserve(this->tokens_.size() - tokens.size());
    for (std::size_t i = 0; i < this->tokens_.size(); ++i) {
      if (!matched[i]) {
        remaining.push_back(std::move(this->tokens_[i]));
      }
    }
    this->tokens_ = std::move(remaining);
  }

  ///
  ///\brief Select up to limit tokens matching predicate, first match first
  ///
  ///\param predicate the condition (all tokens if empty)
  ///\param limit the maximum number of tokens (unbounded if unset)
  ///\return Selection a lazy view, valid until this Place changes
  ///
  [[nodiscard]] Selection findTokens(PredicateT predicate = nullptr,
                                     std::optional<std::size_t> limit = std::nullopt) const {
    return Selection(this->tokens_, std::move(predicate), limit);
  }

  ///
  ///\brief Remove every token, the capacity is kept
  ///
  void clear() noexcept(true) { this->tokens_.clear(); }
};

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_PLACE_HPP_
