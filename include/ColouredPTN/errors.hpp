// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the exceptions thrown by the net

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_ERRORS_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_ERRORS_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cptn {

///
///\brief Thrown when adding tokens would exceed a Place's capacity
///
class CapacityExceeded : public std::runtime_error {
  std::string place_id_;
  std::size_t capacity_;

public:
  CapacityExceeded(const std::string &place_id, std::size_t capacity)
      : std::runtime_error("Place " + place_id + " capacity exceeded (capacity " +
                           std::to_string(capacity) + ")"),
        place_id_(place_id),
        capacity_(capacity) {}

  [[nodiscard]] const std::string &getPlaceID() const noexcept(true) { return this->place_id_; }
  [[nodiscard]] std::size_t getCapacity() const noexcept(true) { return this->capacity_; }
};

///
///\brief Thrown when removing a token that is not on the Place
///
/// A transition only ever removes tokens it selected from the same place in
/// the same firing, so this always indicates a broken contract.
///
class TokenNotFound : public std::logic_error {
  std::string place_id_;
  std::string batch_id_;

public:
  TokenNotFound(const std::string &place_id, const std::string &batch_id)
      : std::logic_error("Token " + batch_id + " not found on place " + place_id),
        place_id_(place_id),
        batch_id_(batch_id) {}

  [[nodiscard]] const std::string &getPlaceID() const noexcept(true) { return this->place_id_; }
  [[nodiscard]] const std::string &getBatchID() const noexcept(true) { return this->batch_id_; }
};

///
///\brief Thrown on lookups of an unregistered Place ID
///
class UnknownPlace : public std::invalid_argument {
  std::string id_;

public:
  explicit UnknownPlace(const std::string &id)
      : std::invalid_argument("Unknown place: " + id), id_(id) {}

  [[nodiscard]] const std::string &getID() const noexcept(true) { return this->id_; }
};

///
///\brief Thrown on lookups of an unregistered Transition ID
///
class UnknownTransition : public std::invalid_argument {
  std::string id_;

public:
  explicit UnknownTransition(const std::string &id)
      : std::invalid_argument("Unknown transition: " + id), id_(id) {}

  [[nodiscard]] const std::string &getID() const noexcept(true) { return this->id_; }
};

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_ERRORS_HPP_
