// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//
// This file contains the ColouredToken class

#ifndef COLOUREDPTN_INCLUDE_COLOUREDPTN_TOKEN_HPP_
#define COLOUREDPTN_INCLUDE_COLOUREDPTN_TOKEN_HPP_

#include <atomic>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cptn {

///
///\brief A typed unit of material flowing through the net
///
/// Tokens are values. A Place owns copies of its tokens, so moving a token
/// between places is always remove + add, never aliasing.
///
struct ColouredToken {
  ///\brief category tag, e.g. "CO", "Ni_pure"
  std::string type;

  ///\brief identity of this token
  std::string batch_id;

  ///\brief quantity (non-negative)
  double mass = 1.0;

  ///\brief temperature in C, if known
  std::optional<double> temperature;

  ///\brief purity fraction in [0,1], if known
  std::optional<double> purity;

  ///\brief time spent in the process
  double age = 0.0;

  ///
  ///\brief Construct a new ColouredToken
  ///
  ///\param type the category tag
  ///\param batch_id the identity, generated if empty
  ///\param mass the quantity
  ///\param temperature optional temperature
  ///\param purity optional purity
  ///
  ///\throws std::invalid_argument if mass is negative or NaN, or purity is NaN or outside [0,1]
  ///
  explicit ColouredToken(std::string type, std::string batch_id = {}, double mass = 1.0,
                         std::optional<double> temperature = std::nullopt,
                         std::optional<double> purity = std::nullopt) noexcept(false)
      : type(std::move(type)),
        batch_id(std::move(batch_id)),
        mass(mass),
        temperature(temperature),
        purity(purity) {
    if (std::isnan(this->mass) || this->mass < 0.0) {
      throw std::invalid_argument("Token mass must be a non-negative number");
    }
    if (this->purity &&
        (std::isnan(*this->purity) || *this->purity < 0.0 || *this->purity > 1.0)) {
      throw std::invalid_argument("Token purity must be a number within [0,1]");
    }
    if (this->batch_id.empty()) {
      this->batch_id = generateBatchID();
    }
  }

  ///
  ///\brief Build a new token of another type from this one
  ///
  /// mass, temperature and purity are carried over, age starts at zero.
  ///
  ///\param new_type the type of the derived token
  ///\param new_batch_id the identity of the derived token (generated if empty)
  ///\return ColouredToken
  ///
  [[nodiscard]] ColouredToken derive(std::string new_type, std::string new_batch_id = {}) const {
    return ColouredToken(std::move(new_type), std::move(new_batch_id), this->mass,
                         this->temperature, this->purity);
  }

  ///
  ///\brief Generate a process-wide unique batch id
  ///
  ///\return std::string of the form "tok-00000001"
  ///
  static std::string generateBatchID() {
    static std::atomic<std::uint64_t> counter{0};
    std::ostringstream oss;
    oss << "tok-" << std::setw(8) << std::setfill('0') << ++counter;
    return oss.str();
  }
};

inline std::ostream &operator<<(std::ostream &os, const ColouredToken &token) {
  os << token.type << "[" << token.batch_id << "|pur=";
  if (token.purity) {
    os << *token.purity;
  } else {
    os << "None";
  }
  os << "|T=";
  if (token.temperature) {
    os << *token.temperature;
  } else {
    os << "None";
  }
  return os << "]";
}

}  // namespace cptn

#endif  // COLOUREDPTN_INCLUDE_COLOUREDPTN_TOKEN_HPP_
