// Copyright Open Logistics Foundation
//
// Licensed under the Open Logistics Foundation License 1.3.
// For details on the licensing terms, see the LICENSE file.
// SPDX-License-Identifier: OLFL-1.3
//

#include "ColouredPTN/place.hpp"

#include <catch2/catch.hpp>
#include <string>
#include <vector>

using Token = cptn::ColouredToken;

static std::vector<Token> makeTokens(const std::string &type, int n, const std::string &prefix) {
  std::vector<Token> tokens;
  for (int i = 0; i < n; ++i) {
    tokens.emplace_back(type, prefix + std::to_string(i));
  }
  return tokens;
}

TEST_CASE("cptn::Place behaviour", "[CPTN][Place]") {
  GIVEN("An unbounded Place and a Place with capacity") {
    cptn::Place<> place("P1");
    cptn::Place<> bounded("P2", 5);

    WHEN("Getters are called") {
      THEN("The return values match") {
        REQUIRE(place.getID() == "P1");
        REQUIRE(place.count() == 0);
        REQUIRE_FALSE(place.getCapacity().has_value());
        REQUIRE(bounded.getID() == "P2");
        REQUIRE(*bounded.getCapacity() == 5);
      }
    }
  }
}

TEST_CASE("cptn::Place addTokens()", "[CPTN][Place]") {
  GIVEN("A capacity-5 Place") {
    cptn::Place<> place("P", 5);

    WHEN("5 tokens are added") {
      place.addTokens(makeTokens("A", 5, "a"));

      THEN("All of them are stored") { REQUIRE(place.count() == 5); }

      WHEN("A 6th token is added") {
        THEN("CapacityExceeded is thrown and the Place still holds 5 tokens") {
          REQUIRE_THROWS_AS(place.addTokens(Token("A", "a5")), cptn::CapacityExceeded);
          REQUIRE(place.count() == 5);
        }
      }
    }

    WHEN("A batch larger than the free space is added") {
      place.addTokens(makeTokens("A", 3, "a"));

      THEN("Nothing of the batch is added") {
        REQUIRE_THROWS_AS(place.addTokens(makeTokens("B", 3, "b")), cptn::CapacityExceeded);
        REQUIRE(place.count() == 3);
        REQUIRE(place.count("B") == 0);
      }
    }
  }
}

TEST_CASE("cptn::Place removeTokens()", "[CPTN][Place]") {
  GIVEN("A Place with three tokens") {
    cptn::Place<> place("P");
    place.addTokens(makeTokens("A", 3, "a"));

    WHEN("Two resident tokens are removed") {
      place.removeTokens({Token("A", "a0"), Token("A", "a2")});

      THEN("Only the third remains") {
        REQUIRE(place.count() == 1);
        REQUIRE(place.getTokens().front().batch_id == "a1");
      }
    }

    WHEN("An absent token is part of the removal") {
      THEN("TokenNotFound is thrown and nothing is removed") {
        REQUIRE_THROWS_AS(place.removeTokens({Token("A", "a0"), Token("A", "zz")}),
                          cptn::TokenNotFound);
        REQUIRE(place.count() == 3);
      }
    }

    WHEN("The same token is removed twice") {
      THEN("The second removal is not found") {
        REQUIRE_THROWS_AS(place.removeTokens({Token("A", "a1"), Token("A", "a1")}),
                          cptn::TokenNotFound);
      }
    }
  }
}

TEST_CASE("cptn::Place findTokens()", "[CPTN][Place]") {
  GIVEN("A Place with mixed token types") {
    cptn::Place<> place("P");
    place.addTokens(Token("A", "a0", 1.0));
    place.addTokens(Token("B", "b0", 2.0));
    place.addTokens(Token("A", "a1", 3.0));
    place.addTokens(Token("A", "a2", 4.0));

    WHEN("Selecting without predicate and limit") {
      THEN("All tokens are returned in place order") {
        auto all = place.findTokens().collect();
        REQUIRE(all.size() == 4);
        REQUIRE(all[1].batch_id == "b0");
      }
    }

    WHEN("Selecting the first two A tokens") {
      auto selection =
          place.findTokens([](const Token &token) { return token.type == "A"; }, 2);

      THEN("The first matches are returned") {
        auto tokens = selection.collect();
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens[0].batch_id == "a0");
        REQUIRE(tokens[1].batch_id == "a1");
      }
      THEN("The selection can be iterated again") {
        REQUIRE(selection.size() == 2);
        REQUIRE(selection.size() == 2);
        REQUIRE(selection.begin()->batch_id == "a0");
      }
    }

    WHEN("The predicate is counted while iterating") {
      int calls = 0;
      auto selection = place.findTokens(
          [&](const Token &) {
            ++calls;
            return true;
          },
          1);

      THEN("Nothing is evaluated before iteration and iteration stops at the limit") {
        REQUIRE(calls == 0);
        auto it = selection.begin();
        REQUIRE(it->batch_id == "a0");
        ++it;
        REQUIRE(it == selection.end());
        REQUIRE(calls == 1);
      }
    }

    WHEN("An iterator is kept after its selection is gone") {
      auto it = place.findTokens([](const Token &token) { return token.type == "A"; }).begin();
      ++it;

      THEN("It still walks the matching tokens and reports their positions") {
        REQUIRE(it->batch_id == "a1");
        REQUIRE(it.position() == 2);
        ++it;
        REQUIRE(it->batch_id == "a2");
        REQUIRE(it.position() == 3);
      }
    }

    WHEN("A limit of zero is used") {
      THEN("The selection is empty") { REQUIRE(place.findTokens(nullptr, 0).empty()); }
    }

    WHEN("Counting") {
      THEN("Counts and masses are filtered by type") {
        REQUIRE(place.count() == 4);
        REQUIRE(place.count("A") == 3);
        REQUIRE(place.count("C") == 0);
        REQUIRE(place.mass() == Approx(10.0));
        REQUIRE(place.mass("A") == Approx(8.0));
      }
    }
  }
}

TEST_CASE("cptn::Place clear()", "[CPTN][Place]") {
  GIVEN("A full capacity-2 Place") {
    cptn::Place<> place("P", 2);
    place.addTokens(makeTokens("A", 2, "a"));

    WHEN("It is cleared") {
      place.clear();

      THEN("It is empty and accepts tokens up to its capacity again") {
        REQUIRE(place.count() == 0);
        REQUIRE(*place.getCapacity() == 2);
        place.addTokens(makeTokens("B", 2, "b"));
        REQUIRE(place.count("B") == 2);
      }
    }
  }
}
