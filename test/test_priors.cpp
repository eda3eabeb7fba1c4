// This file is part of the Introgress software suite.
// Copyright (C) 2024 Introgress Developers.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "Priors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sstream>
#include <string>
#include <vector>

using Catch::Approx;

TEST_CASE("Priors constructor exceptions") {
  SECTION("Throws on duplicate names") {
    CHECK_THROWS_WITH(Priors("cer", {{"par", 10, 0.1}, {"par", 5, 0.1}}, {}), Catch::Matchers::ContainsSubstring("State par is listed more than once"));
    CHECK_THROWS_WITH(Priors("cer", {{"cer", 10, 0.1}}, {}), Catch::Matchers::ContainsSubstring("State cer is listed more than once"));
    CHECK_THROWS_WITH(Priors("cer", {{"par", 10, 0.1}}, {{"par", 10, 0.1}}), Catch::Matchers::ContainsSubstring("listed more than once"));
  }

  SECTION("Throws on non-positive lengths") {
    CHECK_THROWS_WITH(Priors("cer", {{"par", 0, 0.1}}, {}), Catch::Matchers::ContainsSubstring("strictly positive expected_length"));
    CHECK_THROWS_WITH(Priors("cer", {}, {{"unk", -2, 0.1}}), Catch::Matchers::ContainsSubstring("strictly positive expected_length"));
  }

  SECTION("Throws on fractions outside [0, 1]") {
    CHECK_THROWS_WITH(Priors("cer", {{"par", 10, 1.5}}, {}), Catch::Matchers::ContainsSubstring("expected_fraction in [0, 1]"));
    CHECK_THROWS_WITH(Priors("cer", {{"par", 10, -0.1}}, {}), Catch::Matchers::ContainsSubstring("expected_fraction in [0, 1]"));
  }

  SECTION("Throws if the other states leave nothing to the reference") {
    CHECK_THROWS_WITH(Priors("cer", {{"par", 10, 0.6}}, {{"unk", 10, 0.4}}), Catch::Matchers::ContainsSubstring("Expected fractions of non-reference states sum to 1"));
  }

  SECTION("Throws without a reference name") {
    CHECK_THROWS_WITH(Priors("", {}, {}), Catch::Matchers::ContainsSubstring("named reference state"));
  }
}

TEST_CASE("Priors baseline derivation") {
  SECTION("Known states only") {
    Priors priors("ref1", {{"ref2", 3, 0.1}}, {});
    CHECK(priors.states() == std::vector<std::string>{"ref1", "ref2"});
    CHECK(priors.num_known() == 2);
    CHECK(priors.num_states() == 2);
    CHECK(priors.fractions[0] == Approx(0.9));
    CHECK(priors.fractions[1] == Approx(0.1));
    CHECK(priors.reference_fraction == Approx(0.9));
    CHECK(priors.other_sum == Approx(0.1 / 3));

    priors.update_expected_length(10);
    CHECK(priors.lengths[0] == Approx(6.75));
    CHECK(priors.lengths[1] == Approx(3));
  }

  SECTION("Unknown fractions are folded into the reference") {
    Priors priors("a", {{"b", 10, 0.1}}, {{"u", 5, 0.2}});
    CHECK(priors.known_states() == std::vector<std::string>{"a", "b"});
    CHECK(priors.unknown_states() == std::vector<std::string>{"u"});
    CHECK(priors.num_states() == 3);
    CHECK(priors.fractions[0] == Approx(0.7));
    CHECK(priors.reference_fraction == Approx(0.9));
    CHECK(priors.other_sum == Approx(0.01));

    priors.update_expected_length(100);
    CHECK(priors.lengths[0] == Approx(45));
  }

  SECTION("Empty sequence") {
    Priors priors("a", {{"b", 10, 0.1}}, {});
    priors.update_expected_length(0);
    CHECK(priors.lengths[0] == 0.0);
  }

  SECTION("Printing lists every state") {
    Priors priors("a", {{"b", 10, 0.25}}, {});
    std::ostringstream oss;
    oss << priors;
    CHECK(oss.str() == "a 0 0.75\nb 10 0.25\n");
  }
}
