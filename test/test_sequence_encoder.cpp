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

#include "SequenceEncoder.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <vector>

TEST_CASE("Ungapping and coding") {
  SequenceEncoder encoder{SymbolTable()};
  const std::vector<std::string> references = {"A-CGT", "AACGA"};
  const std::string predicted = "AAC-T";

  SECTION("Gapped columns are dropped and positions follow the index reference") {
    CodedSequence coded = encoder.ungap_and_code(predicted, references);
    CHECK(coded.symbols == std::vector<std::string>{"++", "++", "+-"});
    CHECK(coded.positions == std::vector<int>{0, 1, 3});
  }

  SECTION("Positions can use another index reference") {
    CodedSequence coded = encoder.ungap_and_code(predicted, references, 1);
    CHECK(coded.positions == std::vector<int>{0, 2, 4});
    CHECK_THROWS_WITH(encoder.ungap_and_code(predicted, references, 2), Catch::Matchers::ContainsSubstring("out of range"));
  }

  SECTION("Unsequenced bases are dropped") {
    CodedSequence coded = encoder.ungap_and_code("AnG", {"AAG", "CAG"});
    CHECK(coded.symbols == std::vector<std::string>{"+-", "++"});
    CHECK(coded.positions == std::vector<int>{0, 2});
  }

  SECTION("Every retained symbol has one match or mismatch per reference") {
    CodedSequence coded = encoder.ungap_and_code("ACGTAC", {"ACGAAA", "TCGTAC", "ACCTAG"});
    REQUIRE(coded.size() == 6);
    for (const auto& s : coded.symbols) {
      CHECK(s.size() == 3);
      CHECK(s.find_first_not_of("+-") == std::string::npos);
    }
    CHECK(coded.symbols[0] == "+-+");
    CHECK(coded.symbols[5] == "-+-");
  }

  SECTION("Throws on length mismatch") {
    CHECK_THROWS_WITH(encoder.ungap_and_code("ACG", {"ACG", "AC"}), Catch::Matchers::ContainsSubstring("Sequence length mismatch in alignment"));
    CHECK_THROWS_WITH(encoder.ungap_and_code("ACG", {}), Catch::Matchers::ContainsSubstring("at least one reference"));
  }

  SECTION("Empty alignment") {
    CodedSequence coded = encoder.ungap_and_code("", {"", ""});
    CHECK(coded.empty());
    CHECK(coded.positions.empty());
  }
}

TEST_CASE("Polymorphic site filter") {
  SequenceEncoder encoder{SymbolTable()};
  CodedSequence coded;
  coded.symbols = {"++", "+-", "++", "--", "-+"};
  coded.positions = {3, 5, 8, 9, 12};

  CodedSequence poly = encoder.poly_sites(coded);
  CHECK(poly.symbols == std::vector<std::string>{"+-", "--", "-+"});
  CHECK(poly.positions == std::vector<int>{5, 9, 12});

  CHECK(encoder.encode("AAC-T", {"A-CGT", "AACGA"}, true).symbols == std::vector<std::string>{"+-"});
  CHECK(encoder.encode("AAC-T", {"A-CGT", "AACGA"}, false).size() == 3);
}

TEST_CASE("Encoding FASTA alignments") {
  SequenceEncoder encoder{SymbolTable({{"gap", "."}})};

  SECTION("The last record is the predicted strain") {
    FastaRecords alignment;
    alignment.headers = {">ref1", ">ref2", ">strain"};
    alignment.sequences = {"AAAA.C", "CCAAAC", "AACA-C"};
    EncodedAlignment encoded = encoder.encode_alignment(alignment, true);
    CHECK(encoded.total_length == 6);
    CHECK(encoded.coded.symbols == std::vector<std::string>{"+-", "+-", "--"});
    CHECK(encoded.coded.positions == std::vector<int>{0, 1, 2});

    EncodedAlignment all_sites = encoder.encode_alignment(alignment, false);
    CHECK(all_sites.coded.symbols == std::vector<std::string>{"+-", "+-", "--", "++", "++"});
    CHECK(all_sites.coded.positions == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Throws with fewer than two sequences") {
    FastaRecords alignment;
    alignment.headers = {">ref1"};
    alignment.sequences = {"ACGT"};
    CHECK_THROWS_WITH(encoder.encode_alignment(alignment), Catch::Matchers::ContainsSubstring("at least one reference and a predicted strain"));
  }
}
