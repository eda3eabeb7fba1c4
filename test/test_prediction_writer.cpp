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

#include "PredictionWriter.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string read_text(const std::filesystem::path& p) {
  std::ifstream input(p);
  std::stringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

} // namespace

TEST_CASE("Number formatting") {
  CHECK(format_double(0.5) == "0.5");
  CHECK(format_double(1.0) == "1.0");
  CHECK(format_double(0.0) == "0.0");
  CHECK(format_double(0.1) == "0.1");
  CHECK(format_double(-2.0) == "-2.0");
  CHECK(std::stod(format_double(1.0 / 3.0)) == 1.0 / 3.0);
}

TEST_CASE("Record formatting") {
  SECTION("HMM header and rows") {
    CHECK(hmm_header({"a", "b"}, {"+", "-"}) ==
          "strain\tchromosome\tinit_a\tinit_b\temis_a_+\temis_a_-\temis_b_+\temis_b_-"
          "\ttrans_a_a\ttrans_a_b\ttrans_b_a\ttrans_b_b\n");

    HMMParameters params;
    params.states = {"a", "b"};
    params.symbols = {"+"};
    params.initial = Eigen::Vector2d(0.25, 0.75);
    params.emissions = Eigen::MatrixXd::Ones(2, 1);
    params.transitions = Eigen::MatrixXd(2, 2);
    params.transitions << 0.5, 0.5, 0.125, 0.875;
    CHECK(hmm_record(params, {"+", "-"}, "s1", "I") ==
          "s1\tI\t0.25\t0.75\t1.0\t0.0\t1.0\t0.0\t0.5\t0.5\t0.125\t0.875\n");
  }

  SECTION("Blocks use genomic positions") {
    CHECK(blocks_header() == "strain\tchromosome\tpredicted_species\tstart\tend\tnum_sites_hmm\n");
    std::vector<Block> blocks = {Block(0, 1), Block(3, 3)};
    CHECK(blocks_record(blocks, {10, 12, 15, 20}, "s1", "I", "par") ==
          "s1\tI\tpar\t10\t12\t2\ns1\tI\tpar\t20\t20\t1\n");
    CHECK(blocks_record({}, {}, "s1", "I", "par").empty());
    CHECK_THROWS(blocks_record({Block(0, 4)}, {1, 2}, "s1", "I", "par"));
  }

  SECTION("Positions and probabilities") {
    CHECK(positions_record({3, 7}, "s1", "I") == "s1\tI\t3\t7\n");
    CHECK(positions_record({}, "s1", "I") == "s1\tI\n");

    Eigen::MatrixXd posteriors(2, 2);
    posteriors << 0.25, 0.75, 1.0, 0.0;
    CHECK(probabilities_record(posteriors, {"a", "b"}, "s1", "I") ==
          "s1\tI\ta:0.25000,1.00000\tb:0.75000,0.00000\n");
    CHECK(probabilities_record(Eigen::MatrixXd(0, 2), {"a", "b"}, "s1", "I") == "s1\tI\ta:\tb:\n");
    CHECK_THROWS_WITH(probabilities_record(posteriors, {"a"}, "s1", "I"), Catch::Matchers::ContainsSubstring("2 columns for 1 states"));
  }
}

TEST_CASE("Prediction files") {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "introgress_writer";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  {
    PredictionWriter writer({"a", "b"}, {"+", "-"}, (dir / "hmm_initial.txt").string(),
                            (dir / "hmm_trained.txt").string(),
                            (dir / "blocks_{state}.txt").string(),
                            (dir / "probabilities.txt.gz").string(),
                            (dir / "positions.txt.gz").string());
    CHECK(writer.has_positions());
    writer.write_blocks("b", blocks_record({Block(0, 1)}, {5, 9}, "s1", "I", "b"));
    writer.write_blocks("a", "");
    writer.write_positions(positions_record({5, 9}, "s1", "I"));
    writer.write_positions(positions_record({}, "s2", "I"));
    CHECK_THROWS_WITH(writer.write_blocks("c", ""), Catch::Matchers::ContainsSubstring("No block file for state c"));
    writer.close();
  }

  CHECK(read_text(dir / "hmm_initial.txt") == hmm_header({"a", "b"}, {"+", "-"}));
  CHECK(read_text(dir / "blocks_a.txt") == blocks_header());

  auto blocks = read_blocks((dir / "blocks_b.txt").string());
  REQUIRE(blocks["s1"]["I"].size() == 1);
  CHECK(blocks["s1"]["I"][0].state == "b");
  CHECK(blocks["s1"]["I"][0].start == 5);
  CHECK(blocks["s1"]["I"][0].end == 9);
  CHECK(blocks["s1"]["I"][0].num_sites_hmm == 2);
  CHECK(read_blocks((dir / "blocks_a.txt").string()).empty());

  auto positions = read_positions((dir / "positions.txt.gz").string());
  CHECK(positions["s1"]["I"] == std::vector<int>{5, 9});
  REQUIRE(positions.count("s2") == 1);
  CHECK(positions["s2"]["I"].empty());

  SECTION("Labeled block files") {
    std::ofstream(dir / "labeled.txt") << "region_id\tstrain\tchromosome\tpredicted_species\tstart\tend\tnum_sites_hmm\n"
                                       << "r1\ts1\tII\tpar\t100\t250\t12\n";
    auto labeled = read_blocks((dir / "labeled.txt").string(), true);
    REQUIRE(labeled["s1"]["II"].size() == 1);
    CHECK(labeled["s1"]["II"][0].region_id == "r1");
    CHECK(labeled["s1"]["II"][0].start == 100);
    CHECK(labeled["s1"]["II"][0].num_sites_hmm == 12);
  }

  SECTION("Malformed and missing files") {
    std::ofstream(dir / "bad.txt") << "header\ns1\tI\tpar\tstart\t5\t1\n";
    CHECK_THROWS_WITH(read_blocks((dir / "bad.txt").string()), Catch::Matchers::ContainsSubstring("Malformed block on line 2"));
    CHECK_THROWS_WITH(read_blocks((dir / "missing.txt").string()), Catch::Matchers::ContainsSubstring("Unable to open block file"));
    CHECK_THROWS_WITH(read_positions((dir / "missing.gz").string()), Catch::Matchers::ContainsSubstring("Unable to open positions file"));
  }

  std::filesystem::remove_all(dir);
}
