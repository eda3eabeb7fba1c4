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

#include "PredictorConfig.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

const std::string BASE_CONFIG = R"(chromosomes = I II
reference = cer
known_state = par,1000,0.025
[paths]
alignment = aln/{prefix}_{strain}_chr{chrom}.fa
block_files = out/blocks_{state}.txt
hmm_initial = out/hmm_initial.txt
hmm_trained = out/hmm_trained.txt
probabilities = out/probabilities.txt.gz
)";

po::variables_map parse_ini(const std::string& contents) {
  std::istringstream input(contents);
  po::variables_map vm;
  po::store(po::parse_config_file(input, predictor_options()), vm);
  po::notify(vm);
  return vm;
}

PredictorConfig parse(const std::string& contents) {
  return parse_config(parse_ini(contents));
}

} // namespace

TEST_CASE("Configuration parsing") {
  SECTION("Defaults and derived values") {
    PredictorConfig config = parse("strains = s2, s1 s2\n" + BASE_CONFIG);
    CHECK(config.chromosomes == std::vector<std::string>{"I", "II"});
    CHECK(config.strains == std::vector<std::string>{"s1", "s2"});
    CHECK(config.prefix == "cer_par");
    CHECK(config.paths.alignment == "aln/cer_par_{strain}_chr{chrom}.fa");
    CHECK(config.paths.block_files == "out/blocks_{state}.txt");
    CHECK(config.paths.positions.empty());
    CHECK_FALSE(config.threshold.has_value());
    CHECK(config.convergence_threshold == 0.001);
    CHECK(config.max_iterations == 1000);
    CHECK(config.only_poly_sites);
    CHECK_FALSE(config.fail_fast);
    CHECK(config.priors.states() == std::vector<std::string>{"cer", "par"});
    CHECK(config.symbols.match == '+');
  }

  SECTION("Explicit values") {
    PredictorConfig config = parse("strains = s1\nprefix = custom\nthreshold = 0.75\n"
                                   "max_iterations = 20\nonly_poly_sites = false\n"
                                   "unknown_state = unk,500,0.01\n" +
                                   BASE_CONFIG + "positions = out/positions.txt.gz\n"
                                   "[symbols]\nmatch = M\nmismatch = m\n");
    CHECK(config.prefix == "custom");
    CHECK(config.paths.alignment == "aln/custom_{strain}_chr{chrom}.fa");
    REQUIRE(config.threshold.has_value());
    CHECK(*config.threshold == 0.75);
    CHECK(config.max_iterations == 20);
    CHECK_FALSE(config.only_poly_sites);
    CHECK(config.paths.positions == "out/positions.txt.gz");
    CHECK(config.priors.states() == std::vector<std::string>{"cer", "par", "unk"});
    CHECK(config.symbols.match == 'M');
    CHECK(config.symbols.mismatch == 'm');
  }

  SECTION("Missing required values") {
    CHECK_THROWS_WITH(parse("strains = s1\nreference = cer\n"), Catch::Matchers::ContainsSubstring("No chromosomes specified"));
    CHECK_THROWS_WITH(parse("strains = s1\nchromosomes = I\n"), Catch::Matchers::ContainsSubstring("did not specify a reference state"));
    CHECK_THROWS_WITH(parse("strains = s1\nchromosomes = I\nreference = cer\n"), Catch::Matchers::ContainsSubstring("No alignment file provided (paths.alignment)"));
    CHECK_THROWS_WITH(parse(BASE_CONFIG), Catch::Matchers::ContainsSubstring("Unable to find strains"));
  }

  SECTION("Invalid values") {
    CHECK_THROWS_WITH(parse("strains = s1\nthreshold = sometimes\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("Unsupported threshold value: sometimes"));
    CHECK_THROWS_WITH(parse("strains = s1\nthreshold = 1.5\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("must lie in [0, 1]"));
    CHECK_THROWS_WITH(parse("strains = s1\nthreshold = nan\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("must lie in [0, 1], found nan"));
    CHECK_THROWS_WITH(parse("strains = s1\nknown_state = eub,100\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("eub did not provide an expected_fraction"));
    CHECK_THROWS_WITH(parse("strains = s1\nknown_state = eub,0.5,0.99\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("Invalid state priors"));
    CHECK_THROWS_WITH(parse("strains = s1\nmax_iterations = 0\n" + BASE_CONFIG), Catch::Matchers::ContainsSubstring("max_iterations must be at least 1"));
  }

  SECTION("Paths must contain their wildcards") {
    std::string config = "strains = s1\n" + BASE_CONFIG;
    std::string no_state = config;
    no_state.replace(no_state.find("blocks_{state}"), 14, "blocks");
    CHECK_THROWS_WITH(parse(no_state), Catch::Matchers::ContainsSubstring("out/blocks.txt does not contain the {state} wildcard"));
    std::string no_chrom = config;
    no_chrom.replace(no_chrom.find("_chr{chrom}"), 11, "");
    CHECK_THROWS_WITH(parse(no_chrom), Catch::Matchers::ContainsSubstring("does not contain the {chrom} wildcard"));
  }
}

TEST_CASE("State prior parsing") {
  StatePrior prior = parse_state_prior(" par , 1000 ,0.025");
  CHECK(prior.name == "par");
  CHECK(prior.expected_length == 1000);
  CHECK(prior.expected_fraction == 0.025);

  CHECK_THROWS_WITH(parse_state_prior("par"), Catch::Matchers::ContainsSubstring("par did not provide an expected_length"));
  CHECK_THROWS_WITH(parse_state_prior("par,,0.1"), Catch::Matchers::ContainsSubstring("par did not provide an expected_length"));
  CHECK_THROWS_WITH(parse_state_prior("par,long,0.1"), Catch::Matchers::ContainsSubstring("malformed expected_length"));
  CHECK_THROWS_WITH(parse_state_prior("par,10,0.1,3"), Catch::Matchers::ContainsSubstring("must be name,expected_length,expected_fraction"));
  CHECK_THROWS_WITH(parse_state_prior(",10,0.1"), Catch::Matchers::ContainsSubstring("does not start with a state name"));
}

TEST_CASE("Threshold parsing") {
  CHECK_FALSE(parse_threshold("viterbi").has_value());
  CHECK(parse_threshold("0.5").value() == 0.5);
  CHECK(parse_threshold(" 1 ").value() == 1.0);
  CHECK_THROWS_WITH(parse_threshold("posterior"), Catch::Matchers::ContainsSubstring("Unsupported threshold value: posterior"));
}

TEST_CASE("Path templates") {
  CHECK(format_path("{prefix}_{strain}_chr{chrom}.fa", {{"strain", "s1"}, {"chrom", "IV"}}) == "{prefix}_s1_chrIV.fa");
  CHECK(format_path("{state}/{state}.txt", {{"state", "par"}}) == "par/par.txt");
  CHECK_NOTHROW(check_wildcards("{a}{b}", {"a", "b"}));
  CHECK_THROWS_WITH(check_wildcards("{a}", {"a", "b"}), Catch::Matchers::ContainsSubstring("{a} does not contain the {b} wildcard"));
}

TEST_CASE("Strain discovery") {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "introgress_find_strains";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir / "nested");
  auto touch = [](const std::filesystem::path& p) { std::ofstream(p) << ">x\nA\n"; };
  const std::string pattern = (dir / "{strain}_chr{chrom}.fa").generic_string();

  SECTION("Throws if nothing matches") {
    CHECK_THROWS_WITH(find_strains({pattern}, {"I", "II"}), Catch::Matchers::ContainsSubstring("Found no chromosome sequence files"));
  }

  SECTION("Strains with every chromosome") {
    touch(dir / "s1_chrI.fa");
    touch(dir / "s1_chrII.fa");
    touch(dir / "yjm_981_chrI.fa");
    touch(dir / "yjm_981_chrII.fa");
    touch(dir / "s3_chrI.txt");
    CHECK(find_strains({pattern}, {"I", "II"}) == std::vector<std::string>{"s1", "yjm_981"});
  }

  SECTION("Throws on strains missing a chromosome") {
    touch(dir / "s1_chrI.fa");
    touch(dir / "s1_chrII.fa");
    touch(dir / "s2_chrI.fa");
    CHECK_THROWS_WITH(find_strains({pattern}, {"I", "II"}), Catch::Matchers::ContainsSubstring("Strain s2 has incorrect number of chromosomes. Expected 2 found 1"));
  }

  SECTION("Repeated wildcards must agree") {
    const std::string repeated = (dir / "{strain}/{strain}_chr{chrom}.fa").generic_string();
    std::filesystem::create_directories(dir / "s4");
    touch(dir / "s4" / "s4_chrI.fa");
    touch(dir / "nested" / "s5_chrI.fa");
    CHECK(find_strains({repeated}, {"I"}) == std::vector<std::string>{"s4"});
  }

  std::filesystem::remove_all(dir);
}
