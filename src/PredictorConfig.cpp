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

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

const std::vector<std::string> REQUIRED_PATHS = {"alignment", "block_files", "hmm_initial",
                                                 "hmm_trained", "probabilities"};

std::vector<std::string> split_list(const std::string& value) {
  boost::char_separator<char> sep(", \t");
  boost::tokenizer<boost::char_separator<char>> tokens(value, sep);
  return std::vector<std::string>(tokens.begin(), tokens.end());
}

std::vector<std::string> list_option(const po::variables_map& vm, const std::string& name) {
  std::vector<std::string> result;
  if (!vm.count(name)) {
    return result;
  }
  for (const auto& entry : vm[name].as<std::vector<std::string>>()) {
    for (const auto& item : split_list(entry)) {
      result.push_back(item);
    }
  }
  return result;
}

std::string string_option(const po::variables_map& vm, const std::string& name) {
  if (!vm.count(name)) {
    return "";
  }
  return boost::algorithm::trim_copy(vm[name].as<std::string>());
}

std::string regex_escape(const std::string& s) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string escaped;
  for (char c : s) {
    if (special.find(c) != std::string::npos) {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

} // namespace

po::options_description predictor_options() {
  po::options_description options("Prediction options");
  // clang-format off
  options.add_options()
    ("chromosomes", po::value<std::vector<std::string>>()->multitoken(), "Chromosomes to analyse")
    ("strains", po::value<std::vector<std::string>>()->multitoken(), "Strains to analyse; discovered from paths.test_strains when unset")
    ("prefix", po::value<std::string>(), "Alignment prefix; defaults to the known states joined with '_'")
    ("threshold", po::value<std::string>()->default_value("viterbi"), "'viterbi' or a posterior probability threshold")
    ("convergence_threshold", po::value<double>()->default_value(0.001, "0.001"), "Relative log-likelihood improvement at which Baum-Welch stops")
    ("max_iterations", po::value<int>()->default_value(1000), "Maximum number of Baum-Welch iterations")
    ("only_poly_sites", po::value<bool>()->default_value(true), "Only use sites where some reference differs from the predicted strain")
    ("fail_fast", po::value<bool>()->default_value(false)->implicit_value(true), "Abort on the first failing strain and chromosome")
    ("verbose", po::value<bool>()->default_value(false)->implicit_value(true), "Report every Baum-Welch iteration")
    ("reference", po::value<std::string>(), "Name of the baseline state, first sequence of each alignment")
    ("known_state", po::value<std::vector<std::string>>(), "name,expected_length,expected_fraction of a state with a reference; in alignment order")
    ("unknown_state", po::value<std::vector<std::string>>(), "name,expected_length,expected_fraction of a state without a reference")
    ("paths.alignment", po::value<std::string>(), "Alignment file, with {prefix}, {strain} and {chrom}")
    ("paths.block_files", po::value<std::string>(), "Block output file, with {state}")
    ("paths.hmm_initial", po::value<std::string>(), "Output file for HMM parameters before training")
    ("paths.hmm_trained", po::value<std::string>(), "Output file for HMM parameters after training")
    ("paths.probabilities", po::value<std::string>(), "Gzipped output file for posterior probabilities")
    ("paths.positions", po::value<std::string>(), "Optional gzipped output file for retained positions")
    ("paths.test_strains", po::value<std::vector<std::string>>(), "Input files with {strain} and {chrom}, used to discover strains");
  // clang-format on
  for (const auto& name : SymbolTable::names()) {
    const std::string key = "symbols." + name;
    options.add_options()(key.c_str(), po::value<std::string>(), "Alignment symbol override");
  }
  return options;
}

std::optional<double> parse_threshold(const std::string& value) {
  const std::string trimmed = boost::algorithm::trim_copy(value);
  if (trimmed == "viterbi") {
    return std::nullopt;
  }
  try {
    return boost::lexical_cast<double>(trimmed);
  }
  catch (const boost::bad_lexical_cast&) {
    throw std::invalid_argument("Unsupported threshold value: " + value);
  }
}

StatePrior parse_state_prior(const std::string& value) {
  boost::char_separator<char> sep(",", "", boost::keep_empty_tokens);
  boost::tokenizer<boost::char_separator<char>> tokens(value, sep);
  std::vector<std::string> fields;
  for (const auto& token : tokens) {
    fields.push_back(boost::algorithm::trim_copy(token));
  }

  if (fields.empty() || fields[0].empty()) {
    throw std::invalid_argument("State prior '" + value + "' does not start with a state name");
  }
  const std::string& name = fields[0];
  if (fields.size() > 3) {
    throw std::invalid_argument("State prior '" + value +
                                "' must be name,expected_length,expected_fraction");
  }

  double length = 0.0;
  double fraction = 0.0;
  if (fields.size() < 2 || fields[1].empty()) {
    throw std::invalid_argument(name + " did not provide an expected_length");
  }
  try {
    length = boost::lexical_cast<double>(fields[1]);
  }
  catch (const boost::bad_lexical_cast&) {
    throw std::invalid_argument(name + " has a malformed expected_length: " + fields[1]);
  }
  if (fields.size() < 3 || fields[2].empty()) {
    throw std::invalid_argument(name + " did not provide an expected_fraction");
  }
  try {
    fraction = boost::lexical_cast<double>(fields[2]);
  }
  catch (const boost::bad_lexical_cast&) {
    throw std::invalid_argument(name + " has a malformed expected_fraction: " + fields[2]);
  }
  return StatePrior(name, length, fraction);
}

void check_wildcards(const std::string& path, const std::vector<std::string>& wildcards) {
  for (const auto& wildcard : wildcards) {
    if (path.find("{" + wildcard + "}") == std::string::npos) {
      throw std::invalid_argument(path + " does not contain the {" + wildcard + "} wildcard");
    }
  }
}

std::string format_path(const std::string& path, const std::map<std::string, std::string>& values) {
  std::string result = path;
  for (const auto& [key, value] : values) {
    boost::algorithm::replace_all(result, "{" + key + "}", value);
  }
  return result;
}

std::vector<std::string> find_strains(const std::vector<std::string>& test_strains,
                                      const std::vector<std::string>& chromosomes) {
  std::map<std::string, std::set<std::string>> strains;
  for (const auto& test_strain : test_strains) {
    check_wildcards(test_strain, {"strain", "chrom"});

    // Build a regex from the template; repeated wildcards must match the same text
    std::string pattern;
    std::map<std::string, int> groups;
    std::size_t pos = 0;
    while (pos < test_strain.size()) {
      const std::size_t open = test_strain.find('{', pos);
      const std::size_t close =
          open == std::string::npos ? std::string::npos : test_strain.find('}', open);
      if (close == std::string::npos) {
        pattern += regex_escape(test_strain.substr(pos));
        break;
      }
      const std::string key = test_strain.substr(open + 1, close - open - 1);
      pattern += regex_escape(test_strain.substr(pos, open - pos));
      if (key != "strain" && key != "chrom") {
        pattern += regex_escape(test_strain.substr(open, close - open + 1));
      }
      else if (groups.count(key)) {
        pattern += "\\" + std::to_string(groups[key]);
      }
      else {
        const int group = static_cast<int>(groups.size()) + 1;
        groups[key] = group;
        pattern += key == "strain" ? "(.*?)" : "([^_]*?)";
      }
      pos = close + 1;
    }
    const std::regex matcher(pattern);

    // Search below the longest directory free of wildcards
    const std::string fixed = test_strain.substr(0, test_strain.find('{'));
    std::filesystem::path root = std::filesystem::path(fixed).parent_path();
    if (root.empty()) {
      root = ".";
    }
    std::cout << "Searching for strains matching " << test_strain << "\n";
    if (!std::filesystem::is_directory(root)) {
      continue;
    }

    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::string fname = entry.path().generic_string();
      if (fname.rfind("./", 0) == 0 && fixed.rfind("./", 0) != 0) {
        fname = fname.substr(2);
      }
      std::smatch match;
      if (std::regex_match(fname, match, matcher)) {
        strains[match[groups["strain"]].str()].insert(match[groups["chrom"]].str());
      }
    }
  }

  if (strains.empty()) {
    throw std::invalid_argument("Found no chromosome sequence files in " +
                                boost::algorithm::join(test_strains, ", "));
  }

  std::vector<std::string> result;
  for (const auto& [strain, chroms] : strains) {
    if (chroms.size() != chromosomes.size()) {
      throw std::invalid_argument("Strain " + strain +
                                  " has incorrect number of chromosomes. Expected " +
                                  std::to_string(chromosomes.size()) + " found " +
                                  std::to_string(chroms.size()));
    }
    result.push_back(strain);
  }
  return result;
}

PredictorConfig parse_config(const po::variables_map& vm) {
  PredictorConfig config;

  config.chromosomes = list_option(vm, "chromosomes");
  if (config.chromosomes.empty()) {
    throw std::invalid_argument("No chromosomes specified in configuration (chromosomes)");
  }

  const std::string reference = string_option(vm, "reference");
  if (reference.empty()) {
    throw std::invalid_argument("Configuration did not specify a reference state (reference)");
  }
  std::vector<StatePrior> known;
  if (vm.count("known_state")) {
    for (const auto& value : vm["known_state"].as<std::vector<std::string>>()) {
      known.push_back(parse_state_prior(value));
    }
  }
  std::vector<StatePrior> unknown;
  if (vm.count("unknown_state")) {
    for (const auto& value : vm["unknown_state"].as<std::vector<std::string>>()) {
      unknown.push_back(parse_state_prior(value));
    }
  }
  try {
    config.priors = Priors(reference, known, unknown);
  }
  catch (const std::runtime_error& e) {
    throw std::invalid_argument(std::string("Invalid state priors: ") + e.what());
  }

  std::map<std::string, std::string> symbol_overrides;
  for (const auto& name : SymbolTable::names()) {
    if (vm.count("symbols." + name)) {
      symbol_overrides[name] = vm["symbols." + name].as<std::string>();
    }
  }
  config.symbols = SymbolTable(symbol_overrides);

  config.threshold = parse_threshold(vm["threshold"].as<std::string>());
  if (config.threshold.has_value() && !(*config.threshold >= 0.0 && *config.threshold <= 1.0)) {
    throw std::invalid_argument("Posterior threshold must lie in [0, 1], found " +
                                vm["threshold"].as<std::string>());
  }
  config.convergence_threshold = vm["convergence_threshold"].as<double>();
  if (!(config.convergence_threshold >= 0.0)) {
    throw std::invalid_argument("convergence_threshold must be non-negative");
  }
  config.max_iterations = vm["max_iterations"].as<int>();
  if (config.max_iterations < 1) {
    throw std::invalid_argument("max_iterations must be at least 1, found " +
                                std::to_string(config.max_iterations));
  }
  config.only_poly_sites = vm["only_poly_sites"].as<bool>();
  config.fail_fast = vm["fail_fast"].as<bool>();
  config.verbose = vm["verbose"].as<bool>();

  config.prefix = string_option(vm, "prefix");
  if (config.prefix.empty()) {
    config.prefix = boost::algorithm::join(config.priors.known_states(), "_");
  }

  std::map<std::string, std::string> paths;
  for (const auto& name : REQUIRED_PATHS) {
    paths[name] = string_option(vm, "paths." + name);
    if (paths[name].empty()) {
      throw std::invalid_argument("No " + name + " file provided (paths." + name + ")");
    }
  }
  check_wildcards(paths["alignment"], {"prefix", "strain", "chrom"});
  check_wildcards(paths["block_files"], {"state"});

  config.paths.alignment = format_path(paths["alignment"], {{"prefix", config.prefix}});
  config.paths.block_files = paths["block_files"];
  config.paths.hmm_initial = paths["hmm_initial"];
  config.paths.hmm_trained = paths["hmm_trained"];
  config.paths.probabilities = paths["probabilities"];
  config.paths.positions = string_option(vm, "paths.positions");
  if (vm.count("paths.test_strains")) {
    config.paths.test_strains = vm["paths.test_strains"].as<std::vector<std::string>>();
  }
  for (const auto& test_strain : config.paths.test_strains) {
    check_wildcards(test_strain, {"strain", "chrom"});
  }

  const std::vector<std::string> strains = list_option(vm, "strains");
  if (!strains.empty()) {
    std::set<std::string> unique(strains.begin(), strains.end());
    config.strains.assign(unique.begin(), unique.end());
  }
  else if (!config.paths.test_strains.empty()) {
    config.strains = find_strains(config.paths.test_strains, config.chromosomes);
  }
  else {
    throw std::invalid_argument(
        "Unable to find strains in configuration and no paths.test_strains provided");
  }

  return config;
}
