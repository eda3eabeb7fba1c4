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

#ifndef INTROGRESS_HMM_PREDICTOR_CONFIG_HPP
#define INTROGRESS_HMM_PREDICTOR_CONFIG_HPP

#include "Priors.hpp"
#include "SymbolTable.hpp"

#include <boost/program_options.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

/// File name templates. Placeholders are written as {strain}, {chrom}, {state}, {prefix}.
class OutputPaths {
public:
  std::string alignment;
  std::string block_files;
  std::string hmm_initial;
  std::string hmm_trained;
  std::string probabilities;
  std::string positions; ///< Empty when positions are not written
  std::vector<std::string> test_strains;
};

/// Everything a prediction run needs, validated up front
class PredictorConfig {
public:
  std::vector<std::string> chromosomes;
  std::vector<std::string> strains;
  std::string prefix;
  std::optional<double> threshold; ///< Unset means Viterbi decoding
  double convergence_threshold = 0.001;
  int max_iterations = 1000;
  bool only_poly_sites = true;
  bool fail_fast = false;
  bool verbose = false;
  Priors priors;
  SymbolTable symbols;
  OutputPaths paths;
};

/// Options accepted on the command line and in the INI configuration file
boost::program_options::options_description predictor_options();

/// Build and validate a configuration. Throws std::invalid_argument naming the
/// missing or malformed field.
PredictorConfig parse_config(const boost::program_options::variables_map& vm);

/// "viterbi" gives an unset threshold, anything else must be a number
std::optional<double> parse_threshold(const std::string& value);

/// Parse "name,expected_length,expected_fraction"
StatePrior parse_state_prior(const std::string& value);

/// Throws unless every wildcard appears in `path` as {wildcard}
void check_wildcards(const std::string& path, const std::vector<std::string>& wildcards);

/// Replace each {key} in `path` by its value, other placeholders are left alone
std::string format_path(const std::string& path, const std::map<std::string, std::string>& values);

/// Strains with a file matching each template, checked to have every chromosome
std::vector<std::string> find_strains(const std::vector<std::string>& test_strains,
                                      const std::vector<std::string>& chromosomes);

#endif // INTROGRESS_HMM_PREDICTOR_CONFIG_HPP
