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

#ifndef INTROGRESS_HMM_PARAMETER_INITIALIZER_HPP
#define INTROGRESS_HMM_PARAMETER_INITIALIZER_HPP

#include "HMM.hpp"
#include "Priors.hpp"
#include "SymbolTable.hpp"

#include <Eigen/Core>

#include <map>
#include <string>
#include <vector>

class SymbolFrequencies {
public:
  std::map<std::string, double> symbols; ///< Share of sites showing each full symbol
  std::vector<double> weighted_matches;  ///< Share of all matches falling in each reference
};

/// Builds starting HMM parameters from the priors and the coded sequence
class ParameterInitializer {
public:
  ParameterInitializer(Priors _priors, SymbolTable _symbols);

  SymbolFrequencies symbol_frequencies(const std::vector<std::string>& sequence) const;

  /// Known states blend prior and observed match share 0.9/0.1, unknown states use the prior
  Eigen::VectorXd initial_probabilities(const std::vector<double>& weighted_matches) const;

  /// States x emission_symbols matrix
  Eigen::MatrixXd emission_probabilities() const;

  /// Self-transition from the expected tract length, leaving split by target fraction
  Eigen::MatrixXd transition_probabilities() const;

  HMMParameters initial_parameters(const std::vector<std::string>& sequence) const;
  HMM build_initial_hmm(const std::vector<std::string>& sequence) const;

public:
  Priors priors;
  SymbolTable symbols;
  std::vector<std::string> emission_symbols;

  double expectation_weight = 0.9;
  double mismatch_bias = 0.99;
};

#endif // INTROGRESS_HMM_PARAMETER_INITIALIZER_HPP
