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

#include "ParameterInitializer.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

ParameterInitializer::ParameterInitializer(Priors _priors, SymbolTable _symbols)
    : priors(_priors), symbols(_symbols) {
  emission_symbols = symbols.emission_symbols(priors.num_known());
}

SymbolFrequencies
ParameterInitializer::symbol_frequencies(const std::vector<std::string>& sequence) const {
  const std::size_t k = static_cast<std::size_t>(priors.num_known());
  SymbolFrequencies freqs;
  freqs.weighted_matches.assign(k, 0.0);
  if (sequence.empty()) {
    return freqs;
  }

  for (const auto& s : sequence) {
    if (s.size() != k) {
      throw std::runtime_error("Coded symbol '" + s + "' does not have one character for each of " +
                               std::to_string(k) + " known states");
    }
    freqs.symbols[s] += 1.0;
    for (std::size_t r = 0; r < k; r++) {
      if (s[r] == symbols.match) {
        freqs.weighted_matches[r] += 1.0;
      }
    }
  }

  for (auto& entry : freqs.symbols) {
    entry.second /= static_cast<double>(sequence.size());
  }

  double total = 0.0;
  for (double w : freqs.weighted_matches) {
    total += w;
  }
  if (total > 0.0) {
    for (double& w : freqs.weighted_matches) {
      w /= total;
    }
  }
  return freqs;
}

Eigen::VectorXd
ParameterInitializer::initial_probabilities(const std::vector<double>& weighted_matches) const {
  const int num_known = priors.num_known();
  if (static_cast<int>(weighted_matches.size()) != num_known) {
    throw std::runtime_error("Expected " + std::to_string(num_known) +
                             " match frequencies, found " +
                             std::to_string(weighted_matches.size()));
  }

  Eigen::VectorXd init(priors.num_states());
  for (int s = 0; s < num_known; s++) {
    init(s) = priors.fractions[s] * expectation_weight +
              weighted_matches[s] * (1.0 - expectation_weight);
  }
  for (int s = num_known; s < priors.num_states(); s++) {
    init(s) = priors.fractions[s];
  }
  normalize_distribution(init);
  return init;
}

Eigen::MatrixXd ParameterInitializer::emission_probabilities() const {
  const int num_known = priors.num_known();
  const int num_symbols = static_cast<int>(emission_symbols.size());
  const char match = symbols.match;

  // Probability of the (first reference, this reference) pair, scaled to spread over
  // every value of the remaining columns
  const double num_per_category = std::ldexp(1.0, num_known - 2);
  auto pair_probability = [&](char first, char other) {
    double p;
    if (first != match && other == match) {
      p = 0.9;
    }
    else if (first == match && other == match) {
      p = 0.09;
    }
    else if (first != match && other != match) {
      p = 0.009;
    }
    else {
      p = 0.001;
    }
    return p * num_per_category;
  };

  Eigen::MatrixXd emissions(priors.num_states(), num_symbols);
  for (int state = 0; state < num_known; state++) {
    for (int s = 0; s < num_symbols; s++) {
      const std::string& symbol = emission_symbols[s];
      emissions(state, s) = pair_probability(symbol[0], symbol[state]);
    }
  }

  // Unknown states favour symbols with many mismatches
  Eigen::VectorXd mismatch_weight(num_symbols);
  for (int s = 0; s < num_symbols; s++) {
    const std::string& symbol = emission_symbols[s];
    double matches = 0.0;
    for (char c : symbol) {
      if (c == match) {
        matches += 1.0;
      }
    }
    const double length = static_cast<double>(symbol.size());
    mismatch_weight(s) = matches * (1.0 - mismatch_bias) + (length - matches) * mismatch_bias;
  }
  for (int state = num_known; state < priors.num_states(); state++) {
    emissions.row(state) = mismatch_weight.transpose();
  }

  normalize_rows(emissions);
  return emissions;
}

Eigen::MatrixXd ParameterInitializer::transition_probabilities() const {
  const int n = priors.num_states();
  Eigen::MatrixXd transitions(n, n);
  for (int i = 0; i < n; i++) {
    // Tracts shorter than one site cannot stay put
    const double length = priors.lengths[i];
    const double leave = length >= 1.0 ? 1.0 / length : 1.0;
    const double remaining = 1.0 - priors.fractions[i];
    for (int j = 0; j < n; j++) {
      if (i == j) {
        transitions(i, j) = 1.0 - leave;
      }
      else if (remaining > 0.0) {
        transitions(i, j) = leave * priors.fractions[j] / remaining;
      }
      else {
        transitions(i, j) = 0.0;
      }
    }
  }
  normalize_rows(transitions);
  return transitions;
}

HMMParameters
ParameterInitializer::initial_parameters(const std::vector<std::string>& sequence) const {
  const SymbolFrequencies freqs = symbol_frequencies(sequence);

  HMMParameters params;
  params.states = priors.states();
  params.symbols = emission_symbols;
  params.initial = initial_probabilities(freqs.weighted_matches);
  params.emissions = emission_probabilities();
  params.transitions = transition_probabilities();
  return params;
}

HMM ParameterInitializer::build_initial_hmm(const std::vector<std::string>& sequence) const {
  return HMM(initial_parameters(sequence));
}
