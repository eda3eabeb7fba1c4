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

#ifndef INTROGRESS_HMM_HMM_HPP
#define INTROGRESS_HMM_HMM_HPP

#include <Eigen/Core>

#include <string>
#include <unordered_map>
#include <vector>

/// Entries below this are treated as zero when a distribution has to be rebuilt
constexpr double PROBABILITY_FLOOR = 1e-300;

/// Rescale a vector to sum to one. Negative or non-finite entries are zeroed, and a
/// vector without any mass is replaced by the uniform distribution.
void normalize_distribution(Eigen::Ref<Eigen::VectorXd> p);

/// Apply normalize_distribution to every row
void normalize_rows(Eigen::MatrixXd& m);

/// The three probability tables of a discrete HMM, indexed by state and symbol position
class HMMParameters {
public:
  std::vector<std::string> states;
  std::vector<std::string> symbols;
  Eigen::VectorXd initial;     ///< One entry per state
  Eigen::MatrixXd emissions;   ///< States x symbols
  Eigen::MatrixXd transitions; ///< States x states, row = from

  int num_states() const { return static_cast<int>(states.size()); }
  int num_symbols() const { return static_cast<int>(symbols.size()); }

  /// Throws if the tables do not match the states and symbols or are not distributions
  void validate(double tolerance = 1e-9) const;
};

/// Discrete hidden Markov model over named states, trained with Baum-Welch on one
/// observed sequence and decoded with Viterbi or forward-backward posteriors.
class HMM {
public:
  HMM() = default;
  HMM(HMMParameters _params);

  void set_hidden_states(std::vector<std::string> states);
  void set_initial_p(Eigen::VectorXd initial);
  void set_emissions(std::vector<std::string> symbols, Eigen::MatrixXd emissions);
  void set_transitions(Eigen::MatrixXd transitions);
  void set_observations(const std::vector<std::string>& sequence);

  /// Baum-Welch until the relative log-likelihood improvement falls below
  /// `convergence_threshold` or `max_iterations` updates were made.
  /// Returns the number of updates.
  int train(double convergence_threshold, int max_iterations = 1000);

  /// Log-likelihood of the observations under the current parameters
  double log_likelihood() const;

  /// Sites x states matrix of forward-backward marginals
  Eigen::MatrixXd posterior_decoding() const;

  /// Most likely state path as state indices, ties go to the lower index
  std::vector<int> viterbi() const;

  std::size_t num_sites() const { return observations.size(); }

private:
  void check_ready() const;
  double forward(Eigen::MatrixXd& alpha, Eigen::VectorXd& scales) const;
  void backward(const Eigen::VectorXd& scales, Eigen::MatrixXd& beta) const;
  double baum_welch_step();

public:
  HMMParameters params;
  std::vector<int> observations;       ///< Symbol index per site
  std::vector<double> log_likelihoods; ///< One entry per training update
  bool observations_set = false;
  bool quiet = true;

private:
  std::unordered_map<std::string, int> symbol_to_index;
};

#endif // INTROGRESS_HMM_HMM_HPP
