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

#include "HMM.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

void normalize_distribution(Eigen::Ref<Eigen::VectorXd> p) {
  for (Eigen::Index i = 0; i < p.size(); i++) {
    if (!std::isfinite(p(i)) || p(i) < 0.0) {
      p(i) = 0.0;
    }
  }
  double total = p.sum();
  if (!(total > PROBABILITY_FLOOR)) {
    p.setConstant(PROBABILITY_FLOOR);
    total = p.sum();
  }
  p /= total;
}

void normalize_rows(Eigen::MatrixXd& m) {
  for (Eigen::Index i = 0; i < m.rows(); i++) {
    Eigen::VectorXd row = m.row(i).transpose();
    normalize_distribution(row);
    m.row(i) = row.transpose();
  }
}

namespace {

void check_distribution(const Eigen::VectorXd& p, const std::string& name, double tolerance) {
  for (Eigen::Index i = 0; i < p.size(); i++) {
    if (!std::isfinite(p(i)) || p(i) < 0.0) {
      std::ostringstream oss;
      oss << "Invalid probability " << p(i) << " at index " << i << " of " << name;
      throw std::runtime_error(oss.str());
    }
  }
  if (std::abs(p.sum() - 1.0) > tolerance) {
    std::ostringstream oss;
    oss << name << " sums to " << p.sum() << " instead of 1";
    throw std::runtime_error(oss.str());
  }
}

} // namespace

void HMMParameters::validate(const double tolerance) const {
  const Eigen::Index n = num_states();
  if (n == 0) {
    throw std::runtime_error("HMM has no hidden states");
  }
  if (initial.size() != n) {
    throw std::runtime_error("Initial probabilities have " + std::to_string(initial.size()) +
                             " entries for " + std::to_string(n) + " states");
  }
  if (transitions.rows() != n || transitions.cols() != n) {
    throw std::runtime_error("Transition matrix must be " + std::to_string(n) + "x" +
                             std::to_string(n));
  }
  if (emissions.rows() != n || emissions.cols() != num_symbols()) {
    throw std::runtime_error("Emission matrix must be " + std::to_string(n) + "x" +
                             std::to_string(num_symbols()));
  }

  check_distribution(initial, "initial probabilities", tolerance);
  for (Eigen::Index i = 0; i < n; i++) {
    check_distribution(transitions.row(i).transpose(), "transitions from " + states[i], tolerance);
    check_distribution(emissions.row(i).transpose(), "emissions of " + states[i], tolerance);
  }
}

HMM::HMM(HMMParameters _params) {
  set_hidden_states(_params.states);
  set_initial_p(_params.initial);
  set_emissions(_params.symbols, _params.emissions);
  set_transitions(_params.transitions);
}

void HMM::set_hidden_states(std::vector<std::string> states) {
  if (states.empty()) {
    throw std::runtime_error("HMM needs at least one hidden state");
  }
  params.states = states;
}

void HMM::set_initial_p(Eigen::VectorXd initial) {
  params.initial = initial;
}

void HMM::set_emissions(std::vector<std::string> symbols, Eigen::MatrixXd emissions) {
  if (observations_set) {
    throw std::runtime_error("Emissions must be set before observations");
  }
  if (static_cast<Eigen::Index>(symbols.size()) != emissions.cols()) {
    throw std::runtime_error("Emission matrix has " + std::to_string(emissions.cols()) +
                             " columns for " + std::to_string(symbols.size()) + " symbols");
  }
  symbol_to_index.clear();
  for (std::size_t s = 0; s < symbols.size(); s++) {
    if (!symbol_to_index.emplace(symbols[s], static_cast<int>(s)).second) {
      throw std::runtime_error("Emission symbol " + symbols[s] + " is listed more than once");
    }
  }
  params.symbols = symbols;
  params.emissions = emissions;
}

void HMM::set_transitions(Eigen::MatrixXd transitions) {
  params.transitions = transitions;
}

void HMM::set_observations(const std::vector<std::string>& sequence) {
  if (params.symbols.empty()) {
    throw std::runtime_error("Emissions must be set before observations");
  }
  std::vector<int> coded;
  coded.reserve(sequence.size());
  for (std::size_t t = 0; t < sequence.size(); t++) {
    auto it = symbol_to_index.find(sequence[t]);
    if (it == symbol_to_index.end()) {
      throw std::runtime_error("Observation '" + sequence[t] + "' at site " + std::to_string(t) +
                               " is not an emission symbol");
    }
    coded.push_back(it->second);
  }
  observations = std::move(coded);
  observations_set = true;
}

void HMM::check_ready() const {
  params.validate(1e-6);
  if (!observations_set) {
    throw std::runtime_error("HMM observations have not been set");
  }
}

double HMM::forward(Eigen::MatrixXd& alpha, Eigen::VectorXd& scales) const {
  const Eigen::Index T = static_cast<Eigen::Index>(observations.size());
  alpha.resize(T, params.num_states());
  scales.resize(T);

  double log_likelihood = 0.0;
  Eigen::RowVectorXd row;
  for (Eigen::Index t = 0; t < T; t++) {
    const auto emission = params.emissions.col(observations[t]).transpose();
    if (t == 0) {
      row = params.initial.transpose().cwiseProduct(emission);
    }
    else {
      row = (alpha.row(t - 1) * params.transitions).cwiseProduct(emission);
    }
    const double c = row.sum();
    if (!(c > 0.0) || !std::isfinite(c)) {
      throw std::runtime_error("Observation at site " + std::to_string(t) +
                               " has zero probability under every state");
    }
    alpha.row(t) = row / c;
    scales(t) = c;
    log_likelihood += std::log(c);
  }
  return log_likelihood;
}

void HMM::backward(const Eigen::VectorXd& scales, Eigen::MatrixXd& beta) const {
  const Eigen::Index T = scales.size();
  beta.resize(T, params.num_states());
  if (T == 0) {
    return;
  }
  beta.row(T - 1).setOnes();
  for (Eigen::Index t = T - 2; t >= 0; t--) {
    Eigen::VectorXd next =
        params.emissions.col(observations[t + 1]).cwiseProduct(beta.row(t + 1).transpose());
    beta.row(t) = (params.transitions * next).transpose() / scales(t + 1);
  }
}

double HMM::log_likelihood() const {
  check_ready();
  Eigen::MatrixXd alpha;
  Eigen::VectorXd scales;
  return forward(alpha, scales);
}

Eigen::MatrixXd HMM::posterior_decoding() const {
  check_ready();
  Eigen::MatrixXd alpha;
  Eigen::MatrixXd beta;
  Eigen::VectorXd scales;
  forward(alpha, scales);
  backward(scales, beta);

  Eigen::MatrixXd gamma = alpha.cwiseProduct(beta);
  normalize_rows(gamma);
  return gamma;
}

// One expectation-maximization update. The new tables are built in a separate
// HMMParameters and swapped in at the end.
double HMM::baum_welch_step() {
  const int N = params.num_states();
  const int S = params.num_symbols();
  const Eigen::Index T = static_cast<Eigen::Index>(observations.size());

  Eigen::MatrixXd alpha;
  Eigen::MatrixXd beta;
  Eigen::VectorXd scales;
  const double ll = forward(alpha, scales);
  backward(scales, beta);

  Eigen::MatrixXd gamma = alpha.cwiseProduct(beta);
  normalize_rows(gamma);

  // Expected transition counts
  Eigen::MatrixXd xi_sum = Eigen::MatrixXd::Zero(N, N);
  for (Eigen::Index t = 0; t + 1 < T; t++) {
    Eigen::RowVectorXd right =
        params.emissions.col(observations[t + 1]).transpose().cwiseProduct(beta.row(t + 1)) /
        scales(t + 1);
    xi_sum += params.transitions.cwiseProduct(alpha.row(t).transpose() * right);
  }

  // Expected emission counts
  Eigen::MatrixXd counts = Eigen::MatrixXd::Zero(N, S);
  std::vector<bool> observed(S, false);
  for (Eigen::Index t = 0; t < T; t++) {
    counts.col(observations[t]) += gamma.row(t).transpose();
    observed[observations[t]] = true;
  }

  HMMParameters updated = params;
  updated.initial = gamma.row(0).transpose();

  for (int i = 0; i < N; i++) {
    const double total = xi_sum.row(i).sum();
    // A state never left keeps its previous row
    if (total > 0.0) {
      updated.transitions.row(i) = xi_sum.row(i) / total;
    }
  }

  for (int i = 0; i < N; i++) {
    const double occupancy = counts.row(i).sum();
    if (!(occupancy > 0.0)) {
      continue;
    }
    // Symbols absent from the sequence keep their current probability
    double unseen = 0.0;
    for (int s = 0; s < S; s++) {
      if (!observed[s]) {
        unseen += params.emissions(i, s);
      }
    }
    for (int s = 0; s < S; s++) {
      if (observed[s]) {
        updated.emissions(i, s) = (1.0 - unseen) * counts(i, s) / occupancy;
      }
    }
  }

  normalize_distribution(updated.initial);
  normalize_rows(updated.transitions);
  normalize_rows(updated.emissions);
  params = std::move(updated);
  return ll;
}

int HMM::train(const double convergence_threshold, const int max_iterations) {
  check_ready();
  log_likelihoods.clear();
  if (observations.empty()) {
    return 0;
  }

  int iterations = 0;
  bool converged = false;
  while (iterations < max_iterations && !converged) {
    const double ll = baum_welch_step();
    log_likelihoods.push_back(ll);
    iterations++;
    if (!quiet) {
      std::cout << "Baum-Welch iteration " << iterations << ", log-likelihood " << ll << "\n";
    }

    if (log_likelihoods.size() < 2) {
      continue;
    }
    const double previous = log_likelihoods[log_likelihoods.size() - 2];
    // A log-likelihood of zero cannot improve any further
    converged = previous == 0.0 || (ll - previous) / std::abs(previous) < convergence_threshold;
  }

  if (converged) {
    if (!quiet) {
      std::cout << "Baum-Welch converged after " << iterations << " iterations with log-likelihood "
                << log_likelihoods.back() << "\n";
    }
  }
  else {
    std::cerr << "Baum-Welch stopped after reaching the maximum of " << max_iterations
              << " iterations\n";
  }
  return iterations;
}

std::vector<int> HMM::viterbi() const {
  check_ready();
  const int num_states = params.num_states();
  const Eigen::Index T = static_cast<Eigen::Index>(observations.size());
  std::vector<int> z(T);
  if (T == 0) {
    return z;
  }

  const Eigen::MatrixXd log_trans = params.transitions.array().log().matrix();
  const Eigen::MatrixXd log_emis = params.emissions.array().log().matrix();
  const Eigen::VectorXd log_init = params.initial.array().log().matrix();

  Eigen::MatrixXd trellis(T, num_states);
  Eigen::MatrixXi pointers = Eigen::MatrixXi::Zero(T, num_states);

  // Initialize
  for (int i = 0; i < num_states; i++) {
    trellis(0, i) = log_init(i) + log_emis(i, observations[0]);
  }

  // Main routine
  for (Eigen::Index j = 1; j < T; j++) {
    for (int i = 0; i < num_states; i++) {
      double running_max = -std::numeric_limits<double>::infinity();
      int running_argmax = 0;
      for (int k = 0; k < num_states; k++) {
        const double score = trellis(j - 1, k) + log_trans(k, i);
        if (score > running_max || k == 0) {
          running_max = score;
          running_argmax = k;
        }
      }
      trellis(j, i) = running_max + log_emis(i, observations[j]);
      pointers(j, i) = running_argmax;
    }
  }

  // Get best path
  double running_max = trellis(T - 1, 0);
  int argmax = 0;
  for (int k = 1; k < num_states; k++) {
    if (trellis(T - 1, k) > running_max) {
      running_max = trellis(T - 1, k);
      argmax = k;
    }
  }

  // Traceback
  z[T - 1] = argmax;
  for (Eigen::Index j = T - 1; j >= 1; j--) {
    z[j - 1] = pointers(j, z[j]);
  }
  return z;
}
