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

#include "Decoder.hpp"

#include <stdexcept>
#include <string>
#include <vector>

Block::Block(int _start, int _end) : start(_start), end(_end) {
}

std::vector<int> max_path(const Eigen::MatrixXd& posteriors, std::vector<double>& path_probs) {
  std::vector<int> path(posteriors.rows());
  path_probs.assign(posteriors.rows(), 0.0);
  for (Eigen::Index t = 0; t < posteriors.rows(); t++) {
    int argmax = 0;
    for (Eigen::Index k = 1; k < posteriors.cols(); k++) {
      if (posteriors(t, k) > posteriors(t, argmax)) {
        argmax = static_cast<int>(k);
      }
    }
    path[t] = argmax;
    path_probs[t] = posteriors.cols() > 0 ? posteriors(t, argmax) : 0.0;
  }
  return path;
}

std::vector<int> threshold_predicted(const std::vector<int>& path,
                                     const std::vector<double>& path_probs, const double threshold,
                                     const int baseline) {
  if (path.size() != path_probs.size()) {
    throw std::runtime_error("Path has " + std::to_string(path.size()) + " sites but " +
                             std::to_string(path_probs.size()) + " probabilities");
  }
  std::vector<int> result(path.size());
  for (std::size_t t = 0; t < path.size(); t++) {
    // Exactly at the threshold counts as not exceeding it
    result[t] = path_probs[t] > threshold ? path[t] : baseline;
  }
  return result;
}

Decoder::Decoder(std::vector<std::string> _states, std::optional<double> _threshold)
    : states(_states), threshold(_threshold) {
  if (states.empty()) {
    throw std::runtime_error("Decoder needs at least one state");
  }
}

std::vector<int> Decoder::threshold_posteriors(const Eigen::MatrixXd& posteriors) const {
  if (!threshold.has_value()) {
    throw std::runtime_error("Decoder has no posterior threshold, it uses the Viterbi path");
  }
  std::vector<double> path_probs;
  std::vector<int> path = max_path(posteriors, path_probs);
  return threshold_predicted(path, path_probs, *threshold, 0);
}

std::vector<int> Decoder::process_path(const HMM& hmm, Eigen::MatrixXd& posteriors) const {
  posteriors = hmm.posterior_decoding();
  if (threshold.has_value()) {
    return threshold_posteriors(posteriors);
  }
  return hmm.viterbi();
}

std::map<std::string, std::vector<Block>>
Decoder::convert_to_blocks(const std::vector<int>& path) const {
  std::map<std::string, std::vector<Block>> blocks;
  for (const auto& state : states) {
    blocks[state];
  }
  if (path.empty()) {
    return blocks;
  }

  const int num_states = static_cast<int>(states.size());
  int block_start = 0;
  for (int i = 1; i <= static_cast<int>(path.size()); i++) {
    if (i < static_cast<int>(path.size()) && path[i] == path[block_start]) {
      continue;
    }
    const int state = path[block_start];
    if (state < 0 || state >= num_states) {
      throw std::runtime_error("Invalid state index " + std::to_string(state) + " at site " +
                               std::to_string(block_start));
    }
    blocks[states[state]].emplace_back(block_start, i - 1);
    block_start = i;
  }
  return blocks;
}
