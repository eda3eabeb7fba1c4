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

#ifndef INTROGRESS_HMM_DECODER_HPP
#define INTROGRESS_HMM_DECODER_HPP

#include "HMM.hpp"

#include <Eigen/Core>

#include <map>
#include <optional>
#include <string>
#include <vector>

/// Maximal run of sites with the same state, in coded-sequence index space
class Block {
public:
  Block(int _start, int _end);

  int num_sites_hmm() const { return end - start + 1; }

public:
  int start = 0;
  int end = 0; ///< Inclusive
};

/// Most probable state at each site, ties go to the lower index
std::vector<int> max_path(const Eigen::MatrixXd& posteriors, std::vector<double>& path_probs);

/// Keep the most probable state where its posterior exceeds `threshold`, otherwise
/// fall back to `baseline`
std::vector<int> threshold_predicted(const std::vector<int>& path,
                                     const std::vector<double>& path_probs, double threshold,
                                     int baseline = 0);

/// Turns an HMM into per-site labels and labelled blocks
class Decoder {
public:
  /// Without a threshold the Viterbi path is used
  Decoder(std::vector<std::string> _states, std::optional<double> _threshold);

  /// State index per site. `posteriors` receives the forward-backward marginals.
  std::vector<int> process_path(const HMM& hmm, Eigen::MatrixXd& posteriors) const;

  std::vector<int> threshold_posteriors(const Eigen::MatrixXd& posteriors) const;

  /// Blocks keyed by state name, every state present even without blocks
  std::map<std::string, std::vector<Block>> convert_to_blocks(const std::vector<int>& path) const;

public:
  std::vector<std::string> states;
  std::optional<double> threshold;
};

#endif // INTROGRESS_HMM_DECODER_HPP
