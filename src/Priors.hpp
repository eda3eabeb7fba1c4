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

#ifndef INTROGRESS_HMM_PRIORS_HPP
#define INTROGRESS_HMM_PRIORS_HPP

#include <iostream>
#include <string>
#include <vector>

/// User-specified expectation for one non-baseline state
class StatePrior {
public:
  StatePrior(std::string _name, double _expected_length, double _expected_fraction);

public:
  std::string name;
  double expected_length = 0.0;   ///< Mean tract length, in sites
  double expected_fraction = 0.0; ///< Expected share of the genome
};

/// Expected tract lengths and genome fractions for every HMM state. The baseline
/// (reference) state comes first and its values are derived from the others.
class Priors {
public:
  Priors(std::string _reference, std::vector<StatePrior> _known, std::vector<StatePrior> _unknown);
  Priors() = default;

  /// Derive the baseline tract length for a sequence of `total_length` sites, assuming
  /// the sequence starts and ends in the baseline state
  void update_expected_length(std::size_t total_length);

  /// Reference first, then the other states that have a reference sequence
  std::vector<std::string> known_states() const;
  std::vector<std::string> unknown_states() const;
  std::vector<std::string> states() const;

  int num_known() const { return static_cast<int>(known.size()) + 1; }
  int num_states() const { return num_known() + static_cast<int>(unknown.size()); }

  friend std::ostream& operator<<(std::ostream& os, const Priors& priors);

public:
  std::string reference;
  std::vector<StatePrior> known;   ///< Non-reference known states, in alignment order
  std::vector<StatePrior> unknown; ///< States without a reference sequence
  std::vector<double> fractions;   ///< Per state, in states() order
  std::vector<double> lengths;     ///< Per state, lengths[0] is derived
  double reference_fraction = 0.0; ///< Baseline fraction with unknown states folded in
  double other_sum = 0.0;          ///< Sum of fraction / length over non-baseline known states
};

#endif // INTROGRESS_HMM_PRIORS_HPP
