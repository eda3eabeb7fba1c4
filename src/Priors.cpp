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

#include "Priors.hpp"

#include <cmath>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

StatePrior::StatePrior(std::string _name, double _expected_length, double _expected_fraction)
    : name(_name), expected_length(_expected_length), expected_fraction(_expected_fraction) {
}

Priors::Priors(std::string _reference, std::vector<StatePrior> _known,
               std::vector<StatePrior> _unknown)
    : reference(_reference), known(_known), unknown(_unknown) {
  if (reference.empty()) {
    throw std::runtime_error("Priors need a named reference state");
  }

  std::set<std::string> seen = {reference};
  double foreign_fraction = 0.0;
  std::vector<StatePrior> others = known;
  others.insert(others.end(), unknown.begin(), unknown.end());
  for (const auto& prior : others) {
    if (prior.name.empty()) {
      throw std::runtime_error("Found a state prior without a name");
    }
    if (!seen.insert(prior.name).second) {
      throw std::runtime_error("State " + prior.name + " is listed more than once");
    }
    if (!std::isfinite(prior.expected_length) || prior.expected_length <= 0.0) {
      std::ostringstream oss;
      oss << "State " << prior.name << " needs a strictly positive expected_length, found "
          << prior.expected_length;
      throw std::runtime_error(oss.str());
    }
    if (!std::isfinite(prior.expected_fraction) || prior.expected_fraction < 0.0 ||
        prior.expected_fraction > 1.0) {
      std::ostringstream oss;
      oss << "State " << prior.name << " needs an expected_fraction in [0, 1], found "
          << prior.expected_fraction;
      throw std::runtime_error(oss.str());
    }
    foreign_fraction += prior.expected_fraction;
  }

  if (foreign_fraction >= 1.0) {
    std::ostringstream oss;
    oss << "Expected fractions of non-reference states sum to " << foreign_fraction
        << ", must be below 1";
    throw std::runtime_error(oss.str());
  }

  // Baseline gets whatever the other states leave over
  fractions.push_back(1.0 - foreign_fraction);
  lengths.push_back(0.0);
  for (const auto& prior : others) {
    fractions.push_back(prior.expected_fraction);
    lengths.push_back(prior.expected_length);
  }

  // Unknown states look like the baseline when deriving its tract length
  reference_fraction = fractions[0];
  for (const auto& prior : unknown) {
    reference_fraction += prior.expected_fraction;
  }
  for (const auto& prior : known) {
    other_sum += prior.expected_fraction / prior.expected_length;
  }
}

void Priors::update_expected_length(const std::size_t total_length) {
  const double n = static_cast<double>(total_length);
  // +1 because there is one more baseline tract than foreign tracts
  lengths.at(0) = n * reference_fraction / (n * other_sum + 1.0);
}

std::vector<std::string> Priors::known_states() const {
  std::vector<std::string> result = {reference};
  for (const auto& prior : known) {
    result.push_back(prior.name);
  }
  return result;
}

std::vector<std::string> Priors::unknown_states() const {
  std::vector<std::string> result;
  for (const auto& prior : unknown) {
    result.push_back(prior.name);
  }
  return result;
}

std::vector<std::string> Priors::states() const {
  std::vector<std::string> result = known_states();
  for (const auto& prior : unknown) {
    result.push_back(prior.name);
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const Priors& priors) {
  const auto names = priors.states();
  for (std::size_t i = 0; i < names.size(); i++) {
    os << names[i] << " " << priors.lengths[i] << " " << priors.fractions[i] << "\n";
  }
  return os;
}
