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

#ifndef INTROGRESS_HMM_SYMBOL_TABLE_HPP
#define INTROGRESS_HMM_SYMBOL_TABLE_HPP

#include <map>
#include <string>
#include <vector>

/// Characters used to read alignments and to write coded sequences.
/// Defaults can be overridden per instance, e.g. from the configuration file.
class SymbolTable {
public:
  SymbolTable() = default;
  SymbolTable(const std::map<std::string, std::string>& overrides);

  /// Look up a symbol by its configuration name ("match", "gap", ...)
  char get(const std::string& name) const;
  void set(const std::string& name, char symbol);

  /// All strings of length `repeats` over {match, mismatch}, sorted
  std::vector<std::string> emission_symbols(int repeats) const;

  /// The symbol of a site where every reference agrees with the predicted strain
  std::string all_match(int repeats) const;

  static const std::vector<std::string>& names();

public:
  char match = '+';
  char mismatch = '-';
  char unknown = '?';
  char unsequenced = 'n';
  char gap = '-';
  char unaligned = '?';
  char masked = 'x';
};

#endif // INTROGRESS_HMM_SYMBOL_TABLE_HPP
