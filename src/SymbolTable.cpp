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

#include "SymbolTable.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

SymbolTable::SymbolTable(const std::map<std::string, std::string>& overrides) {
  for (const auto& [name, value] : overrides) {
    const auto& known = names();
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      std::cerr << "Unused symbol in configuration: " << name << " -> '" << value << "'\n";
      continue;
    }
    if (value.size() != 1) {
      throw std::invalid_argument("Symbol for " + name + " must be a single character, found '" +
                                  value + "'");
    }
    set(name, value[0]);
  }

  if (match == mismatch) {
    throw std::invalid_argument("Match and mismatch symbols must differ, both are '" +
                                std::string(1, match) + "'");
  }
}

const std::vector<std::string>& SymbolTable::names() {
  static const std::vector<std::string> all_names = {
      "match", "mismatch", "unknown", "unsequenced", "gap", "unaligned", "masked"};
  return all_names;
}

char SymbolTable::get(const std::string& name) const {
  if (name == "match") return match;
  if (name == "mismatch") return mismatch;
  if (name == "unknown") return unknown;
  if (name == "unsequenced") return unsequenced;
  if (name == "gap") return gap;
  if (name == "unaligned") return unaligned;
  if (name == "masked") return masked;
  throw std::invalid_argument("Unknown symbol name " + name);
}

void SymbolTable::set(const std::string& name, char symbol) {
  if (name == "match") {
    match = symbol;
  }
  else if (name == "mismatch") {
    mismatch = symbol;
  }
  else if (name == "unknown") {
    unknown = symbol;
  }
  else if (name == "unsequenced") {
    unsequenced = symbol;
  }
  else if (name == "gap") {
    gap = symbol;
  }
  else if (name == "unaligned") {
    unaligned = symbol;
  }
  else if (name == "masked") {
    masked = symbol;
  }
  else {
    throw std::invalid_argument("Unknown symbol name " + name);
  }
}

std::vector<std::string> SymbolTable::emission_symbols(const int repeats) const {
  if (repeats < 0) {
    throw std::invalid_argument("Emission symbols need a non-negative length, found " +
                                std::to_string(repeats));
  }
  std::vector<std::string> symbols = {""};
  for (int i = 0; i < repeats; i++) {
    std::vector<std::string> extended;
    extended.reserve(symbols.size() * 2);
    for (const auto& s : symbols) {
      extended.push_back(s + match);
      extended.push_back(s + mismatch);
    }
    symbols = std::move(extended);
  }
  std::sort(symbols.begin(), symbols.end());
  return symbols;
}

std::string SymbolTable::all_match(const int repeats) const {
  return std::string(static_cast<std::size_t>(std::max(repeats, 0)), match);
}
