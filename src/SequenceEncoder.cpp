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

#include "SequenceEncoder.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

SequenceEncoder::SequenceEncoder(SymbolTable _symbols) : symbols(_symbols) {
}

CodedSequence SequenceEncoder::ungap_and_code(const std::string& predicted,
                                              const std::vector<std::string>& references,
                                              const int index_ref) const {
  if (references.empty()) {
    throw std::runtime_error("Need at least one reference sequence to encode an alignment");
  }
  if (index_ref < 0 || index_ref >= static_cast<int>(references.size())) {
    throw std::runtime_error("Index reference " + std::to_string(index_ref) +
                             " out of range for " + std::to_string(references.size()) +
                             " references");
  }
  for (std::size_t r = 0; r < references.size(); r++) {
    if (references[r].size() != predicted.size()) {
      std::ostringstream oss;
      oss << "Sequence length mismatch in alignment: reference " << r << " has length "
          << references[r].size() << " but predicted sequence has length " << predicted.size();
      throw std::runtime_error(oss.str());
    }
  }

  auto is_valid = [this](char c) { return c != symbols.gap && c != symbols.unsequenced; };

  CodedSequence coded;
  const std::string& index_seq = references[index_ref];
  int ref_position = 0;
  for (std::size_t c = 0; c < predicted.size(); c++) {
    bool valid = is_valid(predicted[c]);
    for (std::size_t r = 0; r < references.size() && valid; r++) {
      valid = is_valid(references[r][c]);
    }

    if (valid) {
      std::string symbol(references.size(), symbols.mismatch);
      for (std::size_t r = 0; r < references.size(); r++) {
        if (references[r][c] == predicted[c]) {
          symbol[r] = symbols.match;
        }
      }
      coded.symbols.push_back(symbol);
      coded.positions.push_back(ref_position);
    }

    if (index_seq[c] != symbols.gap) {
      ref_position++;
    }
  }
  return coded;
}

CodedSequence SequenceEncoder::poly_sites(const CodedSequence& coded) const {
  CodedSequence filtered;
  for (std::size_t i = 0; i < coded.size(); i++) {
    const std::string& s = coded.symbols[i];
    if (s.find_first_not_of(symbols.match) != std::string::npos) {
      filtered.symbols.push_back(s);
      filtered.positions.push_back(coded.positions.at(i));
    }
  }
  return filtered;
}

CodedSequence SequenceEncoder::encode(const std::string& predicted,
                                      const std::vector<std::string>& references,
                                      const bool only_poly_sites) const {
  CodedSequence coded = ungap_and_code(predicted, references);
  if (only_poly_sites) {
    return poly_sites(coded);
  }
  return coded;
}

EncodedAlignment SequenceEncoder::encode_alignment(const FastaRecords& alignment,
                                                   const bool only_poly_sites) const {
  if (alignment.size() < 2) {
    throw std::runtime_error("Alignment needs at least one reference and a predicted strain, found " +
                             std::to_string(alignment.size()) + " sequences");
  }
  const std::string& predicted = alignment.sequences.back();
  std::vector<std::string> references(alignment.sequences.begin(),
                                      alignment.sequences.end() - 1);

  EncodedAlignment result;
  result.coded = encode(predicted, references, only_poly_sites);
  result.total_length = predicted.size();
  return result;
}
