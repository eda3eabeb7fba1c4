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

#ifndef INTROGRESS_HMM_SEQUENCE_ENCODER_HPP
#define INTROGRESS_HMM_SEQUENCE_ENCODER_HPP

#include "FastaReader.hpp"
#include "SymbolTable.hpp"

#include <string>
#include <vector>

/// Match/mismatch symbols of the retained alignment columns together with the
/// coordinate of each column in the index reference.
class CodedSequence {
public:
  std::vector<std::string> symbols;
  std::vector<int> positions;

  std::size_t size() const { return symbols.size(); }
  bool empty() const { return symbols.empty(); }
};

class EncodedAlignment {
public:
  CodedSequence coded;
  std::size_t total_length = 0; ///< Length of the predicted sequence, gaps included
};

/// Turns a multi-way alignment (references + one predicted strain) into a coded
/// observation sequence for the HMM
class SequenceEncoder {
public:
  SequenceEncoder(SymbolTable _symbols);
  SequenceEncoder() = default;

  /// Drop columns where any sequence is gapped or unsequenced and code each reference
  /// as match/mismatch against the predicted base. Positions count the non-gap bases of
  /// `references[index_ref]`.
  CodedSequence ungap_and_code(const std::string& predicted,
                               const std::vector<std::string>& references,
                               int index_ref = 0) const;

  /// Remove sites at which the predicted strain matches every reference
  CodedSequence poly_sites(const CodedSequence& coded) const;

  CodedSequence encode(const std::string& predicted, const std::vector<std::string>& references,
                       bool only_poly_sites = true) const;

  /// The predicted strain is the last record, references precede it in state order
  EncodedAlignment encode_alignment(const FastaRecords& alignment,
                                    bool only_poly_sites = true) const;

public:
  SymbolTable symbols;
};

#endif // INTROGRESS_HMM_SEQUENCE_ENCODER_HPP
