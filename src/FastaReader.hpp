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

#ifndef INTROGRESS_HMM_FASTA_READER_HPP
#define INTROGRESS_HMM_FASTA_READER_HPP

#include <istream>
#include <string>
#include <vector>

/// Headers and sequences of a (multi-)FASTA file, as parallel lists
class FastaRecords {
public:
  std::vector<std::string> headers;
  std::vector<std::string> sequences;

  std::size_t size() const { return sequences.size(); }
};

/// Read a FASTA file. Lines before the first header are ignored, header lines are kept
/// verbatim and sequence lines are concatenated.
FastaRecords read_fasta(const std::string& filename);
FastaRecords read_fasta(std::istream& input);

#endif // INTROGRESS_HMM_FASTA_READER_HPP
