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

#include "FastaReader.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

FastaRecords read_fasta(std::istream& input) {
  FastaRecords records;
  std::string line;
  while (std::getline(input, line)) {
    boost::algorithm::trim(line);
    if (!line.empty() && line[0] == '>') {
      records.headers.push_back(line);
      records.sequences.emplace_back();
    }
    else if (!records.sequences.empty()) {
      records.sequences.back() += line;
    }
  }

  if (records.headers.empty()) {
    throw std::runtime_error("No FASTA header found in input");
  }
  return records;
}

FastaRecords read_fasta(const std::string& filename) {
  std::ifstream input(filename);
  if (!input.is_open()) {
    throw std::runtime_error("Unable to open FASTA file " + filename);
  }
  try {
    return read_fasta(input);
  }
  catch (const std::runtime_error& e) {
    throw std::runtime_error(std::string(e.what()) + " " + filename);
  }
}
