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

#ifndef INTROGRESS_HMM_PREDICTION_WRITER_HPP
#define INTROGRESS_HMM_PREDICTION_WRITER_HPP

#include "Decoder.hpp"
#include "HMM.hpp"

#include <boost/iostreams/filtering_stream.hpp>
#include <Eigen/Core>

#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

/// Shortest decimal representation that reads back to the same double
std::string format_double(double value);

std::string hmm_header(const std::vector<std::string>& states,
                       const std::vector<std::string>& symbols);
/// Symbols missing from `params` are written as 0.0
std::string hmm_record(const HMMParameters& params, const std::vector<std::string>& symbols,
                       const std::string& strain, const std::string& chrom);

std::string blocks_header();
/// Block boundaries are mapped to genomic coordinates through `positions`
std::string blocks_record(const std::vector<Block>& blocks, const std::vector<int>& positions,
                          const std::string& strain, const std::string& chrom,
                          const std::string& state);

std::string positions_record(const std::vector<int>& positions, const std::string& strain,
                             const std::string& chrom);

std::string probabilities_record(const Eigen::MatrixXd& posteriors,
                                 const std::vector<std::string>& states,
                                 const std::string& strain, const std::string& chrom);

/// Output files of one prediction run. Each record is written with a single call once
/// the strain and chromosome it belongs to has been fully processed.
class PredictionWriter {
public:
  /// Empty `positions_file` disables the positions output
  PredictionWriter(const std::vector<std::string>& _states,
                   const std::vector<std::string>& _symbols, const std::string& hmm_initial_file,
                   const std::string& hmm_trained_file, const std::string& blocks_template,
                   const std::string& probabilities_file, const std::string& positions_file);
  ~PredictionWriter();

  void write_hmm_initial(const std::string& record);
  void write_hmm_trained(const std::string& record);
  void write_blocks(const std::string& state, const std::string& record);
  void write_positions(const std::string& record);
  void write_probabilities(const std::string& record);
  bool has_positions() const { return positions != nullptr; }

  /// Flush and close every file
  void close();

public:
  std::vector<std::string> states;
  std::vector<std::string> symbols;

private:
  std::unique_ptr<std::ofstream> hmm_initial;
  std::unique_ptr<std::ofstream> hmm_trained;
  std::map<std::string, std::unique_ptr<std::ofstream>> block_writers;
  std::unique_ptr<boost::iostreams::filtering_ostream> probabilities;
  std::unique_ptr<boost::iostreams::filtering_ostream> positions;
};

class BlockRecord {
public:
  std::string region_id; ///< Only set for labeled block files
  std::string state;
  int start = 0;
  int end = 0;
  int num_sites_hmm = 0;
};

/// Blocks keyed by strain, then chromosome. Labeled files carry a leading region id column.
std::map<std::string, std::map<std::string, std::vector<BlockRecord>>>
read_blocks(const std::string& filename, bool labeled = false);

/// Positions keyed by strain, then chromosome
std::map<std::string, std::map<std::string, std::vector<int>>>
read_positions(const std::string& filename);

#endif // INTROGRESS_HMM_PREDICTION_WRITER_HPP
