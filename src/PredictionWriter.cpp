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

#include "PredictionWriter.hpp"
#include "PredictorConfig.hpp"

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/lexical_cast.hpp>

#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace io = boost::iostreams;

namespace {

std::unique_ptr<std::ofstream> open_text(const std::string& filename) {
  auto out = std::make_unique<std::ofstream>(filename);
  if (!out->is_open()) {
    throw std::runtime_error("Unable to open output file " + filename);
  }
  return out;
}

std::unique_ptr<io::filtering_ostream> open_gzip(const std::string& filename) {
  io::file_sink sink(filename, std::ios_base::out | std::ios_base::binary);
  if (!sink.is_open()) {
    throw std::runtime_error("Unable to open output file " + filename);
  }
  auto out = std::make_unique<io::filtering_ostream>();
  out->push(io::gzip_compressor());
  out->push(sink);
  return out;
}

void write_record(std::ostream& out, const std::string& record, const std::string& what) {
  out << record;
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed writing " + what + " record");
  }
}

} // namespace

std::string format_double(const double value) {
  std::array<char, 32> buffer;
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    throw std::runtime_error("Unable to format floating point value");
  }
  std::string result(buffer.data(), ptr);
  if (result.find_first_not_of("-0123456789") == std::string::npos) {
    result += ".0";
  }
  return result;
}

std::string hmm_header(const std::vector<std::string>& states,
                       const std::vector<std::string>& symbols) {
  std::ostringstream oss;
  oss << "strain\tchromosome";
  for (const auto& s : states) {
    oss << "\tinit_" << s;
  }
  for (const auto& s : states) {
    for (const auto& symbol : symbols) {
      oss << "\temis_" << s << "_" << symbol;
    }
  }
  for (const auto& s1 : states) {
    for (const auto& s2 : states) {
      oss << "\ttrans_" << s1 << "_" << s2;
    }
  }
  oss << "\n";
  return oss.str();
}

std::string hmm_record(const HMMParameters& params, const std::vector<std::string>& symbols,
                       const std::string& strain, const std::string& chrom) {
  std::map<std::string, int> symbol_index;
  for (int s = 0; s < params.num_symbols(); s++) {
    symbol_index[params.symbols[s]] = s;
  }

  const int n = params.num_states();
  std::ostringstream oss;
  oss << strain << "\t" << chrom;
  for (int i = 0; i < n; i++) {
    oss << "\t" << format_double(params.initial(i));
  }
  for (int i = 0; i < n; i++) {
    for (const auto& symbol : symbols) {
      auto it = symbol_index.find(symbol);
      oss << "\t" << (it == symbol_index.end() ? "0.0" : format_double(params.emissions(i, it->second)));
    }
  }
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) {
      oss << "\t" << format_double(params.transitions(i, j));
    }
  }
  oss << "\n";
  return oss.str();
}

std::string blocks_header() {
  // num_sites_hmm counts the sites the HMM saw, so gaps and (optionally) sites
  // without polymorphism are excluded
  return "strain\tchromosome\tpredicted_species\tstart\tend\tnum_sites_hmm\n";
}

std::string blocks_record(const std::vector<Block>& blocks, const std::vector<int>& positions,
                          const std::string& strain, const std::string& chrom,
                          const std::string& state) {
  std::ostringstream oss;
  for (const auto& block : blocks) {
    oss << strain << "\t" << chrom << "\t" << state << "\t" << positions.at(block.start) << "\t"
        << positions.at(block.end) << "\t" << block.num_sites_hmm() << "\n";
  }
  return oss.str();
}

std::string positions_record(const std::vector<int>& positions, const std::string& strain,
                             const std::string& chrom) {
  std::ostringstream oss;
  oss << strain << "\t" << chrom;
  for (int p : positions) {
    oss << "\t" << p;
  }
  oss << "\n";
  return oss.str();
}

std::string probabilities_record(const Eigen::MatrixXd& posteriors,
                                 const std::vector<std::string>& states,
                                 const std::string& strain, const std::string& chrom) {
  if (posteriors.rows() > 0 && posteriors.cols() != static_cast<Eigen::Index>(states.size())) {
    throw std::runtime_error("Posterior matrix has " + std::to_string(posteriors.cols()) +
                             " columns for " + std::to_string(states.size()) + " states");
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(5);
  oss << strain << "\t" << chrom;
  for (std::size_t i = 0; i < states.size(); i++) {
    oss << "\t" << states[i] << ":";
    for (Eigen::Index t = 0; t < posteriors.rows(); t++) {
      if (t > 0) {
        oss << ",";
      }
      oss << posteriors(t, static_cast<Eigen::Index>(i));
    }
  }
  oss << "\n";
  return oss.str();
}

PredictionWriter::PredictionWriter(const std::vector<std::string>& _states,
                                   const std::vector<std::string>& _symbols,
                                   const std::string& hmm_initial_file,
                                   const std::string& hmm_trained_file,
                                   const std::string& blocks_template,
                                   const std::string& probabilities_file,
                                   const std::string& positions_file)
    : states(_states), symbols(_symbols) {
  hmm_initial = open_text(hmm_initial_file);
  hmm_trained = open_text(hmm_trained_file);
  write_record(*hmm_initial, hmm_header(states, symbols), "HMM header");
  write_record(*hmm_trained, hmm_header(states, symbols), "HMM header");

  probabilities = open_gzip(probabilities_file);
  if (!positions_file.empty()) {
    positions = open_gzip(positions_file);
  }

  for (const auto& state : states) {
    auto writer = open_text(format_path(blocks_template, {{"state", state}}));
    write_record(*writer, blocks_header(), "blocks header");
    block_writers[state] = std::move(writer);
  }
}

PredictionWriter::~PredictionWriter() {
  try {
    close();
  }
  catch (const std::exception& e) {
    std::cerr << "Error closing prediction output: " << e.what() << "\n";
  }
}

void PredictionWriter::write_hmm_initial(const std::string& record) {
  write_record(*hmm_initial, record, "initial HMM");
}

void PredictionWriter::write_hmm_trained(const std::string& record) {
  write_record(*hmm_trained, record, "trained HMM");
}

void PredictionWriter::write_blocks(const std::string& state, const std::string& record) {
  auto it = block_writers.find(state);
  if (it == block_writers.end()) {
    throw std::runtime_error("No block file for state " + state);
  }
  if (!record.empty()) {
    write_record(*it->second, record, "blocks");
  }
}

void PredictionWriter::write_positions(const std::string& record) {
  if (positions == nullptr) {
    throw std::runtime_error("No positions file configured");
  }
  write_record(*positions, record, "positions");
}

void PredictionWriter::write_probabilities(const std::string& record) {
  write_record(*probabilities, record, "probabilities");
}

void PredictionWriter::close() {
  if (hmm_initial != nullptr) {
    hmm_initial->close();
  }
  if (hmm_trained != nullptr) {
    hmm_trained->close();
  }
  for (auto& entry : block_writers) {
    entry.second->close();
  }
  // Resetting the chain writes the gzip trailer
  if (probabilities != nullptr) {
    probabilities->reset();
  }
  if (positions != nullptr) {
    positions->reset();
  }
}

std::map<std::string, std::map<std::string, std::vector<BlockRecord>>>
read_blocks(const std::string& filename, const bool labeled) {
  std::ifstream input(filename);
  if (!input.is_open()) {
    throw std::runtime_error("Unable to open block file " + filename);
  }

  std::map<std::string, std::map<std::string, std::vector<BlockRecord>>> result;
  std::string line;
  std::getline(input, line); // header
  int line_number = 1;
  while (std::getline(input, line)) {
    line_number++;
    if (line.empty()) {
      continue;
    }
    std::istringstream tokens(line);
    BlockRecord record;
    std::string strain;
    std::string chrom;
    std::string start;
    std::string end;
    std::string num_sites;
    if (labeled) {
      tokens >> record.region_id;
    }
    tokens >> strain >> chrom >> record.state >> start >> end >> num_sites;
    try {
      record.start = boost::lexical_cast<int>(start);
      record.end = boost::lexical_cast<int>(end);
      record.num_sites_hmm = boost::lexical_cast<int>(num_sites);
    }
    catch (const boost::bad_lexical_cast&) {
      throw std::runtime_error("Malformed block on line " + std::to_string(line_number) + " of " +
                               filename);
    }
    result[strain][chrom].push_back(record);
  }
  return result;
}

std::map<std::string, std::map<std::string, std::vector<int>>>
read_positions(const std::string& filename) {
  io::file_source source(filename, std::ios_base::in | std::ios_base::binary);
  if (!source.is_open()) {
    throw std::runtime_error("Unable to open positions file " + filename);
  }
  io::filtering_istream input;
  input.push(io::gzip_decompressor());
  input.push(source);

  std::map<std::string, std::map<std::string, std::vector<int>>> result;
  std::string line;
  while (std::getline(input, line)) {
    std::istringstream tokens(line);
    std::string strain;
    std::string chrom;
    if (!(tokens >> strain >> chrom)) {
      continue;
    }
    std::vector<int>& positions = result[strain][chrom];
    std::string value;
    while (tokens >> value) {
      try {
        positions.push_back(boost::lexical_cast<int>(value));
      }
      catch (const boost::bad_lexical_cast&) {
        throw std::runtime_error("Malformed position " + value + " in " + filename);
      }
    }
  }
  return result;
}
