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

#ifndef INTROGRESS_HMM_PREDICTOR_HPP
#define INTROGRESS_HMM_PREDICTOR_HPP

#include "Decoder.hpp"
#include "FastaReader.hpp"
#include "HMM.hpp"
#include "PredictorConfig.hpp"
#include "SequenceEncoder.hpp"

#include <string>

/// Initial and trained model for one strain and chromosome
class HMMRun {
public:
  HMM initial;
  HMM trained;
  CodedSequence coded;
};

/// Runs the prediction over every configured chromosome and strain
class Predictor {
public:
  Predictor(PredictorConfig _config);

  std::string alignment_file(const std::string& strain, const std::string& chrom) const;

  /// Encode an alignment, build the starting HMM and train a copy of it
  HMMRun run_hmm(const FastaRecords& alignment) const;
  HMMRun run_hmm(const std::string& filename) const;

  /// Process every unit and write all outputs. Returns the number of units that failed.
  int run_prediction() const;

public:
  PredictorConfig config;
  SequenceEncoder encoder;
  Decoder decoder;
};

#endif // INTROGRESS_HMM_PREDICTOR_HPP
