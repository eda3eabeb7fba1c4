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

#include "Predictor.hpp"
#include "ParameterInitializer.hpp"
#include "PredictionWriter.hpp"

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

Predictor::Predictor(PredictorConfig _config)
    : config(_config), encoder(config.symbols),
      decoder(config.priors.states(), config.threshold) {
}

std::string Predictor::alignment_file(const std::string& strain, const std::string& chrom) const {
  return format_path(config.paths.alignment,
                     {{"prefix", config.prefix}, {"strain", strain}, {"chrom", chrom}});
}

HMMRun Predictor::run_hmm(const FastaRecords& alignment) const {
  const int expected = config.priors.num_known() + 1;
  if (static_cast<int>(alignment.size()) != expected) {
    throw std::runtime_error("Alignment has " + std::to_string(alignment.size()) +
                             " sequences, expected " + std::to_string(expected) +
                             " (one per known state and the predicted strain)");
  }
  EncodedAlignment encoded = encoder.encode_alignment(alignment, config.only_poly_sites);

  Priors priors = config.priors;
  priors.update_expected_length(encoded.total_length);
  ParameterInitializer initializer(priors, config.symbols);

  HMMRun run;
  run.coded = encoded.coded;
  run.trained = initializer.build_initial_hmm(encoded.coded.symbols);
  run.initial = run.trained;

  run.trained.set_observations(encoded.coded.symbols);
  run.trained.quiet = !config.verbose;
  run.trained.train(config.convergence_threshold, config.max_iterations);
  return run;
}

HMMRun Predictor::run_hmm(const std::string& filename) const {
  return run_hmm(read_fasta(filename));
}

int Predictor::run_prediction() const {
  const std::vector<std::string> states = config.priors.states();
  const std::vector<std::string> symbols =
      config.symbols.emission_symbols(config.priors.num_known());
  PredictionWriter writer(states, symbols, config.paths.hmm_initial, config.paths.hmm_trained,
                          config.paths.block_files, config.paths.probabilities,
                          config.paths.positions);

  int failures = 0;
  for (const auto& chrom : config.chromosomes) {
    for (const auto& strain : config.strains) {
      std::cout << "Working on strain " << strain << " chromosome " << chrom << std::endl;
      try {
        HMMRun run = run_hmm(alignment_file(strain, chrom));

        Eigen::MatrixXd posteriors;
        std::vector<int> path = decoder.process_path(run.trained, posteriors);
        std::map<std::string, std::vector<Block>> blocks = decoder.convert_to_blocks(path);

        // Everything is formatted before the first write so a failing unit leaves no
        // partial records behind
        const std::string initial_record = hmm_record(run.initial.params, symbols, strain, chrom);
        const std::string trained_record = hmm_record(run.trained.params, symbols, strain, chrom);
        const std::string positions = positions_record(run.coded.positions, strain, chrom);
        const std::string probabilities = probabilities_record(posteriors, states, strain, chrom);
        std::map<std::string, std::string> block_records;
        for (const auto& state : states) {
          block_records[state] =
              blocks_record(blocks[state], run.coded.positions, strain, chrom, state);
        }

        writer.write_hmm_initial(initial_record);
        writer.write_hmm_trained(trained_record);
        if (writer.has_positions()) {
          writer.write_positions(positions);
        }
        for (const auto& state : states) {
          writer.write_blocks(state, block_records[state]);
        }
        writer.write_probabilities(probabilities);
      }
      catch (const std::exception& e) {
        std::cerr << "Failed on strain " << strain << " chromosome " << chrom << ": " << e.what()
                  << std::endl;
        failures++;
        if (config.fail_fast) {
          throw;
        }
      }
    }
  }
  writer.close();
  return failures;
}
