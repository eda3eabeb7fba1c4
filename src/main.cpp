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
#include "PredictorConfig.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
  std::string config_file;
  po::options_description generic("Generic options");
  // clang-format off
  generic.add_options()
    ("help,h", "Produce help message")
    ("config,c", po::value<std::string>(&config_file), "INI configuration file; command line values take precedence");
  // clang-format on
  po::options_description prediction = predictor_options();
  po::options_description visible("Allowed options");
  visible.add(generic).add(prediction);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, visible), vm);
    if (vm.count("help")) {
      std::cout << "Usage: introgress_predict [--config file.ini] [options]\n" << visible << std::endl;
      return EXIT_SUCCESS;
    }
    po::notify(vm);

    if (!config_file.empty()) {
      std::ifstream ini(config_file);
      if (!ini.is_open()) {
        std::cerr << "ERROR: Unable to open configuration file " << config_file << std::endl;
        return EXIT_FAILURE;
      }
      // Values already stored from the command line are not overwritten
      po::store(po::parse_config_file(ini, prediction), vm);
      po::notify(vm);
    }
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  PredictorConfig config;
  try {
    config = parse_config(vm);
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << "Running prediction for " << config.strains.size() << " strains on "
            << config.chromosomes.size() << " chromosomes\n"
            << config.priors << std::endl;

  int failures = 0;
  try {
    Predictor predictor(config);
    failures = predictor.run_prediction();
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  if (failures > 0) {
    std::cerr << failures << " strain and chromosome combinations failed" << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "Done." << std::endl;
  return EXIT_SUCCESS;
}
