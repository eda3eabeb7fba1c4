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

#include "Decoder.hpp"
#include "FastaReader.hpp"
#include "HMM.hpp"
#include "ParameterInitializer.hpp"
#include "PredictionWriter.hpp"
#include "Priors.hpp"
#include "SequenceEncoder.hpp"
#include "SymbolTable.hpp"

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;
PYBIND11_MODULE(introgress_python_bindings, m) {
  py::class_<SymbolTable>(m, "SymbolTable")
      .def(py::init<>())
      .def(py::init<const std::map<std::string, std::string>&>(), "Initialize",
           py::arg("overrides"))
      .def("get", &SymbolTable::get, py::arg("name"))
      .def("set", &SymbolTable::set, py::arg("name"), py::arg("symbol"))
      .def("emission_symbols", &SymbolTable::emission_symbols, py::arg("repeats"))
      .def("all_match", &SymbolTable::all_match, py::arg("repeats"))
      .def_readonly("match", &SymbolTable::match)
      .def_readonly("mismatch", &SymbolTable::mismatch);

  py::class_<FastaRecords>(m, "FastaRecords")
      .def_readonly("headers", &FastaRecords::headers)
      .def_readonly("sequences", &FastaRecords::sequences);
  m.def("read_fasta", py::overload_cast<const std::string&>(&read_fasta), py::arg("filename"));

  py::class_<CodedSequence>(m, "CodedSequence")
      .def_readonly("symbols", &CodedSequence::symbols)
      .def_readonly("positions", &CodedSequence::positions)
      .def("size", &CodedSequence::size);

  py::class_<SequenceEncoder>(m, "SequenceEncoder")
      .def(py::init<SymbolTable>(), "Initialize", py::arg("symbols"))
      .def("ungap_and_code", &SequenceEncoder::ungap_and_code, py::arg("predicted"),
           py::arg("references"), py::arg("index_ref") = 0)
      .def("poly_sites", &SequenceEncoder::poly_sites, py::arg("coded"))
      .def("encode", &SequenceEncoder::encode, py::arg("predicted"), py::arg("references"),
           py::arg("only_poly_sites") = true);

  py::class_<StatePrior>(m, "StatePrior")
      .def(py::init<std::string, double, double>(), "Initialize", py::arg("name"),
           py::arg("expected_length"), py::arg("expected_fraction"))
      .def_readonly("name", &StatePrior::name)
      .def_readonly("expected_length", &StatePrior::expected_length)
      .def_readonly("expected_fraction", &StatePrior::expected_fraction);

  py::class_<Priors>(m, "Priors")
      .def(py::init<std::string, std::vector<StatePrior>, std::vector<StatePrior>>(),
           "Initialize", py::arg("reference"), py::arg("known"), py::arg("unknown"))
      .def("update_expected_length", &Priors::update_expected_length, py::arg("total_length"))
      .def("states", &Priors::states)
      .def("known_states", &Priors::known_states)
      .def_readonly("fractions", &Priors::fractions)
      .def_readonly("lengths", &Priors::lengths)
      .def_readonly("reference_fraction", &Priors::reference_fraction)
      .def_readonly("other_sum", &Priors::other_sum);

  py::class_<HMMParameters>(m, "HMMParameters")
      .def_readonly("states", &HMMParameters::states)
      .def_readonly("symbols", &HMMParameters::symbols)
      .def_readonly("initial", &HMMParameters::initial)
      .def_readonly("emissions", &HMMParameters::emissions)
      .def_readonly("transitions", &HMMParameters::transitions);

  py::class_<ParameterInitializer>(m, "ParameterInitializer")
      .def(py::init<Priors, SymbolTable>(), "Initialize", py::arg("priors"), py::arg("symbols"))
      .def("initial_probabilities", &ParameterInitializer::initial_probabilities,
           py::arg("weighted_matches"))
      .def("emission_probabilities", &ParameterInitializer::emission_probabilities)
      .def("transition_probabilities", &ParameterInitializer::transition_probabilities)
      .def("initial_parameters", &ParameterInitializer::initial_parameters, py::arg("sequence"))
      .def("build_initial_hmm", &ParameterInitializer::build_initial_hmm, py::arg("sequence"));

  py::class_<HMM>(m, "HMM")
      .def(py::init<>())
      .def(py::init<HMMParameters>(), "Initialize", py::arg("params"))
      .def("set_hidden_states", &HMM::set_hidden_states, py::arg("states"))
      .def("set_initial_p", &HMM::set_initial_p, py::arg("initial"))
      .def("set_emissions", &HMM::set_emissions, py::arg("symbols"), py::arg("emissions"))
      .def("set_transitions", &HMM::set_transitions, py::arg("transitions"))
      .def("set_observations", &HMM::set_observations, py::arg("sequence"))
      .def("train", &HMM::train, py::arg("convergence_threshold"),
           py::arg("max_iterations") = 1000)
      .def("log_likelihood", &HMM::log_likelihood)
      .def("posterior_decoding", &HMM::posterior_decoding)
      .def("viterbi", &HMM::viterbi)
      .def_readonly("params", &HMM::params)
      .def_readonly("log_likelihoods", &HMM::log_likelihoods)
      .def_readwrite("quiet", &HMM::quiet);

  py::class_<Block>(m, "Block")
      .def(py::init<int, int>(), "Initialize", py::arg("start"), py::arg("end"))
      .def_readonly("start", &Block::start)
      .def_readonly("end", &Block::end)
      .def("num_sites_hmm", &Block::num_sites_hmm);

  py::class_<Decoder>(m, "Decoder")
      .def(py::init<std::vector<std::string>, std::optional<double>>(), "Initialize",
           py::arg("states"), py::arg("threshold") = py::none())
      .def("threshold_posteriors", &Decoder::threshold_posteriors, py::arg("posteriors"))
      .def("convert_to_blocks", &Decoder::convert_to_blocks, py::arg("path"));

  m.def("max_path", [](const Eigen::MatrixXd& posteriors) {
    std::vector<double> path_probs;
    std::vector<int> path = max_path(posteriors, path_probs);
    return py::make_tuple(path, path_probs);
  }, py::arg("posteriors"));
  m.def("threshold_predicted", &threshold_predicted, py::arg("path"), py::arg("path_probs"),
        py::arg("threshold"), py::arg("baseline") = 0);
  m.def("read_positions", &read_positions, py::arg("filename"));
}
