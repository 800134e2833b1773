#pragma once

#include <ionkin/observables.hpp>
#include <ionkin/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ionkin {

// A simulation request document:
//   { "model": {...}, "protocol": {...}, "duration_ms": 500, "steps": 1000 }
// duration_ms / steps may be omitted when the run config supplies them.
struct SimulationRequest {
  ChannelModel model;
  StimulusProtocol protocol;
  std::optional<double> duration_ms;
  std::optional<std::size_t> steps;
};

// JSON ingestion. Shape problems (missing keys, wrong JSON types) are collected with
// their JSON path and thrown together as one ValidationError; syntax errors and
// unreadable files throw std::runtime_error. Referential checks are validate.hpp's job.
ChannelModel parse_model_json(const std::string& text);
StimulusProtocol parse_protocol_json(const std::string& text);
SimulationRequest parse_request_json(const std::string& text);

ChannelModel read_model_file(const std::string& path);
StimulusProtocol read_protocol_file(const std::string& path);
SimulationRequest read_request_file(const std::string& path);

std::string read_text_file(const std::string& path);

// Full result document with the trace names used by the request format's consumers:
// time_ms, voltage_mV, probabilities [state][sample], total_conductance_nS,
// total_current_pA, internal_K_mM, external_K_mM, nernst_potential_mV, state_map.
std::string results_to_json(const SimulationResult& result,
                            const std::map<std::string, std::string>& summary = {},
                            bool pretty = false);

void ensure_dir(const std::string& path);

// Write <output_dir>/results.json.
void write_results_json(const std::string& output_dir,
                        const SimulationResult& result,
                        const std::map<std::string, std::string>& summary);

// Write a whitespace table with optional header lines beginning with '#'.
void write_table(const std::string& path,
                 const std::vector<std::string>& columns,
                 const std::vector<std::vector<double>>& data_columns,
                 const std::string& header_comment = "");

// <output_dir>/timeseries.dat, one row per sample, one P_<id> column per state.
void write_timeseries_table(const std::string& output_dir, const SimulationResult& result);

// Copy a file (overwrites).
void copy_file(const std::string& src, const std::string& dst);

} // namespace ionkin
