#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ionkin {

struct State {
  std::string id;            // unique, e.g. "C", "O"
  std::string name;
  double conductance = 0.0;  // [nS]
};

struct RateFunctionSpec {
  std::string id;
  std::string equation;      // expression in V [mV]
};

struct Transition {
  std::string from_state;
  std::string to_state;
  std::string rate_function_id;
  double multiplier = 1.0;
};

// Channel topology. State order defines the state index; index 0 starts occupied.
struct ChannelModel {
  std::string channel_id;
  std::vector<State> states;
  std::vector<RateFunctionSpec> rate_functions;
  std::vector<Transition> transitions;
};

enum class StimulusVariable {
  voltage_mV,
  internal_K_mM,
  external_K_mM,
  volume_internal_L,
  volume_external_L
};

constexpr int kNumStimulusVariables = 5;

const char* to_string(StimulusVariable v);
std::optional<StimulusVariable> parse_stimulus_variable(const std::string& name);

struct HoldingValues {
  double voltage_mV = 0.0;
  double internal_K_mM = 0.0;
  double external_K_mM = 0.0;
  std::optional<double> volume_internal_L;  // [L], default kDefaultVolumeInternal_L
  std::optional<double> volume_external_L;  // [L], default kDefaultVolumeExternal_L
};

struct Epoch {
  std::string variable;       // one of the HoldingValues names
  double start_time_ms = 0.0;
  double duration_ms = 0.0;
  double value = 0.0;

  double end_time_ms() const { return start_time_ms + duration_ms; }
};

struct StimulusProtocol {
  std::string protocol_id;
  HoldingValues holding_values;
  std::vector<Epoch> epochs;
};

} // namespace ionkin
