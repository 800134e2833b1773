#include <ionkin/stimulus.hpp>

#include <ionkin/constants.hpp>

#include <algorithm>
#include <stdexcept>

namespace ionkin {

const char* to_string(StimulusVariable v) {
  switch (v) {
    case StimulusVariable::voltage_mV: return "voltage_mV";
    case StimulusVariable::internal_K_mM: return "internal_K_mM";
    case StimulusVariable::external_K_mM: return "external_K_mM";
    case StimulusVariable::volume_internal_L: return "volume_internal_L";
    case StimulusVariable::volume_external_L: return "volume_external_L";
  }
  return "unknown";
}

std::optional<StimulusVariable> parse_stimulus_variable(const std::string& name) {
  for (int i = 0; i < kNumStimulusVariables; ++i) {
    auto v = static_cast<StimulusVariable>(i);
    if (name == to_string(v)) return v;
  }
  return std::nullopt;
}

Stimulus::Stimulus(const StimulusProtocol& protocol) {
  const HoldingValues& h = protocol.holding_values;
  holding_[slot(StimulusVariable::voltage_mV)] = h.voltage_mV;
  holding_[slot(StimulusVariable::internal_K_mM)] = h.internal_K_mM;
  holding_[slot(StimulusVariable::external_K_mM)] = h.external_K_mM;
  holding_[slot(StimulusVariable::volume_internal_L)] =
      h.volume_internal_L.value_or(kDefaultVolumeInternal_L);
  holding_[slot(StimulusVariable::volume_external_L)] =
      h.volume_external_L.value_or(kDefaultVolumeExternal_L);

  for (const auto& ep : protocol.epochs) {
    auto var = parse_stimulus_variable(ep.variable);
    if (!var) {
      throw std::runtime_error("Stimulus: epoch targets unknown variable '" + ep.variable + "'");
    }
    overrides_[slot(*var)].push_back(Override{ep.start_time_ms, ep.end_time_ms(), ep.value});
  }
}

double Stimulus::value_at(StimulusVariable var, double t_ms) const {
  for (const auto& ov : overrides_[slot(var)]) {
    if (ov.start_ms <= t_ms && t_ms < ov.end_ms) return ov.value;
  }
  return holding_[slot(var)];
}

double Stimulus::value_at(const std::string& variable, double t_ms) const {
  auto var = parse_stimulus_variable(variable);
  if (!var) {
    throw std::runtime_error("Stimulus: unknown variable '" + variable + "'");
  }
  return value_at(*var, t_ms);
}

double Stimulus::holding(StimulusVariable var) const {
  return holding_[slot(var)];
}

std::vector<double> Stimulus::breakpoints_ms(StimulusVariable var, double t_end_ms) const {
  std::vector<double> out;
  for (const auto& ov : overrides_[slot(var)]) {
    for (double b : {ov.start_ms, ov.end_ms}) {
      if (b > 0.0 && b < t_end_ms) out.push_back(b);
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

} // namespace ionkin
