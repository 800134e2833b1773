#include <ionkin/validate.hpp>

#include <ionkin/errors.hpp>

#include <cmath>
#include <set>
#include <sstream>

namespace ionkin {

namespace {

std::string quoted(const std::string& s) {
  return "'" + s + "'";
}

std::string fmt(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

} // namespace

void ValidationReport::merge(const ValidationReport& other) {
  errors.insert(errors.end(), other.errors.begin(), other.errors.end());
  warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

ValidationReport validate_model(const ChannelModel& model) {
  ValidationReport r;

  if (model.channel_id.empty()) r.errors.push_back("channel_id must not be empty");
  if (model.states.empty()) r.errors.push_back("model must define at least one state");
  if (model.rate_functions.empty()) r.errors.push_back("model must define at least one rate function");

  std::set<std::string> state_ids;
  for (std::size_t i = 0; i < model.states.size(); ++i) {
    const State& s = model.states[i];
    const std::string where = "State " + std::to_string(i);
    if (s.id.empty()) r.errors.push_back(where + ": id must not be empty");
    if (s.name.empty()) r.errors.push_back(where + ": name must not be empty");
    if (!(s.conductance >= 0.0) || !std::isfinite(s.conductance)) {
      r.errors.push_back(where + ": conductance " + fmt(s.conductance) + " must be a finite value >= 0");
    }
    if (!s.id.empty() && !state_ids.insert(s.id).second) {
      r.errors.push_back(where + ": duplicate state id " + quoted(s.id));
    }
  }

  std::set<std::string> function_ids;
  for (std::size_t i = 0; i < model.rate_functions.size(); ++i) {
    const RateFunctionSpec& f = model.rate_functions[i];
    const std::string where = "Rate function " + std::to_string(i);
    if (f.id.empty()) r.errors.push_back(where + ": id must not be empty");
    if (f.equation.empty()) r.errors.push_back(where + ": equation must not be empty");
    if (!f.id.empty() && !function_ids.insert(f.id).second) {
      r.errors.push_back(where + ": duplicate function id " + quoted(f.id));
    }
  }

  for (std::size_t i = 0; i < model.transitions.size(); ++i) {
    const Transition& t = model.transitions[i];
    const std::string where = "Transition " + std::to_string(i);
    if (!state_ids.count(t.from_state)) {
      r.errors.push_back(where + ": 'from_state' " + quoted(t.from_state) + " is not a defined state id");
    }
    if (!state_ids.count(t.to_state)) {
      r.errors.push_back(where + ": 'to_state' " + quoted(t.to_state) + " is not a defined state id");
    }
    if (!function_ids.count(t.rate_function_id)) {
      r.errors.push_back(where + ": 'rate_function_id' " + quoted(t.rate_function_id) +
                         " is not a defined function id");
    }
    if (!(t.multiplier > 0.0) || !std::isfinite(t.multiplier)) {
      r.errors.push_back(where + ": multiplier " + fmt(t.multiplier) + " must be > 0");
    }
    if (t.from_state == t.to_state) {
      r.warnings.push_back(where + ": self-transition on " + quoted(t.from_state) + " has no effect");
    }
  }

  return r;
}

ValidationReport validate_protocol(const StimulusProtocol& protocol) {
  ValidationReport r;
  const HoldingValues& h = protocol.holding_values;

  if (protocol.protocol_id.empty()) r.errors.push_back("protocol_id must not be empty");
  if (!std::isfinite(h.voltage_mV)) r.errors.push_back("holding voltage_mV must be finite");
  if (!std::isfinite(h.internal_K_mM)) r.errors.push_back("holding internal_K_mM must be finite");
  if (!std::isfinite(h.external_K_mM)) r.errors.push_back("holding external_K_mM must be finite");
  if (h.volume_internal_L && !(*h.volume_internal_L > 0.0)) {
    r.errors.push_back("holding volume_internal_L " + fmt(*h.volume_internal_L) + " must be > 0");
  }
  if (h.volume_external_L && !(*h.volume_external_L > 0.0)) {
    r.errors.push_back("holding volume_external_L " + fmt(*h.volume_external_L) + " must be > 0");
  }

  for (std::size_t i = 0; i < protocol.epochs.size(); ++i) {
    const Epoch& e = protocol.epochs[i];
    const std::string where = "Epoch " + std::to_string(i);
    if (!parse_stimulus_variable(e.variable)) {
      r.errors.push_back(where + ": " + quoted(e.variable) +
                         " is not a valid variable. Must be one of voltage_mV, internal_K_mM, "
                         "external_K_mM, volume_internal_L, volume_external_L");
    }
    if (!(e.start_time_ms >= 0.0)) {
      r.errors.push_back(where + ": start_time_ms " + fmt(e.start_time_ms) + " must be >= 0");
    }
    if (!(e.duration_ms > 0.0)) {
      r.errors.push_back(where + ": duration_ms " + fmt(e.duration_ms) + " must be > 0");
    }
    if (!std::isfinite(e.value)) r.errors.push_back(where + ": value must be finite");
    if ((e.variable == "volume_internal_L" || e.variable == "volume_external_L") && !(e.value > 0.0)) {
      r.errors.push_back(where + ": volume override " + fmt(e.value) + " must be > 0");
    }

    for (std::size_t j = 0; j < i; ++j) {
      const Epoch& p = protocol.epochs[j];
      if (p.variable != e.variable) continue;
      if (e.start_time_ms < p.end_time_ms() && p.start_time_ms < e.end_time_ms()) {
        r.warnings.push_back(where + " overlaps epoch " + std::to_string(j) + " on " + quoted(e.variable) +
                             "; epoch " + std::to_string(j) + " takes precedence");
      }
    }
  }

  return r;
}

ValidationReport validate_run(double duration_ms, std::size_t steps) {
  ValidationReport r;
  if (!(duration_ms > 0.0) || !std::isfinite(duration_ms)) {
    r.errors.push_back("duration_ms " + fmt(duration_ms) + " must be > 0");
  }
  if (steps < 2) r.errors.push_back("steps " + std::to_string(steps) + " must be >= 2");
  return r;
}

void require_valid(const ValidationReport& report) {
  if (!report.ok()) throw ValidationError(report.errors);
}

} // namespace ionkin
