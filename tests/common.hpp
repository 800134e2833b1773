#pragma once

#include <ionkin/types.hpp>

#include <string>

// Shared channel models and protocols for the unit tests.

namespace ionkin_test {

// C <-> O with voltage-dependent opening/closing; only O conducts (1.2 nS).
inline ionkin::ChannelModel two_state_model() {
  ionkin::ChannelModel m;
  m.channel_id = "two_state";
  m.states = {{"C", "Closed", 0.0}, {"O", "Open", 1.2}};
  m.rate_functions = {{"alpha", "0.1 * exp(V / 25.0)"}, {"beta", "0.2 * exp(-V / 50.0)"}};
  m.transitions = {{"C", "O", "alpha", 1.0}, {"O", "C", "beta", 1.0}};
  return m;
}

// Hodgkin-Huxley K+ channel written as a 5-state chain of n-gates.
inline ionkin::ChannelModel hh_potassium_model() {
  ionkin::ChannelModel m;
  m.channel_id = "hh_k";
  m.states = {{"C4", "Closed 4", 0.0},
              {"C3", "Closed 3", 0.0},
              {"C2", "Closed 2", 0.0},
              {"C1", "Closed 1", 0.0},
              {"O", "Open", 20.0}};
  m.rate_functions = {{"alpha_n", "0.01*(V+55)/(1-exp(-(V+55)/10))"},
                      {"beta_n", "0.125*exp(-(V+65)/80)"}};
  m.transitions = {{"C4", "C3", "alpha_n", 4.0}, {"C3", "C4", "beta_n", 1.0},
                   {"C3", "C2", "alpha_n", 3.0}, {"C2", "C3", "beta_n", 2.0},
                   {"C2", "C1", "alpha_n", 2.0}, {"C1", "C2", "beta_n", 3.0},
                   {"C1", "O", "alpha_n", 1.0},  {"O", "C1", "beta_n", 4.0}};
  return m;
}

// Hold at -80 mV, step to 40 mV over [100, 300) ms.
inline ionkin::StimulusProtocol step_protocol() {
  ionkin::StimulusProtocol p;
  p.protocol_id = "step_40";
  p.holding_values.voltage_mV = -80.0;
  p.holding_values.internal_K_mM = 140.0;
  p.holding_values.external_K_mM = 5.0;
  p.holding_values.volume_internal_L = 1e-12;
  p.holding_values.volume_external_L = 1e-6;
  p.epochs = {{"voltage_mV", 100.0, 200.0, 40.0}};
  return p;
}

// Constant voltage, no epochs.
inline ionkin::StimulusProtocol holding_protocol(double V_mV, double Kin_mM = 140.0, double Kout_mM = 5.0) {
  ionkin::StimulusProtocol p;
  p.protocol_id = "hold";
  p.holding_values.voltage_mV = V_mV;
  p.holding_values.internal_K_mM = Kin_mM;
  p.holding_values.external_K_mM = Kout_mM;
  p.holding_values.volume_internal_L = 1e-12;
  p.holding_values.volume_external_L = 1e-6;
  return p;
}

inline const char* two_state_request_json() {
  return R"json({
  "model": {
    "channel_id": "two_state",
    "states": [
      {"id": "C", "name": "Closed", "conductance": 0},
      {"id": "O", "name": "Open", "conductance": 1.2}
    ],
    "rate_functions": [
      {"id": "alpha", "equation": "0.1 * exp(V / 25.0)"},
      {"id": "beta", "equation": "0.2 * exp(-V / 50.0)"}
    ],
    "transitions": [
      {"from": "C", "to": "O", "rate_function_id": "alpha"},
      {"from": "O", "to": "C", "rate_function_id": "beta", "multiplier": 1.0}
    ]
  },
  "protocol": {
    "protocol_id": "step_40",
    "holding_values": {
      "voltage_mV": -80, "internal_K_mM": 140, "external_K_mM": 5,
      "volume_internal_L": 1e-12, "volume_external_L": 1e-6
    },
    "epochs": [
      {"variable": "voltage_mV", "start_time_ms": 100, "duration_ms": 200, "value": 40}
    ]
  },
  "duration_ms": 500,
  "steps": 501
})json";
}

} // namespace ionkin_test
