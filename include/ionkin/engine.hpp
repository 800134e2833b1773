#pragma once

#include <ionkin/expression.hpp>
#include <ionkin/generator.hpp>
#include <ionkin/integrator.hpp>
#include <ionkin/observables.hpp>
#include <ionkin/stimulus.hpp>
#include <ionkin/types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ionkin {

// Markov channel kinetics coupled to internal/external K+ concentrations.
//
// The model and protocol are trusted: they must already have passed validate_model /
// validate_protocol. Construction compiles every rate function once (ParseError,
// UndefinedSymbolError); afterwards the engine is immutable, so one instance can serve
// any number of runs, including concurrent ones from different threads.
//
// State vector layout: [P_0 .. P_{n-1}, Kin (mM), Kout (mM)], time in seconds.
class SimulationEngine {
public:
  SimulationEngine(ChannelModel model, StimulusProtocol protocol,
                   IntegratorOptions solver = IntegratorOptions{});

  const ChannelModel& model() const { return model_; }
  const StimulusProtocol& protocol() const { return protocol_; }
  const Stimulus& stimulus() const { return stimulus_; }
  const GeneratorMatrixBuilder& generator() const { return generator_; }
  const IntegratorOptions& solver_options() const { return solver_; }

  std::size_t n_states() const { return model_.states.size(); }
  const std::map<std::string, std::size_t>& state_map() const { return state_index_; }

  // Compiled function for a rate id; throws std::out_of_range for an unknown id.
  const RateFunction& rate_function(const std::string& id) const { return rates_.at(id); }

  double volume_internal_L() const { return volume_internal_L_; }
  double volume_external_L() const { return volume_external_L_; }

  // P = [1, 0, ..., 0], concentrations from the holding values.
  std::vector<double> initial_state() const;

  // Right-hand side at time t_s [s]; dydt is resized to y.size().
  void derivative(double t_s, const std::vector<double>& y, std::vector<double>& dydt) const;
  std::vector<double> derivative(double t_s, const std::vector<double>& y) const;

  // Same, with the membrane voltage given directly instead of read from the stimulus.
  void derivative_at_voltage(double V_mV, const std::vector<double>& y, std::vector<double>& dydt) const;

  // Hot-path form: Q is caller-owned scratch of size n_states() x n_states(), reused across calls.
  void derivative_at_voltage(double V_mV, const std::vector<double>& y, std::vector<double>& dydt,
                             SquareMatrix& Q) const;

  // Integrate over [0, duration_ms] and return `steps` evenly spaced samples.
  // Throws IntegrationFailure when the solver cannot proceed.
  SimulationResult run(double duration_ms, std::size_t steps) const;

  // Raw solver output on the same grid as run(), before post-processing.
  Trajectory integrate(double duration_ms, std::size_t steps) const;

private:
  ChannelModel model_;
  StimulusProtocol protocol_;
  IntegratorOptions solver_;
  Stimulus stimulus_;

  std::map<std::string, std::size_t> state_index_;
  std::map<std::string, RateFunction> rates_;
  GeneratorMatrixBuilder generator_;
  std::vector<double> conductances_;  // [nS], by state index

  double volume_internal_L_ = 0.0;
  double volume_external_L_ = 0.0;
};

} // namespace ionkin
