#include <ionkin/engine.hpp>

#include <ionkin/constants.hpp>

#include <stdexcept>

namespace ionkin {

SimulationEngine::SimulationEngine(ChannelModel model, StimulusProtocol protocol, IntegratorOptions solver)
    : model_(std::move(model)),
      protocol_(std::move(protocol)),
      solver_(solver),
      stimulus_(protocol_) {
  if (model_.states.empty()) {
    throw std::runtime_error("SimulationEngine: model has no states");
  }

  for (std::size_t i = 0; i < model_.states.size(); ++i) {
    state_index_[model_.states[i].id] = i;
    conductances_.push_back(model_.states[i].conductance);
  }

  // One compilation per unique id, shared by every transition that references it.
  for (const auto& rf : model_.rate_functions) {
    if (rates_.count(rf.id)) continue;
    rates_.emplace(rf.id, compile_rate_equation(rf.equation));
  }

  generator_ = GeneratorMatrixBuilder(model_, rates_);

  volume_internal_L_ = stimulus_.holding(StimulusVariable::volume_internal_L);
  volume_external_L_ = stimulus_.holding(StimulusVariable::volume_external_L);
}

std::vector<double> SimulationEngine::initial_state() const {
  const std::size_t n = n_states();
  std::vector<double> y(n + 2, 0.0);
  y[0] = 1.0;
  y[n] = protocol_.holding_values.internal_K_mM;
  y[n + 1] = protocol_.holding_values.external_K_mM;
  return y;
}

void SimulationEngine::derivative(double t_s, const std::vector<double>& y, std::vector<double>& dydt) const {
  const double V = stimulus_.value_at(StimulusVariable::voltage_mV, t_s * 1000.0);
  derivative_at_voltage(V, y, dydt);
}

std::vector<double> SimulationEngine::derivative(double t_s, const std::vector<double>& y) const {
  std::vector<double> dydt;
  derivative(t_s, y, dydt);
  return dydt;
}

void SimulationEngine::derivative_at_voltage(double V_mV, const std::vector<double>& y,
                                             std::vector<double>& dydt) const {
  SquareMatrix Q(n_states());
  derivative_at_voltage(V_mV, y, dydt, Q);
}

void SimulationEngine::derivative_at_voltage(double V_mV, const std::vector<double>& y,
                                             std::vector<double>& dydt, SquareMatrix& Q) const {
  const std::size_t n = n_states();
  if (y.size() != n + 2) {
    throw std::runtime_error("SimulationEngine::derivative: state vector has wrong length");
  }
  dydt.resize(n + 2);

  const double* P = y.data();
  const double Kin = y[n];
  const double Kout = y[n + 1];

  // Probability flow
  generator_.build(V_mV, Q);
  Q.multiply(P, dydt.data());

  // Electrodiffusion
  const double E_K = nernst_potential_mV(Kin, Kout);
  const double g = total_conductance(conductances_, P);
  const double I = ohmic_current_pA(g, V_mV, E_K);
  const double flux = potassium_flux_mmol_per_s(I);

  dydt[n] = -flux / volume_internal_L_;
  dydt[n + 1] = flux / volume_external_L_;
}

Trajectory SimulationEngine::integrate(double duration_ms, std::size_t steps) const {
  if (!(duration_ms > 0.0)) throw std::runtime_error("SimulationEngine::run: duration_ms must be positive");
  if (steps < 2) throw std::runtime_error("SimulationEngine::run: steps must be >= 2");

  const double t_end_s = duration_ms / 1000.0;
  std::vector<double> samples = linspace(0.0, t_end_s, steps);

  // Voltage steps are the only discontinuities of the right-hand side.
  std::vector<double> breaks;
  for (double b_ms : stimulus_.breakpoints_ms(StimulusVariable::voltage_mV, duration_ms)) {
    breaks.push_back(b_ms / 1000.0);
  }

  // Per-run workspace, so concurrent runs never share it.
  SquareMatrix Q(n_states());
  OdeSystem rhs = [this, &Q](const std::vector<double>& y, std::vector<double>& dydt, double t) {
    const double V = stimulus_.value_at(StimulusVariable::voltage_mV, t * 1000.0);
    derivative_at_voltage(V, y, dydt, Q);
  };
  return integrate_dopri5(rhs, initial_state(), samples, breaks, solver_);
}

SimulationResult SimulationEngine::run(double duration_ms, std::size_t steps) const {
  SimulationResult r = post_process(model_, stimulus_, integrate(duration_ms, steps));
  r.protocol_id = protocol_.protocol_id;
  return r;
}

} // namespace ionkin
