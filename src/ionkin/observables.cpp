#include <ionkin/observables.hpp>

#include <ionkin/integrator.hpp>

#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace ionkin {

double nernst_potential_mV(double Kin_mM, double Kout_mM, double T, int z) {
  if (Kin_mM <= 0.0 || Kout_mM <= 0.0) return 0.0;
  return thermal_voltage_mV(T, z) * std::log(Kout_mM / Kin_mM);
}

double total_conductance(const std::vector<double>& conductances, const double* P) {
  double g = 0.0;
  for (std::size_t s = 0; s < conductances.size(); ++s) g += conductances[s] * P[s];
  return g;
}

double potassium_flux_mmol_per_s(double I_pA, int z) {
  // pA -> A, / (zF) -> mol/s, -> mmol/s
  return (I_pA * 1e-12) / (static_cast<double>(z) * kFaraday) * 1000.0;
}

const std::vector<double>& SimulationResult::occupancy(const std::string& state_id) const {
  auto it = state_map.find(state_id);
  if (it == state_map.end()) {
    throw std::runtime_error("SimulationResult: unknown state id '" + state_id + "'");
  }
  return probabilities.at(it->second);
}

SimulationResult post_process(const ChannelModel& model,
                              const Stimulus& stimulus,
                              const Trajectory& traj) {
  const std::size_t ns = model.states.size();
  const std::size_t nt = traj.size();
  if (traj.y.size() != nt) throw std::runtime_error("post_process: trajectory t/y length mismatch");

  std::vector<double> conductances(ns, 0.0);
  for (std::size_t s = 0; s < ns; ++s) conductances[s] = model.states[s].conductance;

  SimulationResult r;
  r.channel_id = model.channel_id;
  for (std::size_t s = 0; s < ns; ++s) r.state_map[model.states[s].id] = s;
  r.volume_internal_L = stimulus.holding(StimulusVariable::volume_internal_L);
  r.volume_external_L = stimulus.holding(StimulusVariable::volume_external_L);

  r.time_ms.assign(nt, 0.0);
  r.voltage_mV.assign(nt, 0.0);
  r.probabilities.assign(ns, std::vector<double>(nt, 0.0));
  r.total_conductance_nS.assign(nt, 0.0);
  r.total_current_pA.assign(nt, 0.0);
  r.internal_K_mM.assign(nt, 0.0);
  r.external_K_mM.assign(nt, 0.0);
  r.nernst_potential_mV.assign(nt, 0.0);

  for (std::size_t k = 0; k < nt; ++k) {
    if (traj.y[k].size() != ns + 2) {
      throw std::runtime_error("post_process: state vector length " + std::to_string(traj.y[k].size()) +
                               " does not match " + std::to_string(ns) + " states + 2 concentrations");
    }
  }

  // Samples are independent of each other.
#ifdef IONKIN_HAS_OPENMP
#pragma omp parallel for schedule(static) if (nt > 4096)
#endif
  for (std::ptrdiff_t kk = 0; kk < static_cast<std::ptrdiff_t>(nt); ++kk) {
    const std::size_t k = static_cast<std::size_t>(kk);
    const std::vector<double>& y = traj.y[k];
    const double t_ms = traj.t[k] * 1000.0;
    const double V = stimulus.value_at(StimulusVariable::voltage_mV, t_ms);
    const double Kin = y[ns];
    const double Kout = y[ns + 1];
    const double E = nernst_potential_mV(Kin, Kout);
    const double g = total_conductance(conductances, y.data());

    r.time_ms[k] = t_ms;
    r.voltage_mV[k] = V;
    for (std::size_t s = 0; s < ns; ++s) r.probabilities[s][k] = y[s];
    r.internal_K_mM[k] = Kin;
    r.external_K_mM[k] = Kout;
    r.nernst_potential_mV[k] = E;
    r.total_conductance_nS[k] = g;
    r.total_current_pA[k] = ohmic_current_pA(g, V, E);
  }

  return r;
}

} // namespace ionkin
