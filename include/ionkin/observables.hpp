#pragma once

#include <ionkin/constants.hpp>
#include <ionkin/stimulus.hpp>
#include <ionkin/types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ionkin {

struct Trajectory;

// E_K [mV]. Returns 0 when either concentration is non-positive (numerical overshoot guard).
double nernst_potential_mV(double Kin_mM, double Kout_mM, double T = kTemperature, int z = kValenceK);

// g = sum_s conductance_s * P_s [nS]. Only the first conductances.size() entries of P are read.
double total_conductance(const std::vector<double>& conductances, const double* P);

// Ohmic current I = g (V - E) [pA] for g in nS and voltages in mV.
inline double ohmic_current_pA(double g_nS, double V_mV, double E_mV) {
  return g_nS * (V_mV - E_mV);
}

// K+ carried by a current, pA -> mmol/s. Positive (outward) current is positive flux.
double potassium_flux_mmol_per_s(double I_pA, int z = kValenceK);

struct SimulationResult {
  std::string channel_id;
  std::string protocol_id;

  std::vector<double> time_ms;
  std::vector<double> voltage_mV;
  std::vector<std::vector<double>> probabilities;  // [state][sample]
  std::vector<double> total_conductance_nS;
  std::vector<double> total_current_pA;
  std::vector<double> internal_K_mM;
  std::vector<double> external_K_mM;
  std::vector<double> nernst_potential_mV;

  std::map<std::string, std::size_t> state_map;  // state id -> row of probabilities

  // Compartment volumes the run used [L].
  double volume_internal_L = 0.0;
  double volume_external_L = 0.0;

  std::size_t n_samples() const { return time_ms.size(); }
  std::size_t n_states() const { return probabilities.size(); }

  // Occupancy trace of one state; throws std::runtime_error for an unknown id.
  const std::vector<double>& occupancy(const std::string& state_id) const;
};

// Rebuild voltage, Nernst potential, conductance and current from a raw trajectory
// whose states are laid out as [P_0..P_{n-1}, Kin, Kout] with time in seconds.
SimulationResult post_process(const ChannelModel& model,
                              const Stimulus& stimulus,
                              const Trajectory& traj);

} // namespace ionkin
