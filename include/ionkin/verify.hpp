#pragma once

#include <ionkin/observables.hpp>

namespace ionkin {

// Post-run audit of the invariants a valid trajectory must satisfy.
struct VerificationReport {
  bool probability_ok = false;
  double max_probability_drift = 0.0;  // max_t |sum_s P_s(t) - 1|

  bool occupancy_ok = false;
  double min_occupancy = 0.0;          // most negative P_s(t) seen

  bool finite_ok = false;

  // Kin*Vin + Kout*Vout [mmol], start vs end.
  bool mass_ok = false;
  double mass_rel_error = 0.0;

  bool all_ok() const { return probability_ok && occupancy_ok && finite_ok && mass_ok; }
};

VerificationReport verify_result(const SimulationResult& result, double tol = 1e-6);

} // namespace ionkin
