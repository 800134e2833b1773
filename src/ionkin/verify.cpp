#include <ionkin/verify.hpp>

#include <algorithm>
#include <cmath>

namespace ionkin {

namespace {

bool finite_series(const std::vector<double>& v) {
  return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

} // namespace

VerificationReport verify_result(const SimulationResult& result, double tol) {
  VerificationReport r;
  const std::size_t nt = result.n_samples();

  r.finite_ok = finite_series(result.time_ms) && finite_series(result.total_current_pA) &&
                finite_series(result.internal_K_mM) && finite_series(result.external_K_mM);
  for (const auto& p : result.probabilities) r.finite_ok = r.finite_ok && finite_series(p);

  for (std::size_t k = 0; k < nt; ++k) {
    double sum = 0.0;
    for (const auto& p : result.probabilities) {
      sum += p[k];
      r.min_occupancy = std::min(r.min_occupancy, p[k]);
    }
    r.max_probability_drift = std::max(r.max_probability_drift, std::fabs(sum - 1.0));
  }
  r.probability_ok = (r.max_probability_drift <= tol);
  // Small negative excursions are integration noise of the same order as the drift.
  r.occupancy_ok = (r.min_occupancy >= -tol);

  // Ions leaving one compartment enter the other.
  if (nt > 0) {
    const double Vin = result.volume_internal_L;
    const double Vout = result.volume_external_L;
    const double m0 = result.internal_K_mM.front() * Vin + result.external_K_mM.front() * Vout;
    const double m1 = result.internal_K_mM.back() * Vin + result.external_K_mM.back() * Vout;
    r.mass_rel_error = std::fabs(m1 - m0) / std::max(std::fabs(m0), 1e-300);
  }
  r.mass_ok = (r.mass_rel_error <= tol);

  return r;
}

} // namespace ionkin
