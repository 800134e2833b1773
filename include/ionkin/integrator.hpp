#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace ionkin {

// dy/dt = f(y, t), boost::odeint calling convention.
using OdeSystem = std::function<void(const std::vector<double>& y, std::vector<double>& dydt, double t)>;

struct IntegratorOptions {
  double abs_tol = 1e-9;
  double rel_tol = 1e-6;
  double initial_dt = 0.0;          // [time unit of the system]; <= 0 => automatic
  std::size_t max_steps = 5000000;  // accepted steps over the whole run
};

// Samples of an integrated trajectory, y[k] is the state at t[k].
struct Trajectory {
  std::vector<double> t;
  std::vector<std::vector<double>> y;

  std::size_t size() const { return t.size(); }
};

// Integrate y' = f(y, t) from sample_times.front() to sample_times.back() with the
// Dormand-Prince 5(4) dense-output stepper and return the state at every sample time
// (ascending). The stepper restarts at each breakpoint, and inside a segment [a, b]
// f is only called at times strictly between a and b, so a discontinuity of f at a
// breakpoint is never straddled by a step.
//
// Throws IntegrationFailure (time reported in ms, assuming f works in seconds) when the
// step size cannot be adjusted, the step budget is exhausted or the state turns non-finite.
Trajectory integrate_dopri5(const OdeSystem& f,
                            const std::vector<double>& y0,
                            const std::vector<double>& sample_times,
                            const std::vector<double>& breakpoints,
                            const IntegratorOptions& opts = IntegratorOptions{});

// n evenly spaced points over [t0, t1], both ends included exactly.
std::vector<double> linspace(double t0, double t1, std::size_t n);

} // namespace ionkin
