#include <ionkin/integrator.hpp>

#include <ionkin/errors.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/numeric/odeint.hpp>

namespace ionkin {

namespace odeint = boost::numeric::odeint;

namespace {

using state_type = std::vector<double>;
using dopri5_type = odeint::runge_kutta_dopri5<state_type>;

bool all_finite(const state_type& y) {
  return std::all_of(y.begin(), y.end(), [](double v) { return std::isfinite(v); });
}

void check_samples(const std::vector<double>& t) {
  if (t.empty()) throw std::runtime_error("integrate_dopri5: no sample times");
  for (std::size_t i = 1; i < t.size(); ++i) {
    if (!(t[i] > t[i - 1])) throw std::runtime_error("integrate_dopri5: sample times must be strictly increasing");
  }
}

// Segment edges: t0, breakpoints inside (t0, t1), t1.
std::vector<double> segment_edges(double t0, double t1, const std::vector<double>& breakpoints) {
  std::vector<double> edges{t0};
  std::vector<double> inner;
  for (double b : breakpoints) {
    if (b > t0 && b < t1) inner.push_back(b);
  }
  std::sort(inner.begin(), inner.end());
  for (double b : inner) {
    if (b > edges.back()) edges.push_back(b);
  }
  if (t1 > edges.back()) edges.push_back(t1);
  return edges;
}

} // namespace

std::vector<double> linspace(double t0, double t1, std::size_t n) {
  if (n < 2) throw std::runtime_error("linspace: need at least 2 points");
  std::vector<double> out(n);
  const double h = (t1 - t0) / static_cast<double>(n - 1);
  for (std::size_t i = 0; i < n; ++i) out[i] = t0 + h * static_cast<double>(i);
  out.back() = t1;
  return out;
}

Trajectory integrate_dopri5(const OdeSystem& f,
                            const std::vector<double>& y0,
                            const std::vector<double>& sample_times,
                            const std::vector<double>& breakpoints,
                            const IntegratorOptions& opts) {
  check_samples(sample_times);
  if (!(opts.abs_tol > 0.0) || !(opts.rel_tol > 0.0)) {
    throw std::runtime_error("integrate_dopri5: tolerances must be positive");
  }
  if (!all_finite(y0)) {
    throw IntegrationFailure("non-finite initial state", sample_times.front() * 1000.0, y0);
  }

  const std::size_t n_samples = sample_times.size();
  Trajectory out;
  out.t.reserve(n_samples);
  out.y.reserve(n_samples);

  state_type y = y0;
  out.t.push_back(sample_times.front());
  out.y.push_back(y);
  std::size_t next = 1;
  if (n_samples == 1) return out;

  const std::vector<double> edges = segment_edges(sample_times.front(), sample_times.back(), breakpoints);
  std::size_t n_steps = 0;

  for (std::size_t s = 0; s + 1 < edges.size(); ++s) {
    const double a = edges[s];
    const double b = edges[s + 1];
    const double guard = 1e-9 * (b - a);

    // Stages that land on a segment edge or past its end are clamped just inside the segment.
    auto sys = [&f, a, b, guard](const state_type& x, state_type& dxdt, double t) {
      double te = (t < a + guard) ? a + guard : t;
      if (te > b - guard) te = b - guard;
      f(x, dxdt, te);
    };

    auto stepper = odeint::make_dense_output(opts.abs_tol, opts.rel_tol, dopri5_type());
    double dt0 = (opts.initial_dt > 0.0) ? opts.initial_dt : std::min(1e-5, 1e-3 * (b - a));
    dt0 = std::min(dt0, b - a);
    stepper.initialize(y, a, dt0);

    while (true) {
      while (next < n_samples && sample_times[next] <= b && sample_times[next] <= stepper.current_time()) {
        state_type x(y.size());
        stepper.calc_state(sample_times[next], x);
        if (!all_finite(x)) {
          throw IntegrationFailure("non-finite state in dense output", stepper.previous_time() * 1000.0,
                                   stepper.previous_state());
        }
        out.t.push_back(sample_times[next]);
        out.y.push_back(std::move(x));
        ++next;
      }
      if (stepper.current_time() >= b) break;

      if (++n_steps > opts.max_steps) {
        throw IntegrationFailure("step budget of " + std::to_string(opts.max_steps) + " exhausted",
                                 stepper.current_time() * 1000.0, stepper.current_state());
      }

      try {
        stepper.do_step(sys);
      } catch (const odeint::odeint_error& e) {
        // A rejected step leaves the current state untouched.
        throw IntegrationFailure(e.what(), stepper.current_time() * 1000.0, stepper.current_state());
      }

      if (!all_finite(stepper.current_state())) {
        throw IntegrationFailure("non-finite derivative", stepper.previous_time() * 1000.0,
                                 stepper.previous_state());
      }
      if (!(stepper.current_time() > stepper.previous_time())) {
        throw IntegrationFailure("step size collapsed", stepper.current_time() * 1000.0,
                                 stepper.current_state());
      }
    }

    // Carry the state at b into the next segment.
    if (stepper.current_time() > b) {
      stepper.calc_state(b, y);
    } else {
      y = stepper.current_state();
    }
  }

  if (next != n_samples) {
    throw std::runtime_error("integrate_dopri5: internal error, not all samples produced");
  }
  return out;
}

} // namespace ionkin
