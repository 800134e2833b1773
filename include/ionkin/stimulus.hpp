#pragma once

#include <ionkin/types.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ionkin {

// Step-override stimulus: a holding baseline per variable, overridden by epochs on
// the half-open interval [start, start + duration). When epochs on one variable
// overlap, the first declared one wins.
class Stimulus {
public:
  Stimulus() = default;
  explicit Stimulus(const StimulusProtocol& protocol);

  double value_at(StimulusVariable var, double t_ms) const;

  // Throws std::runtime_error on an unknown variable name.
  double value_at(const std::string& variable, double t_ms) const;

  double holding(StimulusVariable var) const;

  // Sorted, unique epoch boundaries of `var` strictly inside (0, t_end_ms).
  std::vector<double> breakpoints_ms(StimulusVariable var, double t_end_ms) const;

private:
  struct Override {
    double start_ms = 0.0;
    double end_ms = 0.0;
    double value = 0.0;
  };

  static std::size_t slot(StimulusVariable var) { return static_cast<std::size_t>(var); }

  std::array<double, kNumStimulusVariables> holding_{};
  // Per variable, in declaration order.
  std::array<std::vector<Override>, kNumStimulusVariables> overrides_;
};

} // namespace ionkin
