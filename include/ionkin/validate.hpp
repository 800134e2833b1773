#pragma once

#include <ionkin/types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ionkin {

// Outcome of a schema/referential check. Errors make the input unusable;
// warnings are reported but do not block a run.
struct ValidationReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
  void merge(const ValidationReport& other);
};

// Field presence/ranges plus references between states, transitions and rate functions.
ValidationReport validate_model(const ChannelModel& model);

// Volumes, epoch timing and epoch variable names. Overlapping epochs on one
// variable are a warning: the first declared epoch wins at run time.
ValidationReport validate_protocol(const StimulusProtocol& protocol);

ValidationReport validate_run(double duration_ms, std::size_t steps);

// Throws ValidationError listing every error in `report`.
void require_valid(const ValidationReport& report);

} // namespace ionkin
