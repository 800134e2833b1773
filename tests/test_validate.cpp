#include <gtest/gtest.h>

#include <ionkin/errors.hpp>
#include <ionkin/validate.hpp>

#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using namespace ionkin;

namespace {

bool mentions(const std::vector<std::string>& msgs, const std::string& needle) {
  return std::any_of(msgs.begin(), msgs.end(),
                     [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

} // namespace

TEST(validate, canonical_inputs_pass) {
  EXPECT_TRUE(validate_model(ionkin_test::two_state_model()).ok());
  EXPECT_TRUE(validate_model(ionkin_test::hh_potassium_model()).ok());
  ValidationReport p = validate_protocol(ionkin_test::step_protocol());
  EXPECT_TRUE(p.ok());
  EXPECT_TRUE(p.warnings.empty());
  EXPECT_TRUE(validate_run(500.0, 2).ok());
}

TEST(validate, dangling_references) {
  auto m = ionkin_test::two_state_model();
  m.transitions.push_back({"C", "X", "gamma", 1.0});
  ValidationReport r = validate_model(m);
  EXPECT_FALSE(r.ok());
  ASSERT_EQ(2u, r.errors.size());
  EXPECT_EQ("Transition 2: 'to_state' 'X' is not a defined state id", r.errors[0]);
  EXPECT_EQ("Transition 2: 'rate_function_id' 'gamma' is not a defined function id", r.errors[1]);
}

TEST(validate, duplicate_ids_and_bad_values) {
  auto m = ionkin_test::two_state_model();
  m.states.push_back({"O", "Open again", -1.0});
  m.rate_functions.push_back({"alpha", ""});
  m.transitions[0].multiplier = 0.0;
  ValidationReport r = validate_model(m);
  EXPECT_TRUE(mentions(r.errors, "duplicate state id 'O'"));
  EXPECT_TRUE(mentions(r.errors, "conductance -1"));
  EXPECT_TRUE(mentions(r.errors, "duplicate function id 'alpha'"));
  EXPECT_TRUE(mentions(r.errors, "equation must not be empty"));
  EXPECT_TRUE(mentions(r.errors, "Transition 0: multiplier 0 must be > 0"));
}

TEST(validate, empty_model) {
  ChannelModel m;
  ValidationReport r = validate_model(m);
  EXPECT_TRUE(mentions(r.errors, "channel_id must not be empty"));
  EXPECT_TRUE(mentions(r.errors, "at least one state"));
  EXPECT_TRUE(mentions(r.errors, "at least one rate function"));
}

TEST(validate, self_transition_warns) {
  auto m = ionkin_test::two_state_model();
  m.transitions.push_back({"C", "C", "alpha", 1.0});
  ValidationReport r = validate_model(m);
  EXPECT_TRUE(r.ok());
  EXPECT_TRUE(mentions(r.warnings, "self-transition on 'C'"));
}

TEST(validate, protocol_problems) {
  auto p = ionkin_test::step_protocol();
  p.protocol_id.clear();
  p.holding_values.volume_internal_L = 0.0;
  p.epochs.push_back({"temperature", 0.0, 10.0, 1.0});
  p.epochs.push_back({"voltage_mV", -5.0, 0.0, 1.0});
  p.epochs.push_back({"volume_external_L", 10.0, 10.0, -1.0});
  p.epochs.push_back({"internal_K_mM", 10.0, 10.0, NAN});

  ValidationReport r = validate_protocol(p);
  EXPECT_FALSE(r.ok());
  EXPECT_TRUE(mentions(r.errors, "protocol_id must not be empty"));
  EXPECT_TRUE(mentions(r.errors, "volume_internal_L 0 must be > 0"));
  EXPECT_TRUE(mentions(r.errors, "Epoch 1: 'temperature' is not a valid variable"));
  EXPECT_TRUE(mentions(r.errors, "Epoch 2: start_time_ms -5 must be >= 0"));
  EXPECT_TRUE(mentions(r.errors, "Epoch 2: duration_ms 0 must be > 0"));
  EXPECT_TRUE(mentions(r.errors, "Epoch 3: volume override -1 must be > 0"));
  EXPECT_TRUE(mentions(r.errors, "Epoch 4: value must be finite"));
}

TEST(validate, overlapping_epochs_warn) {
  auto p = ionkin_test::step_protocol();
  p.epochs.push_back({"voltage_mV", 250.0, 100.0, 0.0});
  p.epochs.push_back({"voltage_mV", 300.0, 100.0, 0.0});
  p.epochs.push_back({"external_K_mM", 150.0, 10.0, 20.0});

  ValidationReport r = validate_protocol(p);
  EXPECT_TRUE(r.ok());
  ASSERT_EQ(2u, r.warnings.size());
  EXPECT_EQ("Epoch 1 overlaps epoch 0 on 'voltage_mV'; epoch 0 takes precedence", r.warnings[0]);
  EXPECT_EQ("Epoch 2 overlaps epoch 1 on 'voltage_mV'; epoch 1 takes precedence", r.warnings[1]);
}

TEST(validate, run_parameters) {
  EXPECT_FALSE(validate_run(0.0, 100).ok());
  EXPECT_FALSE(validate_run(-1.0, 100).ok());
  EXPECT_FALSE(validate_run(INFINITY, 100).ok());
  EXPECT_FALSE(validate_run(100.0, 1).ok());
  EXPECT_EQ(2u, validate_run(0.0, 0).errors.size());
}

TEST(validate, require_valid_collects_all_errors) {
  ValidationReport r = validate_model(ChannelModel{});
  r.merge(validate_run(0.0, 1));
  try {
    require_valid(r);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(r.errors, e.problems());
    EXPECT_NE(std::string::npos, std::string(e.what()).find("validation failed: channel_id must not be empty"));
  }

  EXPECT_NO_THROW(require_valid(validate_model(ionkin_test::two_state_model())));
}
