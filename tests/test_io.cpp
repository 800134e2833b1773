#include <gtest/gtest.h>

#include <ionkin/engine.hpp>
#include <ionkin/errors.hpp>
#include <ionkin/io.hpp>

#include "common.hpp"

#include <json-c/json.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace ionkin;

namespace fs = std::filesystem;

namespace {

bool mentions(const std::vector<std::string>& msgs, const std::string& needle) {
  return std::any_of(msgs.begin(), msgs.end(),
                     [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

std::vector<std::string> shape_problems(const std::string& text) {
  try {
    parse_model_json(text);
  } catch (const ValidationError& e) {
    return e.problems();
  }
  return {};
}

fs::path scratch_dir(const std::string& name) {
  fs::path p = fs::temp_directory_path() / ("ionkin_test_" + name);
  fs::remove_all(p);
  return p;
}

} // namespace

TEST(io, parse_request) {
  SimulationRequest req = parse_request_json(ionkin_test::two_state_request_json());

  EXPECT_EQ("two_state", req.model.channel_id);
  ASSERT_EQ(2u, req.model.states.size());
  EXPECT_EQ("O", req.model.states[1].id);
  EXPECT_EQ("Open", req.model.states[1].name);
  EXPECT_EQ(1.2, req.model.states[1].conductance);
  ASSERT_EQ(2u, req.model.rate_functions.size());
  EXPECT_EQ("0.2 * exp(-V / 50.0)", req.model.rate_functions[1].equation);
  ASSERT_EQ(2u, req.model.transitions.size());
  EXPECT_EQ("C", req.model.transitions[0].from_state);
  EXPECT_EQ("O", req.model.transitions[0].to_state);
  EXPECT_EQ(1.0, req.model.transitions[0].multiplier);

  EXPECT_EQ("step_40", req.protocol.protocol_id);
  EXPECT_EQ(-80.0, req.protocol.holding_values.voltage_mV);
  ASSERT_TRUE(req.protocol.holding_values.volume_internal_L.has_value());
  EXPECT_EQ(1e-12, *req.protocol.holding_values.volume_internal_L);
  ASSERT_EQ(1u, req.protocol.epochs.size());
  EXPECT_EQ("voltage_mV", req.protocol.epochs[0].variable);
  EXPECT_EQ(200.0, req.protocol.epochs[0].duration_ms);

  ASSERT_TRUE(req.duration_ms.has_value());
  EXPECT_EQ(500.0, *req.duration_ms);
  ASSERT_TRUE(req.steps.has_value());
  EXPECT_EQ(501u, *req.steps);
}

TEST(io, optional_fields) {
  const char* proto = R"({
    "protocol_id": "p",
    "holding_values": {"voltage_mV": -70, "internal_K_mM": 140, "external_K_mM": 5}
  })";
  StimulusProtocol p = parse_protocol_json(proto);
  EXPECT_TRUE(p.epochs.empty());
  EXPECT_FALSE(p.holding_values.volume_internal_L.has_value());
  EXPECT_FALSE(p.holding_values.volume_external_L.has_value());

  const char* model = R"({
    "channel_id": "m",
    "states": [{"id": "A", "name": "a", "conductance": 0}, {"id": "B", "name": "b", "conductance": 1}],
    "rate_functions": [{"id": "k", "equation": "2"}],
    "transitions": [{"from_state": "A", "to_state": "B", "rate_function_id": "k", "multiplier": 3}]
  })";
  ChannelModel m = parse_model_json(model);
  EXPECT_EQ("A", m.transitions[0].from_state);
  EXPECT_EQ("B", m.transitions[0].to_state);
  EXPECT_EQ(3.0, m.transitions[0].multiplier);

  SimulationRequest req = parse_request_json(std::string("{\"model\": ") + model + ", \"protocol\": " + proto + "}");
  EXPECT_FALSE(req.duration_ms.has_value());
  EXPECT_FALSE(req.steps.has_value());
}

TEST(io, shape_errors_are_collected) {
  auto problems = shape_problems(R"({
    "channel_id": 7,
    "states": [{"id": "A", "conductance": "high"}],
    "transitions": {}
  })");
  EXPECT_TRUE(mentions(problems, "model.channel_id: expected a string"));
  EXPECT_TRUE(mentions(problems, "model.states[0].name: field required"));
  EXPECT_TRUE(mentions(problems, "model.states[0].conductance: expected a number"));
  EXPECT_TRUE(mentions(problems, "model.rate_functions: field required"));
  EXPECT_TRUE(mentions(problems, "model.transitions: expected an array"));

  EXPECT_TRUE(mentions(shape_problems("[]"), "model: expected an object"));
}

TEST(io, request_shape_errors) {
  try {
    parse_request_json(R"({"model": [], "steps": 2.5})");
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_TRUE(mentions(e.problems(), "request.model: expected an object"));
    EXPECT_TRUE(mentions(e.problems(), "request.protocol: field required"));
    EXPECT_TRUE(mentions(e.problems(), "request.steps: expected a non-negative integer"));
  }
}

TEST(io, syntax_errors) {
  EXPECT_THROW(parse_model_json("{\"channel_id\": "), std::runtime_error);
  EXPECT_THROW(parse_model_json("{} trailing"), std::runtime_error);
  try {
    parse_protocol_json("{\"protocol_id\": ]");
    FAIL() << "expected std::runtime_error";
  } catch (const ValidationError&) {
    FAIL() << "syntax errors are not shape errors";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string::npos, std::string(e.what()).find("JSON syntax error"));
  }
}

TEST(io, missing_file) {
  EXPECT_THROW(read_model_file("/nonexistent/ionkin/model.json"), std::runtime_error);
}

TEST(io, results_json_document) {
  SimulationEngine engine(ionkin_test::two_state_model(), ionkin_test::step_protocol());
  SimulationResult r = engine.run(400.0, 9);
  std::string text = results_to_json(r, {{"verify", "pass"}});

  json_object* root = json_tokener_parse(text.c_str());
  ASSERT_NE(nullptr, root);

  for (const char* key : {"time_ms", "voltage_mV", "total_conductance_nS", "total_current_pA",
                          "internal_K_mM", "external_K_mM", "nernst_potential_mV"}) {
    json_object* arr = nullptr;
    ASSERT_TRUE(json_object_object_get_ex(root, key, &arr)) << key;
    ASSERT_TRUE(json_object_is_type(arr, json_type_array)) << key;
    EXPECT_EQ(9u, static_cast<std::size_t>(json_object_array_length(arr))) << key;
  }

  json_object* probs = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(root, "probabilities", &probs));
  ASSERT_EQ(2u, static_cast<std::size_t>(json_object_array_length(probs)));
  json_object* p_closed = json_object_array_get_idx(probs, 0);
  EXPECT_EQ(9u, static_cast<std::size_t>(json_object_array_length(p_closed)));
  EXPECT_EQ(1.0, json_object_get_double(json_object_array_get_idx(p_closed, 0)));

  json_object* smap = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(root, "state_map", &smap));
  json_object* idx = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(smap, "O", &idx));
  EXPECT_EQ(1, json_object_get_int(idx));

  json_object* v = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(root, "voltage_mV", &v));
  EXPECT_EQ(40.0, json_object_get_double(json_object_array_get_idx(v, 4)));

  json_object* summary = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(root, "summary", &summary));
  json_object* verdict = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(summary, "verify", &verdict));
  EXPECT_STREQ("pass", json_object_get_string(verdict));

  json_object* cid = nullptr;
  ASSERT_TRUE(json_object_object_get_ex(root, "channel_id", &cid));
  EXPECT_STREQ("two_state", json_object_get_string(cid));

  json_object_put(root);

  // No summary object when none is given.
  EXPECT_EQ(std::string::npos, results_to_json(r).find("\"summary\""));
}

TEST(io, output_files) {
  SimulationEngine engine(ionkin_test::hh_potassium_model(), ionkin_test::step_protocol());
  SimulationResult r = engine.run(200.0, 21);

  fs::path dir = scratch_dir("output_files");
  write_results_json(dir.string(), r, {{"steps", "21"}});
  write_timeseries_table(dir.string(), r);

  ASSERT_TRUE(fs::exists(dir / "results.json"));
  ASSERT_TRUE(fs::exists(dir / "timeseries.dat"));

  std::ifstream in(dir / "timeseries.dat");
  std::string comment, header;
  std::getline(in, comment);
  std::getline(in, header);
  EXPECT_EQ('#', comment.front());
  EXPECT_EQ("# t_ms V_mV P_C4 P_C3 P_C2 P_C1 P_O g_nS I_pA Kin_mM Kout_mM EK_mV", header);

  std::size_t rows = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) ++rows;
  }
  EXPECT_EQ(21u, rows);

  fs::copy_file(dir / "results.json", dir / "copy_src.json");
  copy_file((dir / "copy_src.json").string(), (dir / "copy_dst.json").string());
  EXPECT_EQ(fs::file_size(dir / "results.json"), fs::file_size(dir / "copy_dst.json"));

  fs::remove_all(dir);
}

TEST(io, write_table_checks_shape) {
  fs::path dir = scratch_dir("write_table");
  ensure_dir(dir.string());
  const std::string path = (dir / "t.dat").string();
  EXPECT_THROW(write_table(path, {"a", "b"}, {{1.0, 2.0}}), std::runtime_error);
  EXPECT_THROW(write_table(path, {"a", "b"}, {{1.0, 2.0}, {3.0}}), std::runtime_error);
  EXPECT_NO_THROW(write_table(path, {"a", "b"}, {{1.0, 2.0}, {3.0, 4.0}}));
  fs::remove_all(dir);
}
