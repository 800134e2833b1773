#include <ionkin/io.hpp>

#include <ionkin/errors.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <json-c/json.h>

namespace ionkin {

namespace fs = std::filesystem;

namespace {

struct JsonPut {
  void operator()(json_object* o) const { json_object_put(o); }
};
using JsonPtr = std::unique_ptr<json_object, JsonPut>;

JsonPtr parse_json_text(const std::string& text, const std::string& what) {
  json_tokener* tok = json_tokener_new();
  if (!tok) throw std::runtime_error("json_tokener_new failed");
  json_object* obj = json_tokener_parse_ex(tok, text.c_str(), static_cast<int>(text.size()));
  json_tokener_error err = json_tokener_get_error(tok);
  std::size_t offset = tok->char_offset;
  json_tokener_free(tok);
  if (err != json_tokener_success || !obj) {
    if (obj) json_object_put(obj);
    std::string desc = (err != json_tokener_success) ? json_tokener_error_desc(err) : "incomplete document";
    throw std::runtime_error(what + ": JSON syntax error near offset " + std::to_string(offset) + ": " + desc);
  }
  JsonPtr root(obj);
  for (std::size_t i = offset; i < text.size(); ++i) {
    if (!std::isspace(static_cast<unsigned char>(text[i]))) {
      throw std::runtime_error(what + ": trailing characters after JSON document at offset " + std::to_string(i));
    }
  }
  return root;
}

// Typed field access that records problems instead of throwing, so one pass
// reports every shape error of a document.
class Reader {
public:
  std::vector<std::string> problems;

  json_object* member(json_object* obj, const char* key, const std::string& path, bool required) {
    json_object* v = nullptr;
    if (!obj || !json_object_object_get_ex(obj, key, &v) || v == nullptr) {
      if (required) problems.push_back(path + "." + key + ": field required");
      return nullptr;
    }
    return v;
  }

  std::string string(json_object* obj, const char* key, const std::string& path) {
    json_object* v = member(obj, key, path, true);
    if (!v) return {};
    if (!json_object_is_type(v, json_type_string)) {
      problems.push_back(path + "." + key + ": expected a string");
      return {};
    }
    return json_object_get_string(v);
  }

  std::optional<double> number_opt(json_object* obj, const char* key, const std::string& path) {
    json_object* v = member(obj, key, path, false);
    if (!v) return std::nullopt;
    if (!json_object_is_type(v, json_type_double) && !json_object_is_type(v, json_type_int)) {
      problems.push_back(path + "." + key + ": expected a number");
      return std::nullopt;
    }
    return json_object_get_double(v);
  }

  double number(json_object* obj, const char* key, const std::string& path) {
    if (!member(obj, key, path, true)) return 0.0;
    return number_opt(obj, key, path).value_or(0.0);
  }

  json_object* object(json_object* obj, const char* key, const std::string& path) {
    json_object* v = member(obj, key, path, true);
    if (v && !json_object_is_type(v, json_type_object)) {
      problems.push_back(path + "." + key + ": expected an object");
      return nullptr;
    }
    return v;
  }

  json_object* array(json_object* obj, const char* key, const std::string& path, bool required) {
    json_object* v = member(obj, key, path, required);
    if (v && !json_object_is_type(v, json_type_array)) {
      problems.push_back(path + "." + key + ": expected an array");
      return nullptr;
    }
    return v;
  }

  void require_object(json_object* v, const std::string& path) {
    if (!json_object_is_type(v, json_type_object)) problems.push_back(path + ": expected an object");
  }

  void throw_if_problems() const {
    if (!problems.empty()) throw ValidationError(problems);
  }
};

std::size_t array_size(json_object* arr) {
  return arr ? static_cast<std::size_t>(json_object_array_length(arr)) : 0;
}

std::string item_path(const std::string& path, const char* key, std::size_t i) {
  return path + "." + key + "[" + std::to_string(i) + "]";
}

ChannelModel read_model(Reader& rd, json_object* root, const std::string& path) {
  ChannelModel m;
  rd.require_object(root, path);
  m.channel_id = rd.string(root, "channel_id", path);

  json_object* states = rd.array(root, "states", path, true);
  for (std::size_t i = 0; i < array_size(states); ++i) {
    json_object* s = json_object_array_get_idx(states, i);
    const std::string p = item_path(path, "states", i);
    rd.require_object(s, p);
    State st;
    st.id = rd.string(s, "id", p);
    st.name = rd.string(s, "name", p);
    st.conductance = rd.number(s, "conductance", p);
    m.states.push_back(st);
  }

  json_object* funcs = rd.array(root, "rate_functions", path, true);
  for (std::size_t i = 0; i < array_size(funcs); ++i) {
    json_object* f = json_object_array_get_idx(funcs, i);
    const std::string p = item_path(path, "rate_functions", i);
    rd.require_object(f, p);
    m.rate_functions.push_back(RateFunctionSpec{rd.string(f, "id", p), rd.string(f, "equation", p)});
  }

  json_object* trans = rd.array(root, "transitions", path, true);
  for (std::size_t i = 0; i < array_size(trans); ++i) {
    json_object* t = json_object_array_get_idx(trans, i);
    const std::string p = item_path(path, "transitions", i);
    rd.require_object(t, p);
    Transition tr;
    // "from"/"to" is the document spelling; "from_state"/"to_state" is accepted too.
    tr.from_state = rd.string(t, rd.member(t, "from_state", p, false) ? "from_state" : "from", p);
    tr.to_state = rd.string(t, rd.member(t, "to_state", p, false) ? "to_state" : "to", p);
    tr.rate_function_id = rd.string(t, "rate_function_id", p);
    tr.multiplier = rd.number_opt(t, "multiplier", p).value_or(1.0);
    m.transitions.push_back(tr);
  }
  return m;
}

StimulusProtocol read_protocol(Reader& rd, json_object* root, const std::string& path) {
  StimulusProtocol pr;
  rd.require_object(root, path);
  pr.protocol_id = rd.string(root, "protocol_id", path);

  json_object* hv = rd.object(root, "holding_values", path);
  if (hv) {
    const std::string p = path + ".holding_values";
    pr.holding_values.voltage_mV = rd.number(hv, "voltage_mV", p);
    pr.holding_values.internal_K_mM = rd.number(hv, "internal_K_mM", p);
    pr.holding_values.external_K_mM = rd.number(hv, "external_K_mM", p);
    pr.holding_values.volume_internal_L = rd.number_opt(hv, "volume_internal_L", p);
    pr.holding_values.volume_external_L = rd.number_opt(hv, "volume_external_L", p);
  }

  json_object* epochs = rd.array(root, "epochs", path, false);
  for (std::size_t i = 0; i < array_size(epochs); ++i) {
    json_object* e = json_object_array_get_idx(epochs, i);
    const std::string p = item_path(path, "epochs", i);
    rd.require_object(e, p);
    Epoch ep;
    ep.variable = rd.string(e, "variable", p);
    ep.start_time_ms = rd.number(e, "start_time_ms", p);
    ep.duration_ms = rd.number(e, "duration_ms", p);
    ep.value = rd.number(e, "value", p);
    pr.epochs.push_back(ep);
  }
  return pr;
}

json_object* json_series(const std::vector<double>& v) {
  json_object* arr = json_object_new_array();
  for (double x : v) json_object_array_add(arr, json_object_new_double(x));
  return arr;
}

} // namespace

ChannelModel parse_model_json(const std::string& text) {
  JsonPtr root = parse_json_text(text, "model");
  Reader rd;
  ChannelModel m = read_model(rd, root.get(), "model");
  rd.throw_if_problems();
  return m;
}

StimulusProtocol parse_protocol_json(const std::string& text) {
  JsonPtr root = parse_json_text(text, "protocol");
  Reader rd;
  StimulusProtocol p = read_protocol(rd, root.get(), "protocol");
  rd.throw_if_problems();
  return p;
}

SimulationRequest parse_request_json(const std::string& text) {
  JsonPtr root = parse_json_text(text, "request");
  Reader rd;
  SimulationRequest req;
  rd.require_object(root.get(), "request");

  json_object* model = rd.object(root.get(), "model", "request");
  if (model) req.model = read_model(rd, model, "request.model");
  json_object* protocol = rd.object(root.get(), "protocol", "request");
  if (protocol) req.protocol = read_protocol(rd, protocol, "request.protocol");

  req.duration_ms = rd.number_opt(root.get(), "duration_ms", "request");
  json_object* steps = rd.member(root.get(), "steps", "request", false);
  if (steps) {
    if (!json_object_is_type(steps, json_type_int) || json_object_get_int64(steps) < 0) {
      rd.problems.push_back("request.steps: expected a non-negative integer");
    } else {
      req.steps = static_cast<std::size_t>(json_object_get_int64(steps));
    }
  }

  rd.throw_if_problems();
  return req;
}

std::string read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Cannot open file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

ChannelModel read_model_file(const std::string& path) {
  return parse_model_json(read_text_file(path));
}

StimulusProtocol read_protocol_file(const std::string& path) {
  return parse_protocol_json(read_text_file(path));
}

SimulationRequest read_request_file(const std::string& path) {
  return parse_request_json(read_text_file(path));
}

std::string results_to_json(const SimulationResult& result,
                            const std::map<std::string, std::string>& summary,
                            bool pretty) {
  JsonPtr root(json_object_new_object());
  json_object* o = root.get();

  json_object_object_add(o, "channel_id", json_object_new_string(result.channel_id.c_str()));
  json_object_object_add(o, "protocol_id", json_object_new_string(result.protocol_id.c_str()));
  json_object_object_add(o, "time_ms", json_series(result.time_ms));
  json_object_object_add(o, "voltage_mV", json_series(result.voltage_mV));

  json_object* probs = json_object_new_array();
  for (const auto& p : result.probabilities) json_object_array_add(probs, json_series(p));
  json_object_object_add(o, "probabilities", probs);

  json_object_object_add(o, "total_conductance_nS", json_series(result.total_conductance_nS));
  json_object_object_add(o, "total_current_pA", json_series(result.total_current_pA));
  json_object_object_add(o, "internal_K_mM", json_series(result.internal_K_mM));
  json_object_object_add(o, "external_K_mM", json_series(result.external_K_mM));
  json_object_object_add(o, "nernst_potential_mV", json_series(result.nernst_potential_mV));

  json_object* smap = json_object_new_object();
  for (const auto& [id, idx] : result.state_map) {
    json_object_object_add(smap, id.c_str(), json_object_new_int64(static_cast<int64_t>(idx)));
  }
  json_object_object_add(o, "state_map", smap);

  if (!summary.empty()) {
    json_object* sum = json_object_new_object();
    for (const auto& [k, v] : summary) {
      json_object_object_add(sum, k.c_str(), json_object_new_string(v.c_str()));
    }
    json_object_object_add(o, "summary", sum);
  }

  const int flags = pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN;
  return std::string(json_object_to_json_string_ext(o, flags));
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  fs::create_directories(path);
}

void write_results_json(const std::string& output_dir,
                        const SimulationResult& result,
                        const std::map<std::string, std::string>& summary) {
  ensure_dir(output_dir);
  const std::string path = (fs::path(output_dir) / "results.json").string();
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write results.json: " + path);
  out << results_to_json(result, summary, true) << "\n";
}

void write_table(const std::string& path,
                 const std::vector<std::string>& columns,
                 const std::vector<std::vector<double>>& data_columns,
                 const std::string& header_comment) {
  if (columns.empty()) throw std::runtime_error("write_table: empty table");
  if (columns.size() != data_columns.size()) {
    throw std::runtime_error("write_table: " + std::to_string(columns.size()) + " names for " +
                             std::to_string(data_columns.size()) + " columns");
  }
  const std::size_t nrow = data_columns.front().size();
  for (const auto& col : data_columns) {
    if (col.size() != nrow) throw std::runtime_error("write_table: column length mismatch");
  }

  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write table: " + path);
  out.precision(10);

  if (!header_comment.empty()) out << "# " << header_comment << "\n";
  out << "#";
  for (const auto& c : columns) out << " " << c;
  out << "\n";

  for (std::size_t r = 0; r < nrow; ++r) {
    for (std::size_t c = 0; c < columns.size(); ++c) {
      if (c) out << " ";
      out << data_columns[c][r];
    }
    out << "\n";
  }
}

void write_timeseries_table(const std::string& output_dir, const SimulationResult& result) {
  ensure_dir(output_dir);

  std::vector<std::string> names{"t_ms", "V_mV"};
  std::vector<std::vector<double>> cols{result.time_ms, result.voltage_mV};

  // Columns in state index order.
  std::vector<std::string> ids(result.n_states());
  for (const auto& [id, idx] : result.state_map) ids.at(idx) = id;
  for (std::size_t s = 0; s < ids.size(); ++s) {
    names.push_back("P_" + ids[s]);
    cols.push_back(result.probabilities[s]);
  }

  names.insert(names.end(), {"g_nS", "I_pA", "Kin_mM", "Kout_mM", "EK_mV"});
  cols.push_back(result.total_conductance_nS);
  cols.push_back(result.total_current_pA);
  cols.push_back(result.internal_K_mM);
  cols.push_back(result.external_K_mM);
  cols.push_back(result.nernst_potential_mV);

  write_table((fs::path(output_dir) / "timeseries.dat").string(), names, cols,
              "t [ms], V [mV], P [-], g [nS], I [pA], K [mM], E_K [mV]");
}

void copy_file(const std::string& src, const std::string& dst) {
  std::ifstream in(src, std::ios::binary);
  if (!in) throw std::runtime_error("copy_file: cannot open src " + src);
  std::ofstream out(dst, std::ios::binary);
  if (!out) throw std::runtime_error("copy_file: cannot open dst " + dst);
  out << in.rdbuf();
}

} // namespace ionkin
