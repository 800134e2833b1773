#include <ionkin/config.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ionkin {

namespace {

std::string trim(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  std::size_t j = s.size();
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& key, const std::string& v) {
  std::string x = to_lower(trim(v));
  if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
  if (x == "0" || x == "false" || x == "no" || x == "off") return false;
  throw std::runtime_error("parse_bool: invalid value '" + v + "' for " + key);
}

double parse_double(const std::string& key, const std::string& v) {
  std::string x = trim(v);
  if (x.empty()) throw std::runtime_error("parse_double: empty value for " + key);
  char* end = nullptr;
  double out = std::strtod(x.c_str(), &end);
  if (end == x.c_str() || *end != '\0') {
    throw std::runtime_error("parse_double: invalid number '" + v + "' for " + key);
  }
  return out;
}

std::size_t parse_size(const std::string& key, const std::string& v) {
  double d = parse_double(key, v);
  if (d < 0.0 || d != static_cast<double>(static_cast<std::size_t>(d))) {
    throw std::runtime_error("parse_size: '" + v + "' is not a non-negative integer for " + key);
  }
  return static_cast<std::size_t>(d);
}

std::optional<std::string> get_str_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto sit = ini.find(sec);
  if (sit == ini.end()) return std::nullopt;
  auto kit = sit->second.find(key);
  if (kit == sit->second.end()) return std::nullopt;
  return trim(kit->second);
}

std::string get_str(const IniMap& ini, const std::string& sec, const std::string& key,
                    const std::string& def) {
  return get_str_opt(ini, sec, key).value_or(def);
}

std::optional<double> get_double_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return std::nullopt;
  return parse_double("[" + sec + "] " + key, *v);
}

double get_double(const IniMap& ini, const std::string& sec, const std::string& key, double def) {
  return get_double_opt(ini, sec, key).value_or(def);
}

std::optional<std::size_t> get_size_opt(const IniMap& ini, const std::string& sec, const std::string& key) {
  auto v = get_str_opt(ini, sec, key);
  if (!v) return std::nullopt;
  return parse_size("[" + sec + "] " + key, *v);
}

int get_int(const IniMap& ini, const std::string& sec, const std::string& key, int def) {
  auto v = get_double_opt(ini, sec, key);
  return v ? static_cast<int>(*v) : def;
}

bool get_bool(const IniMap& ini, const std::string& sec, const std::string& key, bool def) {
  auto v = get_str_opt(ini, sec, key);
  return v ? parse_bool("[" + sec + "] " + key, *v) : def;
}

std::string resolve_path(const std::filesystem::path& base, const std::string& p) {
  if (p.empty()) return p;
  std::filesystem::path path(p);
  if (path.is_absolute()) return path.string();
  return (base / path).lexically_normal().string();
}

IniMap parse_ini_stream(std::istream& in) {
  IniMap ini;
  std::string current = "general"; // default if no section
  ini[current] = IniSection{};

  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;

    // Strip comments (# or ;)
    std::size_t cut = line.find_first_of("#;");
    if (cut != std::string::npos) line = line.substr(0, cut);

    line = trim(line);
    if (line.empty()) continue;

    if (line.front() == '[' && line.back() == ']') {
      current = trim(line.substr(1, line.size() - 2));
      if (current.empty()) {
        throw std::runtime_error("INI parse error: empty section at line " + std::to_string(lineno));
      }
      ini[current];
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("INI parse error: expected key=value at line " + std::to_string(lineno));
    }
    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) {
      throw std::runtime_error("INI parse error: empty key at line " + std::to_string(lineno));
    }
    ini[current][key] = val;
  }

  return ini;
}

} // namespace

IniMap parse_ini_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open config INI: " + path);
  }
  return parse_ini_stream(f);
}

IniMap parse_ini_string(const std::string& text) {
  std::istringstream in(text);
  return parse_ini_stream(in);
}

RunConfig load_config(const std::string& ini_path) {
  RunConfig cfg;
  cfg.ini_raw = parse_ini_file(ini_path);

  const IniMap& ini = cfg.ini_raw;
  const std::filesystem::path base = std::filesystem::path(ini_path).parent_path();

  cfg.output_dir = resolve_path(base, get_str(ini, "general", "output_dir", cfg.output_dir));
  cfg.format = to_lower(get_str(ini, "general", "format", cfg.format));
  cfg.omp_threads = get_int(ini, "general", "omp_threads", cfg.omp_threads);

  // input
  cfg.request_path = resolve_path(base, get_str(ini, "input", "request", ""));
  cfg.model_path = resolve_path(base, get_str(ini, "input", "model", ""));
  cfg.protocol_path = resolve_path(base, get_str(ini, "input", "protocol", ""));

  // run
  cfg.duration_ms = get_double_opt(ini, "run", "duration_ms");
  cfg.steps = get_size_opt(ini, "run", "steps");

  // solver
  cfg.solver.abs_tol = get_double(ini, "solver", "abs_tol", cfg.solver.abs_tol);
  cfg.solver.rel_tol = get_double(ini, "solver", "rel_tol", cfg.solver.rel_tol);
  cfg.solver.max_steps = get_size_opt(ini, "solver", "max_steps").value_or(cfg.solver.max_steps);
  cfg.solver.initial_dt = get_double(ini, "solver", "initial_dt_ms", 0.0) * 1e-3;

  // verify
  cfg.verify = get_bool(ini, "verify", "enabled", cfg.verify);
  cfg.verify_tol = get_double(ini, "verify", "tol", cfg.verify_tol);

  // basic sanity
  if (cfg.format != "json" && cfg.format != "table" && cfg.format != "both") {
    throw std::runtime_error("[general] format must be one of: json, table, both");
  }
  const bool has_request = !cfg.request_path.empty();
  const bool has_pair = !cfg.model_path.empty() || !cfg.protocol_path.empty();
  if (has_request == has_pair) {
    throw std::runtime_error("[input] needs either request, or model and protocol");
  }
  if (has_pair && (cfg.model_path.empty() || cfg.protocol_path.empty())) {
    throw std::runtime_error("[input] model and protocol must be given together");
  }
  if (cfg.duration_ms && !(*cfg.duration_ms > 0.0)) throw std::runtime_error("[run] duration_ms must be positive");
  if (cfg.steps && *cfg.steps < 2) throw std::runtime_error("[run] steps must be >= 2");
  if (!(cfg.solver.abs_tol > 0.0)) throw std::runtime_error("[solver] abs_tol must be positive");
  if (!(cfg.solver.rel_tol > 0.0)) throw std::runtime_error("[solver] rel_tol must be positive");
  if (cfg.solver.max_steps == 0) throw std::runtime_error("[solver] max_steps must be positive");
  if (cfg.solver.initial_dt < 0.0) throw std::runtime_error("[solver] initial_dt_ms must be >= 0");
  if (!(cfg.verify_tol > 0.0)) throw std::runtime_error("[verify] tol must be positive");

  return cfg;
}

} // namespace ionkin
