#pragma once

#include <ionkin/integrator.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace ionkin {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

struct RunConfig {
  // [general]; output_dir is resolved against the INI file's directory like [input].
  std::string output_dir = "out";
  std::string format = "both";  // json | table | both
  int omp_threads = 0;          // 0 => leave as-is

  // [input], already resolved against the INI file's directory.
  // Either request, or model + protocol.
  std::string request_path;
  std::string model_path;
  std::string protocol_path;

  // [run] (override the request's values when set)
  std::optional<double> duration_ms;
  std::optional<std::size_t> steps;

  // [solver]; initial_dt is in seconds here, the INI key is initial_dt_ms.
  IntegratorOptions solver;

  // [verify]
  bool verify = true;
  double verify_tol = 1e-6;

  IniMap ini_raw;

  bool emit_json() const { return format == "json" || format == "both"; }
  bool emit_table() const { return format == "table" || format == "both"; }
};

IniMap parse_ini_file(const std::string& path);
IniMap parse_ini_string(const std::string& text);

RunConfig load_config(const std::string& ini_path);

} // namespace ionkin
