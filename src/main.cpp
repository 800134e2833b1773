#include <ionkin/config.hpp>
#include <ionkin/engine.hpp>
#include <ionkin/io.hpp>
#include <ionkin/validate.hpp>
#include <ionkin/verify.hpp>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#ifdef IONKIN_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "ionkin: Markov ion-channel kinetics with coupled K+ concentrations\n"
            << "Usage:\n"
            << "  ionkin --config <path/to/run.ini>\n"
            << "  ionkin --stdin < request.json\n";
}

std::string num(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

ionkin::ValidationReport validate_all(const ionkin::SimulationRequest& req, double duration_ms,
                                      std::size_t steps) {
  ionkin::ValidationReport rep = ionkin::validate_model(req.model);
  rep.merge(ionkin::validate_protocol(req.protocol));
  rep.merge(ionkin::validate_run(duration_ms, steps));
  return rep;
}

// Request on stdin, results JSON on stdout. Nothing else is written to stdout.
int run_stdin() {
  std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
  ionkin::SimulationRequest req = ionkin::parse_request_json(text);
  if (!req.duration_ms || !req.steps) {
    throw std::runtime_error("request: duration_ms and steps are required in --stdin mode");
  }

  ionkin::ValidationReport rep = validate_all(req, *req.duration_ms, *req.steps);
  for (const auto& w : rep.warnings) std::cerr << "[validate] warning: " << w << "\n";
  ionkin::require_valid(rep);

  ionkin::SimulationEngine engine(req.model, req.protocol);
  ionkin::SimulationResult res = engine.run(*req.duration_ms, *req.steps);
  std::cout << ionkin::results_to_json(res) << "\n";
  return 0;
}

int run_config(const std::string& cfg_path) {
  ionkin::RunConfig cfg = ionkin::load_config(cfg_path);

#ifdef IONKIN_HAS_OPENMP
  if (cfg.omp_threads > 0) {
    omp_set_num_threads(cfg.omp_threads);
  }
#endif

  ionkin::SimulationRequest req;
  if (!cfg.request_path.empty()) {
    req = ionkin::read_request_file(cfg.request_path);
  } else {
    req.model = ionkin::read_model_file(cfg.model_path);
    req.protocol = ionkin::read_protocol_file(cfg.protocol_path);
  }

  const auto duration = cfg.duration_ms ? cfg.duration_ms : req.duration_ms;
  const auto steps = cfg.steps ? cfg.steps : req.steps;
  if (!duration || !steps) {
    throw std::runtime_error("duration_ms and steps must be given in [run] or in the request");
  }

  ionkin::ValidationReport rep = validate_all(req, *duration, *steps);
  for (const auto& w : rep.warnings) std::cout << "[validate] warning: " << w << "\n";
  for (const auto& e : rep.errors) std::cerr << "[validate] error: " << e << "\n";
  ionkin::require_valid(rep);

  // Create output root, copy config
  ionkin::ensure_dir(cfg.output_dir);
  ionkin::copy_file(cfg_path, (std::filesystem::path(cfg.output_dir) / "config_used.ini").string());

  ionkin::SimulationEngine engine(req.model, req.protocol, cfg.solver);
  std::cout << "[run] channel " << req.model.channel_id << " (" << engine.n_states() << " states, "
            << req.model.transitions.size() << " transitions) under protocol " << req.protocol.protocol_id
            << ": " << *duration << " ms, " << *steps << " samples\n";

  ionkin::SimulationResult res = engine.run(*duration, *steps);

  const std::size_t last = res.n_samples() - 1;
  std::cout << "[run] final: I = " << res.total_current_pA[last] << " pA, Kin = " << res.internal_K_mM[last]
            << " mM, Kout = " << res.external_K_mM[last] << " mM, E_K = " << res.nernst_potential_mV[last]
            << " mV\n";

  std::map<std::string, std::string> summary{
      {"duration_ms", num(*duration)},
      {"steps", std::to_string(*steps)},
      {"abs_tol", num(cfg.solver.abs_tol)},
      {"rel_tol", num(cfg.solver.rel_tol)},
  };

  bool audit_ok = true;
  if (cfg.verify) {
    auto v = ionkin::verify_result(res, cfg.verify_tol);
    std::cout << "[verify] probability drift: " << v.max_probability_drift
              << " (ok=" << (v.probability_ok ? "true" : "false") << ")\n";
    std::cout << "[verify] min occupancy: " << v.min_occupancy
              << " (ok=" << (v.occupancy_ok ? "true" : "false") << ")\n";
    std::cout << "[verify] finite: " << (v.finite_ok ? "true" : "false") << "\n";
    std::cout << "[verify] K+ mass rel_err=" << v.mass_rel_error
              << " (ok=" << (v.mass_ok ? "true" : "false") << ")\n";
    audit_ok = v.all_ok();
    summary["verify"] = audit_ok ? "pass" : "fail";
  }

  if (cfg.emit_json()) ionkin::write_results_json(cfg.output_dir, res, summary);
  if (cfg.emit_table()) ionkin::write_timeseries_table(cfg.output_dir, res);

  std::cout << "Done. Output in: " << cfg.output_dir << "\n";
  return audit_ok ? 0 : 4;
}

} // namespace

int main(int argc, char** argv) {
  try {
    std::string cfg_path;
    bool from_stdin = false;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if (a == "--stdin") {
        from_stdin = true;
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }
    if (cfg_path.empty() == !from_stdin) {
      print_usage();
      return 2;
    }

    return from_stdin ? run_stdin() : run_config(cfg_path);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
