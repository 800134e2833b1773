#include <ionkin/errors.hpp>

#include <sstream>

namespace ionkin {

namespace {

std::string parse_message(const std::string& equation, std::size_t offset, const std::string& description) {
  std::ostringstream os;
  os << "rate equation '" << equation << "': " << description << " at offset " << offset;
  return os.str();
}

std::string failure_message(const std::string& reason, double time_ms) {
  std::ostringstream os;
  os << "integration failed at t=" << time_ms << " ms: " << reason;
  return os.str();
}

std::string join_problems(const std::vector<std::string>& problems) {
  std::string out = "validation failed";
  for (std::size_t i = 0; i < problems.size(); ++i) {
    out += (i == 0) ? ": " : ". ";
    out += problems[i];
  }
  return out;
}

} // namespace

ParseError::ParseError(std::string equation, std::size_t offset, std::string description)
    : Error(parse_message(equation, offset, description)),
      equation_(std::move(equation)),
      offset_(offset),
      description_(std::move(description)) {}

UndefinedSymbolError::UndefinedSymbolError(std::string equation, std::string symbol, std::size_t offset)
    : Error(parse_message(equation, offset, "undefined symbol '" + symbol + "'")),
      equation_(std::move(equation)),
      symbol_(std::move(symbol)),
      offset_(offset) {}

IntegrationFailure::IntegrationFailure(const std::string& reason, double time_ms, std::vector<double> last_state)
    : Error(failure_message(reason, time_ms)),
      time_ms_(time_ms),
      last_state_(std::move(last_state)) {}

ValidationError::ValidationError(std::vector<std::string> problems)
    : Error(join_problems(problems)), problems_(std::move(problems)) {}

} // namespace ionkin
