#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace ionkin {

// Base of every error raised by the library.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed rate equation.
class ParseError : public Error {
public:
  ParseError(std::string equation, std::size_t offset, std::string description);

  const std::string& equation() const { return equation_; }
  std::size_t offset() const { return offset_; }
  const std::string& description() const { return description_; }

private:
  std::string equation_;
  std::size_t offset_ = 0;
  std::string description_;
};

// Identifier other than V / exp in a rate equation.
class UndefinedSymbolError : public Error {
public:
  UndefinedSymbolError(std::string equation, std::string symbol, std::size_t offset);

  const std::string& equation() const { return equation_; }
  const std::string& symbol() const { return symbol_; }
  std::size_t offset() const { return offset_; }

private:
  std::string equation_;
  std::string symbol_;
  std::size_t offset_ = 0;
};

// The ODE solver could not advance. Carries the last finite state it reached.
class IntegrationFailure : public Error {
public:
  IntegrationFailure(const std::string& reason, double time_ms, std::vector<double> last_state);

  double time_ms() const { return time_ms_; }
  const std::vector<double>& last_state() const { return last_state_; }

private:
  double time_ms_ = 0.0;
  std::vector<double> last_state_;
};

// Input documents failed schema or referential checks.
class ValidationError : public Error {
public:
  explicit ValidationError(std::vector<std::string> problems);

  const std::vector<std::string>& problems() const { return problems_; }

private:
  std::vector<std::string> problems_;
};

} // namespace ionkin
