#pragma once

#include <ionkin/expression.hpp>
#include <ionkin/types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ionkin {

// Dense n x n matrix, row-major.
class SquareMatrix {
public:
  SquareMatrix() = default;
  explicit SquareMatrix(std::size_t n) : n_(n), a_(n * n, 0.0) {}

  std::size_t size() const { return n_; }

  double& operator()(std::size_t row, std::size_t col) { return a_[row * n_ + col]; }
  double operator()(std::size_t row, std::size_t col) const { return a_[row * n_ + col]; }

  void set_zero();

  // y = A x. x and y must have size n; y is overwritten.
  void multiply(const double* x, double* y) const;
  std::vector<double> multiply(const std::vector<double>& x) const;

  double column_sum(std::size_t col) const;

private:
  std::size_t n_ = 0;
  std::vector<double> a_;
};

// Assembles the continuous-time Markov generator Q(V) from the channel topology.
// Q[to][from] holds the rate from -> to; Q[s][s] is minus the total outflow of s,
// so every column sums to zero and dP/dt = Q P conserves total probability.
class GeneratorMatrixBuilder {
public:
  GeneratorMatrixBuilder() = default;

  // `rates` must contain every rate_function_id the model references and every
  // transition endpoint must be a declared state (std::out_of_range otherwise).
  GeneratorMatrixBuilder(const ChannelModel& model,
                         const std::map<std::string, RateFunction>& rates);

  std::size_t size() const { return n_; }

  SquareMatrix build(double V) const;

  // Overwrites Q, which must already be size() x size().
  void build(double V, SquareMatrix& Q) const;

private:
  struct Edge {
    std::size_t from = 0;
    std::size_t to = 0;
    std::size_t rate = 0;   // index into rates_
    double multiplier = 1.0;
  };

  std::size_t n_ = 0;
  std::vector<RateFunction> rates_;  // unique rate functions referenced by edges_
  std::vector<Edge> edges_;
};

} // namespace ionkin
