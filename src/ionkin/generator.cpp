#include <ionkin/generator.hpp>

#include <algorithm>
#include <stdexcept>

namespace ionkin {

void SquareMatrix::set_zero() {
  std::fill(a_.begin(), a_.end(), 0.0);
}

void SquareMatrix::multiply(const double* x, double* y) const {
  for (std::size_t i = 0; i < n_; ++i) {
    const double* row = a_.data() + i * n_;
    double s = 0.0;
    for (std::size_t j = 0; j < n_; ++j) s += row[j] * x[j];
    y[i] = s;
  }
}

std::vector<double> SquareMatrix::multiply(const std::vector<double>& x) const {
  if (x.size() != n_) throw std::runtime_error("SquareMatrix::multiply: size mismatch");
  std::vector<double> y(n_, 0.0);
  multiply(x.data(), y.data());
  return y;
}

double SquareMatrix::column_sum(std::size_t col) const {
  double s = 0.0;
  for (std::size_t i = 0; i < n_; ++i) s += (*this)(i, col);
  return s;
}

GeneratorMatrixBuilder::GeneratorMatrixBuilder(const ChannelModel& model,
                                               const std::map<std::string, RateFunction>& rates)
    : n_(model.states.size()) {
  std::map<std::string, std::size_t> state_index;
  for (std::size_t i = 0; i < model.states.size(); ++i) state_index[model.states[i].id] = i;

  // Resolve each referenced function once so build() never touches a string.
  std::map<std::string, std::size_t> rate_index;
  for (const auto& tr : model.transitions) {
    auto it = rate_index.find(tr.rate_function_id);
    std::size_t r = 0;
    if (it == rate_index.end()) {
      r = rates_.size();
      rates_.push_back(rates.at(tr.rate_function_id));
      rate_index.emplace(tr.rate_function_id, r);
    } else {
      r = it->second;
    }
    edges_.push_back(Edge{state_index.at(tr.from_state), state_index.at(tr.to_state), r, tr.multiplier});
  }
}

SquareMatrix GeneratorMatrixBuilder::build(double V) const {
  SquareMatrix Q(n_);
  build(V, Q);
  return Q;
}

void GeneratorMatrixBuilder::build(double V, SquareMatrix& Q) const {
  if (Q.size() != n_) throw std::runtime_error("GeneratorMatrixBuilder::build: matrix size mismatch");
  Q.set_zero();

  // A function shared by several transitions is evaluated once per call.
  double stack_buf[16];
  std::vector<double> heap_buf;
  double* f = stack_buf;
  if (rates_.size() > 16) {
    heap_buf.resize(rates_.size());
    f = heap_buf.data();
  }
  for (std::size_t r = 0; r < rates_.size(); ++r) f[r] = rates_[r](V);

  for (const auto& e : edges_) {
    const double rate = f[e.rate] * e.multiplier;
    Q(e.to, e.from) += rate;
    Q(e.from, e.from) -= rate;
  }
}

} // namespace ionkin
