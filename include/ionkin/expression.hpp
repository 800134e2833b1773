#pragma once

#include <memory>
#include <string>
#include <variant>

namespace ionkin {

// Expression tree for rate equations in the single free variable V [mV].
//
// Grammar (recursive descent, usual precedence, left-associative):
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/') unary)*
//   unary   := ('+' | '-') unary | primary
//   primary := number | 'V' | 'exp' '(' expr ')' | '(' expr ')'
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

enum class UnaryFn { negate, exp };

struct Literal {
  double value = 0.0;
};

struct Variable {};

struct BinaryOp {
  char op = '+';  // one of + - * /
  ExprPtr lhs;
  ExprPtr rhs;
};

struct UnaryCall {
  UnaryFn fn = UnaryFn::negate;
  ExprPtr arg;
};

struct Expr {
  std::variant<Literal, Variable, BinaryOp, UnaryCall> node;
};

// Throws ParseError / UndefinedSymbolError.
ExprPtr parse_expression(const std::string& equation);

// Collapse every subtree that does not depend on V into a Literal.
ExprPtr fold_constants(const ExprPtr& e);

double evaluate(const Expr& e, double V);

bool depends_on_voltage(const Expr& e);

// Compiled rate function f(V) -> rate. Cheap to copy; the tree is shared and immutable,
// so one instance may be called concurrently from several threads.
class RateFunction {
public:
  RateFunction() = default;
  RateFunction(std::string equation, ExprPtr root);

  double operator()(double V) const { return evaluate(*root_, V); }

  const std::string& equation() const { return equation_; }
  const Expr& root() const { return *root_; }
  bool is_constant() const;

private:
  std::string equation_;
  ExprPtr root_;
};

RateFunction compile_rate_equation(const std::string& equation);

} // namespace ionkin
