#include <ionkin/expression.hpp>

#include <ionkin/errors.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace ionkin {

namespace {

enum class Tok { number, ident, plus, minus, star, slash, lparen, rparen, end };

struct Token {
  Tok kind = Tok::end;
  std::size_t offset = 0;
  std::string text;
  double number = 0.0;
};

class Lexer {
public:
  explicit Lexer(const std::string& src) : src_(src) {}

  Token next() {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;

    Token t;
    t.offset = pos_;
    if (pos_ >= src_.size()) {
      t.kind = Tok::end;
      return t;
    }

    const char c = src_[pos_];
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') return number();
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') return identifier();

    ++pos_;
    t.text = std::string(1, c);
    switch (c) {
      case '+': t.kind = Tok::plus; return t;
      case '-': t.kind = Tok::minus; return t;
      case '*': t.kind = Tok::star; return t;
      case '/': t.kind = Tok::slash; return t;
      case '(': t.kind = Tok::lparen; return t;
      case ')': t.kind = Tok::rparen; return t;
      default: break;
    }
    throw ParseError(src_, t.offset, "unexpected character '" + t.text + "'");
  }

private:
  bool digit_at(std::size_t i) const {
    return i < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i]));
  }

  // digits [ '.' digits ] [ ('e'|'E') ['+'|'-'] digits ], or '.' digits ...
  Token number() {
    Token t;
    t.kind = Tok::number;
    t.offset = pos_;

    std::size_t i = pos_;
    bool mantissa = false;
    while (digit_at(i)) { ++i; mantissa = true; }
    if (i < src_.size() && src_[i] == '.') {
      ++i;
      while (digit_at(i)) { ++i; mantissa = true; }
    }
    if (!mantissa) {
      throw ParseError(src_, t.offset, "malformed number");
    }
    if (i < src_.size() && (src_[i] == 'e' || src_[i] == 'E')) {
      std::size_t j = i + 1;
      if (j < src_.size() && (src_[j] == '+' || src_[j] == '-')) ++j;
      if (!digit_at(j)) {
        throw ParseError(src_, i, "malformed exponent");
      }
      while (digit_at(j)) ++j;
      i = j;
    }

    t.text = src_.substr(pos_, i - pos_);
    char* end = nullptr;
    t.number = std::strtod(t.text.c_str(), &end);
    if (end == t.text.c_str() || *end != '\0') {
      throw ParseError(src_, t.offset, "invalid number '" + t.text + "'");
    }
    pos_ = i;
    return t;
  }

  Token identifier() {
    Token t;
    t.kind = Tok::ident;
    t.offset = pos_;
    std::size_t i = pos_;
    while (i < src_.size() &&
           (std::isalnum(static_cast<unsigned char>(src_[i])) || src_[i] == '_')) ++i;
    t.text = src_.substr(pos_, i - pos_);
    pos_ = i;
    return t;
  }

  const std::string& src_;
  std::size_t pos_ = 0;
};

ExprPtr make(Expr e) {
  return std::make_shared<const Expr>(std::move(e));
}

class Parser {
public:
  explicit Parser(const std::string& src) : src_(src), lex_(src) { advance(); }

  ExprPtr parse() {
    if (cur_.kind == Tok::end) {
      throw ParseError(src_, cur_.offset, "empty expression");
    }
    ExprPtr e = expr();
    if (cur_.kind != Tok::end) {
      throw ParseError(src_, cur_.offset, "unexpected token '" + cur_.text + "'");
    }
    return e;
  }

private:
  void advance() { cur_ = lex_.next(); }

  void expect(Tok kind, const char* what) {
    if (cur_.kind != kind) {
      std::string got = (cur_.kind == Tok::end) ? std::string("end of input") : ("'" + cur_.text + "'");
      throw ParseError(src_, cur_.offset, std::string("expected ") + what + ", got " + got);
    }
    advance();
  }

  ExprPtr expr() {
    ExprPtr lhs = term();
    while (cur_.kind == Tok::plus || cur_.kind == Tok::minus) {
      char op = (cur_.kind == Tok::plus) ? '+' : '-';
      advance();
      ExprPtr rhs = term();
      lhs = make(Expr{BinaryOp{op, lhs, rhs}});
    }
    return lhs;
  }

  ExprPtr term() {
    ExprPtr lhs = unary();
    while (cur_.kind == Tok::star || cur_.kind == Tok::slash) {
      char op = (cur_.kind == Tok::star) ? '*' : '/';
      advance();
      ExprPtr rhs = unary();
      lhs = make(Expr{BinaryOp{op, lhs, rhs}});
    }
    return lhs;
  }

  ExprPtr unary() {
    if (cur_.kind == Tok::plus) {
      advance();
      return unary();
    }
    if (cur_.kind == Tok::minus) {
      advance();
      return make(Expr{UnaryCall{UnaryFn::negate, unary()}});
    }
    return primary();
  }

  ExprPtr primary() {
    switch (cur_.kind) {
      case Tok::number: {
        double v = cur_.number;
        advance();
        return make(Expr{Literal{v}});
      }
      case Tok::lparen: {
        advance();
        ExprPtr e = expr();
        expect(Tok::rparen, "')'");
        return e;
      }
      case Tok::ident: {
        Token id = cur_;
        if (id.text == "V") {
          advance();
          return make(Expr{Variable{}});
        }
        if (id.text == "exp") {
          advance();
          expect(Tok::lparen, "'(' after exp");
          ExprPtr arg = expr();
          expect(Tok::rparen, "')'");
          return make(Expr{UnaryCall{UnaryFn::exp, arg}});
        }
        throw UndefinedSymbolError(src_, id.text, id.offset);
      }
      case Tok::end:
        throw ParseError(src_, cur_.offset, "unexpected end of input");
      default:
        throw ParseError(src_, cur_.offset, "unexpected token '" + cur_.text + "'");
    }
  }

  const std::string& src_;
  Lexer lex_;
  Token cur_;
};

double apply_binary(char op, double a, double b) {
  switch (op) {
    case '+': return a + b;
    case '-': return a - b;
    case '*': return a * b;
    case '/': return a / b;
    default: break;
  }
  throw std::runtime_error(std::string("apply_binary: unknown operator '") + op + "'");
}

double apply_unary(UnaryFn fn, double a) {
  return (fn == UnaryFn::exp) ? std::exp(a) : -a;
}

struct Evaluator {
  double V;

  double operator()(const Literal& l) const { return l.value; }
  double operator()(const Variable&) const { return V; }
  double operator()(const BinaryOp& b) const {
    return apply_binary(b.op, std::visit(*this, b.lhs->node), std::visit(*this, b.rhs->node));
  }
  double operator()(const UnaryCall& u) const {
    return apply_unary(u.fn, std::visit(*this, u.arg->node));
  }
};

struct VoltageProbe {
  bool operator()(const Literal&) const { return false; }
  bool operator()(const Variable&) const { return true; }
  bool operator()(const BinaryOp& b) const {
    return std::visit(*this, b.lhs->node) || std::visit(*this, b.rhs->node);
  }
  bool operator()(const UnaryCall& u) const { return std::visit(*this, u.arg->node); }
};

} // namespace

ExprPtr parse_expression(const std::string& equation) {
  Parser p(equation);
  return p.parse();
}

ExprPtr fold_constants(const ExprPtr& e) {
  if (!depends_on_voltage(*e)) {
    if (std::holds_alternative<Literal>(e->node)) return e;
    return make(Expr{Literal{evaluate(*e, 0.0)}});
  }
  if (const auto* b = std::get_if<BinaryOp>(&e->node)) {
    return make(Expr{BinaryOp{b->op, fold_constants(b->lhs), fold_constants(b->rhs)}});
  }
  if (const auto* u = std::get_if<UnaryCall>(&e->node)) {
    return make(Expr{UnaryCall{u->fn, fold_constants(u->arg)}});
  }
  return e;
}

double evaluate(const Expr& e, double V) {
  return std::visit(Evaluator{V}, e.node);
}

bool depends_on_voltage(const Expr& e) {
  return std::visit(VoltageProbe{}, e.node);
}

RateFunction::RateFunction(std::string equation, ExprPtr root)
    : equation_(std::move(equation)), root_(std::move(root)) {
  if (!root_) {
    throw std::runtime_error("RateFunction: null expression for '" + equation_ + "'");
  }
}

bool RateFunction::is_constant() const {
  return !depends_on_voltage(*root_);
}

RateFunction compile_rate_equation(const std::string& equation) {
  return RateFunction(equation, fold_constants(parse_expression(equation)));
}

} // namespace ionkin
