#include "engine/rules/expr_parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "engine/core/strings.hpp"

namespace rascheck::rules {
namespace {

constexpr int kMaxDepth = 256;

struct FunctionSpec {
  const char* name;
  int min_args;
  int max_args;  // -1 = variadic
  bool aggregate;
  bool attribute_arg;  // single bare attribute name
};

const FunctionSpec kFunctions[] = {
    {"exists", 1, 1, false, true},  {"design", 1, 1, false, true},
    {"abs", 1, 1, false, false},    {"len", 1, 1, false, false},
    {"lower", 1, 1, false, false},  {"min", 1, -1, false, false},
    {"max", 1, -1, false, false},   {"contains", 2, 2, false, false},
    {"count", 0, 1, true, false},   {"any", 1, 1, true, false},
    {"all", 1, 1, true, false},     {"sum", 1, 1, true, false},
    {"mean", 1, 1, true, false},    {"min_of", 1, 1, true, false},
    {"max_of", 1, 1, true, false},
};

const FunctionSpec* find_function(std::string_view name) noexcept {
  for (const auto& f : kFunctions) {
    if (name == f.name) return &f;
  }
  return nullptr;
}

enum class Tok : int { kEnd, kNumber, kString, kName, kOp };

struct Token {
  Tok kind = Tok::kEnd;
  std::string text;
  double number = 0.0;
  int pos = 0;
};

std::vector<Token> tokenize(std::string_view s) {
  std::vector<Token> out;
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    const int pos = static_cast<int>(i);
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1])))) {
      std::size_t j = i;
      while (j < s.size() && (std::isdigit(static_cast<unsigned char>(s[j])) || s[j] == '.')) ++j;
      if (j < s.size() && (s[j] == 'e' || s[j] == 'E')) {
        std::size_t k = j + 1;
        if (k < s.size() && (s[k] == '+' || s[k] == '-')) ++k;
        if (k < s.size() && std::isdigit(static_cast<unsigned char>(s[k]))) {
          j = k;
          while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) ++j;
        }
      }
      const auto v = try_parse_double(s.substr(i, j - i));
      if (!v) throw ExprSyntaxError(pos, "bad number '" + std::string(s.substr(i, j - i)) + "'");
      out.push_back(Token{Tok::kNumber, std::string(s.substr(i, j - i)), *v, pos});
      i = j;
      continue;
    }
    if (c == '"' || c == '\'') {
      std::string text;
      std::size_t j = i + 1;
      bool closed = false;
      while (j < s.size()) {
        if (s[j] == '\\' && j + 1 < s.size()) {
          text.push_back(s[j + 1]);
          j += 2;
          continue;
        }
        if (s[j] == c) {
          closed = true;
          ++j;
          break;
        }
        text.push_back(s[j++]);
      }
      if (!closed) throw ExprSyntaxError(pos, "unterminated string");
      out.push_back(Token{Tok::kString, std::move(text), 0.0, pos});
      i = j;
      continue;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      std::size_t j = i;
      while (j < s.size() && (std::isalnum(static_cast<unsigned char>(s[j])) || s[j] == '_')) ++j;
      out.push_back(Token{Tok::kName, std::string(s.substr(i, j - i)), 0.0, pos});
      i = j;
      continue;
    }
    const std::string_view two = s.substr(i, 2);
    if (two == "==" || two == "!=" || two == "<=" || two == ">=") {
      out.push_back(Token{Tok::kOp, std::string(two), 0.0, pos});
      i += 2;
      continue;
    }
    if (std::string_view("<>+-*/()[],.").find(c) != std::string_view::npos) {
      out.push_back(Token{Tok::kOp, std::string(1, c), 0.0, pos});
      ++i;
      continue;
    }
    throw ExprSyntaxError(pos, std::string("unexpected character '") + c + "'");
  }
  out.push_back(Token{Tok::kEnd, {}, 0.0, static_cast<int>(s.size())});
  return out;
}

ExprPtr node(ExprKind kind, std::string name, int pos) {
  auto e = std::make_unique<Expr>();
  e->kind = kind;
  e->name = std::move(name);
  e->pos = pos;
  return e;
}

class Parser {
 public:
  explicit Parser(std::vector<Token> toks) : toks_(std::move(toks)) {}

  ExprPtr parse_all() {
    ExprPtr e = parse_or();
    if (peek().kind != Tok::kEnd) {
      throw ExprSyntaxError(peek().pos, "unexpected '" + peek().text + "'");
    }
    return e;
  }

 private:
  const Token& peek(std::size_t ahead = 0) const {
    return toks_[std::min(i_ + ahead, toks_.size() - 1)];
  }
  bool is_name(const char* kw, std::size_t ahead = 0) const {
    return peek(ahead).kind == Tok::kName && peek(ahead).text == kw;
  }
  bool is_op(const char* op) const { return peek().kind == Tok::kOp && peek().text == op; }
  Token take() { return toks_[std::min(i_++, toks_.size() - 1)]; }
  void expect_op(const char* op) {
    if (!is_op(op)) {
      throw ExprSyntaxError(peek().pos, std::string("expected '") + op + "'" +
                                            (peek().kind == Tok::kEnd ? " before end of expression"
                                                                      : ", found '" + peek().text + "'"));
    }
    ++i_;
  }

  ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs, int pos) {
    ExprPtr e = node(ExprKind::kBinary, std::move(op), pos);
    e->args.push_back(std::move(lhs));
    e->args.push_back(std::move(rhs));
    return e;
  }

  // Counts open recursive productions; deeper nesting is a syntax error.
  class DepthGuard {
   public:
    explicit DepthGuard(Parser& p) : p_(p) {
      if (++p_.depth_ > kMaxDepth) {
        --p_.depth_;
        throw ExprSyntaxError(p_.peek().pos,
                              "expression nested deeper than " + std::to_string(kMaxDepth) + " levels");
      }
    }
    ~DepthGuard() { --p_.depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    Parser& p_;
  };

  ExprPtr parse_or() {
    const DepthGuard guard(*this);
    ExprPtr lhs = parse_and();
    while (is_name("or")) {
      const int pos = take().pos;
      lhs = binary("or", std::move(lhs), parse_and(), pos);
    }
    return lhs;
  }

  ExprPtr parse_and() {
    ExprPtr lhs = parse_not();
    while (is_name("and")) {
      const int pos = take().pos;
      lhs = binary("and", std::move(lhs), parse_not(), pos);
    }
    return lhs;
  }

  ExprPtr parse_not() {
    if (is_name("not") && !is_name("in", 1)) {
      const int pos = take().pos;
      const DepthGuard guard(*this);
      ExprPtr e = node(ExprKind::kUnary, "not", pos);
      e->args.push_back(parse_not());
      return e;
    }
    return parse_cmp();
  }

  ExprPtr parse_cmp() {
    ExprPtr lhs = parse_sum();
    const Token& t = peek();
    std::string op;
    if (t.kind == Tok::kOp && (t.text == "==" || t.text == "!=" || t.text == "<" ||
                               t.text == "<=" || t.text == ">" || t.text == ">=")) {
      op = t.text;
      ++i_;
    } else if (is_name("in")) {
      op = "in";
      ++i_;
    } else if (is_name("not") && is_name("in", 1)) {
      op = "not in";
      i_ += 2;
    } else {
      return lhs;
    }
    return binary(op, std::move(lhs), parse_sum(), t.pos);
  }

  ExprPtr parse_sum() {
    ExprPtr lhs = parse_product();
    while (is_op("+") || is_op("-")) {
      const Token t = take();
      lhs = binary(t.text, std::move(lhs), parse_product(), t.pos);
    }
    return lhs;
  }

  ExprPtr parse_product() {
    ExprPtr lhs = parse_unary();
    while (is_op("*") || is_op("/")) {
      const Token t = take();
      lhs = binary(t.text, std::move(lhs), parse_unary(), t.pos);
    }
    return lhs;
  }

  ExprPtr parse_unary() {
    if (is_op("-")) {
      const int pos = take().pos;
      const DepthGuard guard(*this);
      ExprPtr e = node(ExprKind::kUnary, "-", pos);
      e->args.push_back(parse_unary());
      return e;
    }
    return parse_primary();
  }

  ExprPtr parse_primary() {
    const Token t = take();
    switch (t.kind) {
      case Tok::kNumber: {
        ExprPtr e = node(ExprKind::kLiteral, {}, t.pos);
        e->literal = model::Value::number(t.number);
        return e;
      }
      case Tok::kString: {
        ExprPtr e = node(ExprKind::kLiteral, {}, t.pos);
        e->literal = model::Value::string(t.text);
        return e;
      }
      case Tok::kOp:
        if (t.text == "(") {
          ExprPtr e = parse_or();
          expect_op(")");
          return e;
        }
        if (t.text == "[") {
          ExprPtr e = node(ExprKind::kList, {}, t.pos);
          if (!is_op("]")) {
            e->args.push_back(parse_or());
            while (is_op(",")) {
              ++i_;
              e->args.push_back(parse_or());
            }
          }
          expect_op("]");
          return e;
        }
        throw ExprSyntaxError(t.pos, "unexpected '" + t.text + "'");
      case Tok::kName:
        return parse_name(t);
      case Tok::kEnd:
      default:
        throw ExprSyntaxError(t.pos, "unexpected end of expression");
    }
  }

  ExprPtr parse_name(const Token& t) {
    if (t.text == "true" || t.text == "false") {
      ExprPtr e = node(ExprKind::kLiteral, {}, t.pos);
      e->literal = model::Value::boolean(t.text == "true");
      return e;
    }
    if (t.text == "and" || t.text == "or" || t.text == "not" || t.text == "in") {
      throw ExprSyntaxError(t.pos, "unexpected keyword '" + t.text + "'");
    }
    if (t.text == "params" && is_op(".")) {
      ++i_;
      const Token p = take();
      if (p.kind != Tok::kName) throw ExprSyntaxError(p.pos, "expected a parameter name after 'params.'");
      return node(ExprKind::kParam, p.text, t.pos);
    }
    if (!is_op("(")) return node(ExprKind::kAttribute, t.text, t.pos);

    const FunctionSpec* fn = find_function(t.text);
    if (!fn) throw ExprSyntaxError(t.pos, "unknown function '" + t.text + "'");
    ++i_;  // (

    ExprPtr call = node(ExprKind::kCall, t.text, t.pos);
    if (fn->aggregate) {
      if (in_aggregate_) throw ExprSyntaxError(t.pos, "aggregate '" + t.text + "' nested in another aggregate");
      in_aggregate_ = true;
    }
    if (!is_op(")")) {
      call->args.push_back(parse_or());
      while (is_op(",")) {
        ++i_;
        call->args.push_back(parse_or());
      }
    }
    expect_op(")");
    if (fn->aggregate) in_aggregate_ = false;

    const int n = static_cast<int>(call->args.size());
    if (n < fn->min_args || (fn->max_args >= 0 && n > fn->max_args)) {
      const std::string want = fn->max_args < 0 ? "at least " + std::to_string(fn->min_args)
                               : fn->min_args == fn->max_args
                                   ? std::to_string(fn->min_args)
                                   : std::to_string(fn->min_args) + ".." + std::to_string(fn->max_args);
      throw ExprSyntaxError(t.pos, "'" + t.text + "' takes " + want + " argument(s), got " + std::to_string(n));
    }
    if (fn->attribute_arg && call->args.front()->kind != ExprKind::kAttribute) {
      throw ExprSyntaxError(t.pos, "'" + t.text + "' takes an attribute name");
    }
    return call;
  }

  std::vector<Token> toks_;
  std::size_t i_ = 0;
  int depth_ = 0;
  bool in_aggregate_ = false;
};

void collect_params(const Expr& e, std::vector<std::string>& out) {
  if (e.kind == ExprKind::kParam &&
      std::find(out.begin(), out.end(), e.name) == out.end()) {
    out.push_back(e.name);
  }
  for (const auto& a : e.args) collect_params(*a, out);
}

} // namespace

ExprHandle parse_expression(std::string_view text) {
  if (trim(text).empty()) throw ExprSyntaxError(0, "empty expression");
  Parser p(tokenize(text));
  return ExprHandle(p.parse_all());
}

bool is_aggregate_function(std::string_view name) noexcept {
  const FunctionSpec* f = find_function(name);
  return f && f->aggregate;
}

bool uses_aggregates(const Expr& e) noexcept {
  if (e.kind == ExprKind::kCall && is_aggregate_function(e.name)) return true;
  for (const auto& a : e.args) {
    if (uses_aggregates(*a)) return true;
  }
  return false;
}

std::vector<std::string> referenced_params(const Expr& e) {
  std::vector<std::string> out;
  collect_params(e, out);
  return out;
}

} // namespace rascheck::rules
