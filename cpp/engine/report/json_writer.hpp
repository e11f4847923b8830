#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace rascheck::report {

struct JsonWriteOptions {
  // Pretty output = newlines + indentation
  bool pretty = true;
  int indent_spaces = 2;
};

// Streaming JSON writer. Callers are responsible for key order; the writer
// only handles separators, indentation and escaping.
class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {}

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);

  void string(std::string_view v);
  void boolean(bool v);
  void null_value();

  // Shortest round-trip form; NaN / Inf become null (JSON cannot hold them).
  void number(double v);
  void integer(long long v);

  void key_string(std::string_view k, std::string_view v) {
    key(k);
    string(v);
  }

 private:
  enum class Scope { kObject, kArray };

  void push_scope(Scope s);
  void pop_scope();
  void write_indent();
  void newline_and_indent(bool closing = false);
  void write_comma_if_needed();
  void write_value_prefix_if_needed();

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<Scope> scopes_;
  std::vector<bool> first_;
  int depth_ = 0;
  bool pending_value_ = false;
};

std::string escape_json(std::string_view s);

} // namespace rascheck::report
