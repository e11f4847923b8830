#include "engine/report/json_writer.hpp"

#include <cmath>
#include <ostream>

#include "engine/core/strings.hpp"

namespace rascheck::report {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

void JsonWriter::begin_object() {
  write_value_prefix_if_needed();
  os_ << "{";
  push_scope(Scope::kObject);
}

void JsonWriter::end_object() {
  const bool empty = !first_.empty() && first_.back();
  pop_scope();
  if (!empty) newline_and_indent(/*closing=*/true);
  os_ << "}";
  pending_value_ = false;
}

void JsonWriter::begin_array() {
  write_value_prefix_if_needed();
  os_ << "[";
  push_scope(Scope::kArray);
}

void JsonWriter::end_array() {
  const bool empty = !first_.empty() && first_.back();
  pop_scope();
  if (!empty) newline_and_indent(/*closing=*/true);
  os_ << "]";
  pending_value_ = false;
}

void JsonWriter::key(std::string_view k) {
  write_comma_if_needed();
  os_ << "\"" << escape_json(k) << "\":";
  if (opt_.pretty) os_ << " ";
  // Next write is the value.
  pending_value_ = true;
}

void JsonWriter::string(std::string_view v) {
  write_value_prefix_if_needed();
  os_ << "\"" << escape_json(v) << "\"";
  pending_value_ = false;
}

void JsonWriter::boolean(bool v) {
  write_value_prefix_if_needed();
  os_ << (v ? "true" : "false");
  pending_value_ = false;
}

void JsonWriter::null_value() {
  write_value_prefix_if_needed();
  os_ << "null";
  pending_value_ = false;
}

void JsonWriter::number(double v) {
  if (!std::isfinite(v)) {
    null_value();
    return;
  }
  write_value_prefix_if_needed();
  os_ << format_number(v);
  pending_value_ = false;
}

void JsonWriter::integer(long long v) {
  write_value_prefix_if_needed();
  os_ << v;
  pending_value_ = false;
}

void JsonWriter::push_scope(Scope s) {
  scopes_.push_back(s);
  first_.push_back(true);
  depth_++;
  pending_value_ = false;
}

void JsonWriter::pop_scope() {
  if (!scopes_.empty()) {
    scopes_.pop_back();
    first_.pop_back();
    depth_--;
    pending_value_ = false;
  }
}

void JsonWriter::write_indent() {
  if (!opt_.pretty) return;
  for (int i = 0; i < depth_ * opt_.indent_spaces; ++i) os_ << ' ';
}

void JsonWriter::newline_and_indent(bool closing) {
  if (!opt_.pretty) return;
  os_ << "\n";
  if (closing) {
    // pop_scope() already dropped the depth
    for (int i = 0; i < depth_ * opt_.indent_spaces; ++i) os_ << ' ';
  } else {
    write_indent();
  }
}

// Separator + indentation before an array element or an object key.
void JsonWriter::write_comma_if_needed() {
  if (scopes_.empty()) return;
  if (!first_.back()) os_ << ",";
  first_.back() = false;
  newline_and_indent();
}

void JsonWriter::write_value_prefix_if_needed() {
  if (pending_value_) return;  // value after key()
  if (!scopes_.empty() && scopes_.back() == Scope::kArray) write_comma_if_needed();
}

} // namespace rascheck::report
