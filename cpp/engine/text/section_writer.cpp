#include "engine/text/section_writer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "engine/core/error.hpp"
#include "engine/core/strings.hpp"

namespace rascheck::text {
namespace {

// "0.035" -> ".035", "-0.5" -> "-.5", "1e-05" -> "1e-5". Same value.
std::string compact_number(std::string s) {
  if (s.rfind("0.", 0) == 0) {
    s.erase(0, 1);
  } else if (s.rfind("-0.", 0) == 0) {
    s.erase(1, 1);
  }
  const std::size_t e = s.find('e');
  if (e != std::string::npos) {
    std::size_t i = e + 1;
    if (i < s.size() && s[i] == '+') s.erase(i, 1);
    else if (i < s.size() && s[i] == '-') ++i;
    while (i + 1 < s.size() && s[i] == '0') s.erase(i, 1);
  }
  return s;
}

// Shortest exact text (compacted if needed), else the most precise %g that
// fits `width`.
std::string fit_number(double v, int width) {
  std::string s = format_number(v);
  if (static_cast<int>(s.size()) <= width) return s;
  const std::string c = compact_number(s);
  if (static_cast<int>(c.size()) <= width) return c;
  char buf[64];
  for (int p = 15; p >= 1; --p) {
    std::snprintf(buf, sizeof(buf), "%.*g", p, v);
    const std::string g = compact_number(buf);
    if (static_cast<int>(g.size()) <= width) return g;
  }
  return s;
}

std::string pad_left(const std::string& s, int width) {
  if (static_cast<int>(s.size()) >= width) return s;
  return std::string(static_cast<std::size_t>(width) - s.size(), ' ') + s;
}

std::string number_list(const std::vector<double>& v) {
  if (v.size() == 1 && std::isnan(v.front())) return "nan";
  std::vector<std::string> parts;
  parts.reserve(v.size());
  for (double d : v) parts.push_back(std::isnan(d) ? std::string() : format_number(d));
  return join(parts, ",");
}

class Writer {
 public:
  explicit Writer(const FileLayout& layout) : layout_(layout) {}

  std::string str() const { return out_.str(); }

  void record(const RawRecord& r) {
    if (r.section.empty()) {
      for (const auto& f : r.fields) root_field(f);
      return;
    }
    if (r.opaque) {
      out_ << "BEGIN " << r.section << ":\n";
      for (const auto& f : r.fields) out_ << f.value.as_string() << "\n";
      out_ << "END " << r.section << ":\n";
      return;
    }

    const SectionLayout* s = layout_.section_by_name(r.section);
    const bool begin_end = s && s->begin_end;
    if (begin_end) out_ << "BEGIN " << r.section << ":\n";
    for (const auto& f : r.fields) section_field(s, f);
    if (begin_end) out_ << "END " << r.section << ":\n";
  }

 private:
  void root_field(const Field& f) {
    if (f.raw) {
      out_ << f.value.as_string() << "\n";
      return;
    }
    const FieldLayout* fl = layout_.root_field(f.name);
    if (!fl) {
      for (const auto& b : layout_.root_fields) {
        if (b.type == FieldType::kBare && b.keyword == f.name) fl = &b;
      }
    }
    typed(fl, f);
  }

  void section_field(const SectionLayout* s, const Field& f) {
    if (f.raw) {
      out_ << f.value.as_string() << "\n";
      return;
    }
    if (s && !s->begin_end && f.name == s->opener) {
      out_ << f.name << "=" << join(f.value.as_strings(), ",") << "\n";
      return;
    }
    if (s && !s->trailing_field.empty() && f.name == s->trailing_field) {
      rows(f.value.as_numbers(), 1);
      return;
    }
    const FieldLayout* fl = s ? s->field(f.name) : nullptr;
    if (!fl && s) {
      for (const auto& b : s->fields) {
        if (b.type == FieldType::kBare && b.keyword == f.name) fl = &b;
      }
    }
    typed(fl, f);
  }

  void typed(const FieldLayout* fl, const Field& f) {
    const FieldType type = fl ? fl->type : FieldType::kString;
    switch (type) {
      case FieldType::kBare:
        out_ << f.value.as_string() << "\n";
        return;
      case FieldType::kTextBlock:
        out_ << "BEGIN " << f.name << ":\n";
        if (!f.value.as_string().empty()) out_ << f.value.as_string() << "\n";
        out_ << "END " << f.name << ":\n";
        return;
      case FieldType::kTable: {
        const int vpe = std::max(1, fl->values_per_entry);
        std::string header = f.header;
        if (header.empty()) header = std::to_string(f.value.as_numbers().size() / vpe);
        out_ << f.name << "=" << header << "\n";
        rows(f.value.as_numbers(), vpe);
        return;
      }
      default:
        break;
    }

    out_ << f.name << "=";
    switch (f.value.kind()) {
      case FieldValueKind::kMissing:
        break;
      case FieldValueKind::kNumber:
        out_ << format_number(f.value.as_number());
        break;
      case FieldValueKind::kString:
        out_ << f.value.as_string();
        break;
      case FieldValueKind::kNumberList:
        out_ << number_list(f.value.as_numbers());
        break;
      case FieldValueKind::kStringList:
        out_ << join(f.value.as_strings(), ",");
        break;
    }
    out_ << "\n";
  }

  void rows(const std::vector<double>& values, int vpe) {
    if (values.empty()) return;
    const int width = std::max(1, layout_.column_width);
    const int per_line = std::max(vpe, (layout_.values_per_line / vpe) * vpe);
    const bool fixed = layout_.table_delimiter == Delimiter::kFixedWidth;

    std::string line;
    int in_line = 0;
    for (double v : values) {
      std::string cell = fixed ? fit_number(v, width) : format_number(v);
      cell = pad_left(cell, width);
      // Whitespace-delimited rows need a separator even for wide cells.
      if (!fixed && !line.empty() && cell.front() != ' ') line += ' ';
      line += cell;
      if (++in_line == per_line) {
        out_ << line << "\n";
        line.clear();
        in_line = 0;
      }
    }
    if (!line.empty()) out_ << line << "\n";
  }

  const FileLayout& layout_;
  std::ostringstream out_;
};

} // namespace

std::string write_records(const std::vector<RawRecord>& records, const FileLayout& layout) {
  Writer w(layout);
  for (const auto& r : records) {
    if (r.section.empty()) w.record(r);
  }
  for (const auto& r : records) {
    if (!r.section.empty()) w.record(r);
  }
  return w.str();
}

std::string write_text(const ParsedTextFile& file, const LayoutRegistry& registry) {
  const FileLayout* layout = registry.by_name(file.layout_name);
  RASCHECK_REQUIRE(layout != nullptr, ErrorCode::kInvalidArgument,
                   "write_text: unknown layout '" + file.layout_name + "'");
  return write_records(file.records, *layout);
}

} // namespace rascheck::text
