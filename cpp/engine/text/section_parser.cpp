#include "engine/text/section_parser.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"

namespace rascheck::text {
namespace {

bool starts_with(std::string_view s, std::string_view p) noexcept {
  return s.size() >= p.size() && s.substr(0, p.size()) == p;
}

std::string rstrip(std::string_view s) {
  std::size_t e = s.size();
  while (e > 0 && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return std::string(s.substr(0, e));
}

std::vector<std::string> split_lines(std::string_view content) {
  if (starts_with(content, "\xEF\xBB\xBF")) content.remove_prefix(3);
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < content.size()) {
    std::size_t nl = content.find('\n', start);
    if (nl == std::string_view::npos) nl = content.size();
    std::string_view line = content.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.emplace_back(line);
    start = nl + 1;
  }
  return lines;
}

// "BEGIN DESCRIPTION:" -> "DESCRIPTION"
std::string block_name(std::string_view t, std::string_view prefix) {
  std::string n = trim(t.substr(prefix.size()));
  if (!n.empty() && n.back() == ':') n.pop_back();
  return trim(n);
}

class SectionParser {
 public:
  SectionParser(const SourceRef& source, const FileLayout& layout, const ParseSettings& opt)
      : layout_(layout), opt_(opt) {
    out_.source = source;
    out_.layout_name = layout.name;
    RawRecord root;
    root.section = "";
    root.ordinal = 0;
    root.line = 1;
    out_.records.push_back(std::move(root));
  }

  ParsedTextFile run(std::string_view content) {
    const std::vector<std::string> lines = split_lines(content);
    int n = 0;
    for (const auto& raw : lines) {
      ++n;
      on_line(raw, n);
    }
    const int eof = n + 1;
    if (block_) {
      truncation(eof, "text block '" + block_->name + "' not terminated before end of file");
      finish_block();
    }
    if (table_) finish_table(eof);
    close_current(eof);
    return std::move(out_);
  }

 private:
  struct PendingTable {
    std::size_t record = 0;
    std::size_t field = 0;
    std::size_t want = 0;
    bool unbounded = false;
    std::vector<double> values;
  };

  struct PendingBlock {
    std::size_t record = 0;
    std::size_t field = 0;
    std::string name;
    std::vector<std::string> lines;
  };

  // ----------------------------- diagnostics ---------------------------------
  [[noreturn]] void fail(int line, const std::string& reason) const {
    throw ParseError(out_.source.path, line, reason);
  }

  void warn(std::size_t record, int line, std::string msg) {
    out_.records[record].warnings.push_back(Diagnostic{line, std::move(msg)});
  }

  std::size_t target() const noexcept { return current_ ? *current_ : 0; }

  void truncation(int line, const std::string& msg) {
    if (opt_.strict) fail(line, msg);
    const std::size_t rec = target();
    out_.records[rec].truncated = true;
    out_.truncated = true;
    warn(rec, line, "truncated: " + msg);
  }

  // ----------------------------- line dispatch -------------------------------
  void on_line(const std::string& raw, int n) {
    const std::string t = trim(raw);

    if (block_) {
      if (starts_with(t, "END ") && block_name(t, "END ") == block_->name) {
        finish_block();
      } else {
        block_->lines.push_back(rstrip(raw));
      }
      return;
    }

    if (opaque_) {
      if (starts_with(t, "END ") && block_name(t, "END ") == out_.records[*current_].section) {
        end_current();
      } else {
        add_raw(*current_, raw, n);
      }
      return;
    }

    if (table_) {
      if (is_data_line(t)) {
        consume_row(raw, n);
        return;
      }
      finish_table(n);
    }

    if (t.empty()) return;

    if (starts_with(t, "BEGIN ")) {
      on_begin(t, n);
      return;
    }
    if (starts_with(t, "END ")) {
      on_end(t, raw, n);
      return;
    }

    if (current_layout_) {
      if (const FieldLayout* f = current_layout_->bare_field(t)) {
        push_field(*current_, Field{f->keyword, FieldValue::string(t), {}, false, n});
        return;
      }
    }
    if (const FieldLayout* f = layout_.root_bare(t)) {
      push_field(0, Field{f->keyword, FieldValue::string(t), {}, false, n});
      return;
    }

    const std::size_t eq = t.find('=');
    if (eq == std::string::npos) {
      on_unrecognized(raw, n);
      return;
    }

    const std::string key = trim(std::string_view(t).substr(0, eq));
    const std::string_view value = std::string_view(t).substr(eq + 1);

    if (const SectionLayout* s = layout_.section_by_opener(key)) {
      open_keyword_section(*s, value, n);
      return;
    }
    if (current_layout_) {
      if (const FieldLayout* f = current_layout_->field(key)) {
        add_typed(*current_, *f, key, value, n);
        return;
      }
    }
    if (const FieldLayout* f = layout_.root_field(key)) {
      add_typed(0, *f, key, value, n);
      return;
    }
    on_unknown_key(key, value, n);
  }

  bool is_data_line(const std::string& t) const {
    if (t.empty()) return false;
    if (t.find('=') != std::string::npos) return false;
    if (starts_with(t, "BEGIN ") || starts_with(t, "END ")) return false;
    if (current_layout_ && current_layout_->bare_field(t)) return false;
    if (layout_.root_bare(t)) return false;
    return true;
  }

  // ----------------------------- sections ------------------------------------
  std::size_t open_record(std::string section, int n, bool opaque) {
    RawRecord rec;
    rec.section = std::move(section);
    rec.ordinal = static_cast<int>(out_.records.size());
    rec.line = n;
    rec.opaque = opaque;
    out_.records.push_back(std::move(rec));
    current_ = out_.records.size() - 1;
    opaque_ = opaque;
    last_unknown_ = false;
    return *current_;
  }

  bool current_needs_terminator() const noexcept {
    return current_ && (opaque_ || (current_layout_ && current_layout_->begin_end));
  }

  // Implicit close (next opener, EOF).
  void close_current(int n) {
    if (!current_) return;
    if (current_needs_terminator()) {
      truncation(n, "section '" + out_.records[*current_].section + "' not terminated");
    }
    end_current();
  }

  // Explicit close (matching END) or after an implicit close was reported.
  void end_current() {
    current_.reset();
    current_layout_ = nullptr;
    opaque_ = false;
    last_unknown_ = false;
  }

  void open_keyword_section(const SectionLayout& s, std::string_view value, int n) {
    close_current(n);
    const std::size_t rec = open_record(s.name, n, false);
    current_layout_ = &s;

    std::vector<std::string> parts;
    for (const auto& p : split(value, ',')) parts.push_back(trim(p));
    push_field(rec, Field{s.opener, FieldValue::strings(std::move(parts)), {}, false, n});

    if (!s.trailing_field.empty()) {
      push_field(rec, Field{s.trailing_field, FieldValue::numbers({}), {}, false, n});
      PendingTable pt;
      pt.record = rec;
      pt.field = out_.records[rec].fields.size() - 1;
      const Field* cnt = out_.records[0].find(s.trailing_count_field);
      const double c = cnt ? cnt->value.as_number() : std::nan("");
      if (std::isfinite(c) && c >= 0.0 && c == std::floor(c)) {
        pt.want = static_cast<std::size_t>(c);
      } else {
        pt.unbounded = true;
      }
      if (pt.unbounded || pt.want > 0) table_ = std::move(pt);
    }
  }

  void on_begin(const std::string& t, int n) {
    const std::string name = block_name(t, "BEGIN ");

    const FieldLayout* f = current_layout_ ? current_layout_->field(name) : nullptr;
    std::size_t rec = target();
    if (!(f && f->type == FieldType::kTextBlock)) {
      const FieldLayout* rf = layout_.root_field(name);
      if (rf && rf->type == FieldType::kTextBlock) {
        f = rf;
        rec = 0;
      } else {
        f = nullptr;
      }
    }
    if (f) {
      push_field(rec, Field{name, FieldValue::string(""), {}, false, n});
      PendingBlock pb;
      pb.record = rec;
      pb.field = out_.records[rec].fields.size() - 1;
      pb.name = name;
      block_ = std::move(pb);
      return;
    }

    const SectionLayout* s = layout_.section_by_name(name);
    if (s && s->begin_end) {
      close_current(n);
      open_record(name, n, false);
      current_layout_ = s;
      return;
    }

    close_current(n);
    const std::size_t opaque = open_record(name, n, true);
    warn(opaque, n, "unknown section 'BEGIN " + name + "' kept as opaque record");
  }

  void on_end(const std::string& t, const std::string& raw, int n) {
    const std::string name = block_name(t, "END ");
    if (current_ && current_layout_ && current_layout_->begin_end &&
        out_.records[*current_].section == name) {
      end_current();
      return;
    }
    if (opt_.strict) fail(n, "unmatched 'END " + name + "'");
    warn(target(), n, "unmatched 'END " + name + "' kept verbatim");
    add_raw(target(), raw, n);
  }

  // ----------------------------- fields --------------------------------------
  void push_field(std::size_t rec, Field f) {
    out_.records[rec].fields.push_back(std::move(f));
    last_unknown_ = false;
  }

  void add_raw(std::size_t rec, const std::string& raw, int n) {
    out_.records[rec].fields.push_back(Field{"", FieldValue::string(rstrip(raw)), {}, true, n});
  }

  void on_unknown_key(const std::string& key, std::string_view value, int n) {
    if (opt_.strict) fail(n, "unknown keyword '" + key + "'");
    const std::size_t rec = target();
    push_field(rec, Field{key, FieldValue::string(trim(value)), {}, false, n});
    warn(rec, n, "unknown keyword '" + key + "' kept as text");
    last_unknown_ = true;
  }

  void on_unrecognized(const std::string& raw, int n) {
    const std::size_t rec = target();
    if (!last_unknown_) {
      if (opt_.strict) fail(n, "unrecognized line '" + trim(raw) + "'");
      warn(rec, n, "unrecognized line kept verbatim");
    }
    add_raw(rec, raw, n);
    last_unknown_ = true;
  }

  // Non-empty token that is not a finite number: NaN + warning (or ParseError).
  double parse_element(const std::string& tok, const std::string& key, std::size_t rec, int n) {
    if (auto v = try_parse_double(tok)) return *v;
    if (opt_.strict) fail(n, "malformed numeric value '" + tok + "' in '" + key + "'");
    warn(rec, n, "malformed numeric value '" + tok + "' in '" + key + "' recorded as NaN");
    return std::nan("");
  }

  void add_typed(std::size_t rec, const FieldLayout& f, const std::string& key,
                 std::string_view value, int n) {
    const std::string v = trim(value);
    switch (f.type) {
      case FieldType::kNumber: {
        FieldValue fv;
        if (!v.empty()) {
          if (auto d = try_parse_double(v)) {
            fv = FieldValue::number(*d);
          } else {
            if (opt_.strict) fail(n, "malformed numeric field '" + key + "=" + v + "'");
            warn(rec, n, "malformed numeric field '" + key + "=" + v + "' recorded as missing");
          }
        }
        push_field(rec, Field{key, std::move(fv), {}, false, n});
        return;
      }
      case FieldType::kFlag: {
        FieldValue fv;
        const std::string lv = to_lower(v);
        if (lv == "true" || lv == "yes") {
          fv = FieldValue::number(1.0);
        } else if (lv == "false" || lv == "no") {
          fv = FieldValue::number(0.0);
        } else if (!v.empty()) {
          if (auto d = try_parse_double(v)) {
            fv = FieldValue::number(*d);
          } else {
            if (opt_.strict) fail(n, "malformed flag '" + key + "=" + v + "'");
            warn(rec, n, "malformed flag '" + key + "=" + v + "' recorded as missing");
          }
        }
        push_field(rec, Field{key, std::move(fv), {}, false, n});
        return;
      }
      case FieldType::kString:
      case FieldType::kTextBlock:
      case FieldType::kBare:
        push_field(rec, Field{key, FieldValue::string(v), {}, false, n});
        return;
      case FieldType::kNumberList: {
        std::vector<double> out;
        if (!v.empty()) {
          for (const auto& part : split(v, ',')) {
            const std::string p = trim(part);
            out.push_back(p.empty() ? std::nan("") : parse_element(p, key, rec, n));
          }
        }
        push_field(rec, Field{key, FieldValue::numbers(std::move(out)), {}, false, n});
        return;
      }
      case FieldType::kStringList: {
        std::vector<std::string> out;
        for (const auto& part : split(v, ',')) {
          std::string p = trim(part);
          if (!p.empty()) out.push_back(std::move(p));
        }
        push_field(rec, Field{key, FieldValue::strings(std::move(out)), {}, false, n});
        return;
      }
      case FieldType::kTable: {
        push_field(rec, Field{key, FieldValue::numbers({}), v, false, n});
        const std::string count_tok = trim(split(v, ',').front());
        const auto c = try_parse_double(count_tok);
        if (!c || *c < 0.0 || *c != std::floor(*c)) {
          if (opt_.strict) fail(n, "bad table header '" + key + "=" + v + "'");
          warn(rec, n, "bad table header '" + key + "=" + v + "'; table left empty");
          return;
        }
        const std::size_t want = static_cast<std::size_t>(*c) *
                                 static_cast<std::size_t>(std::max(1, f.values_per_entry));
        if (want == 0) return;
        PendingTable pt;
        pt.record = rec;
        pt.field = out_.records[rec].fields.size() - 1;
        pt.want = want;
        table_ = std::move(pt);
        return;
      }
    }
  }

  // ----------------------------- tables --------------------------------------
  std::vector<std::string> row_tokens(const std::string& raw) const {
    std::vector<std::string> ws = split_whitespace(raw);
    if (layout_.table_delimiter != Delimiter::kFixedWidth) return ws;

    const std::size_t w = static_cast<std::size_t>(std::max(1, layout_.column_width));
    bool touching = false;
    for (const auto& tok : ws) touching = touching || tok.size() > w;
    if (!touching) return ws;

    std::vector<std::string> cols;
    for (std::size_t i = 0; i < raw.size(); i += w) {
      std::string piece = trim(std::string_view(raw).substr(i, w));
      if (!piece.empty()) cols.push_back(std::move(piece));
    }
    return cols;
  }

  void consume_row(const std::string& raw, int n) {
    PendingTable& pt = *table_;
    const std::string& key = out_.records[pt.record].fields[pt.field].name;
    std::size_t extra = 0;
    for (const auto& tok : row_tokens(raw)) {
      if (!pt.unbounded && pt.values.size() >= pt.want) {
        ++extra;
        continue;
      }
      pt.values.push_back(parse_element(tok, key, pt.record, n));
    }
    if (extra > 0) {
      warn(pt.record, n, std::to_string(extra) + " extra value(s) after table '" + key + "' ignored");
    }
    if (!pt.unbounded && pt.values.size() >= pt.want) finish_table(n);
  }

  void finish_table(int n) {
    PendingTable pt = std::move(*table_);
    table_.reset();
    Field& f = out_.records[pt.record].fields[pt.field];
    if (!pt.unbounded && pt.values.size() < pt.want) {
      const std::string msg = "table '" + f.name + "' expected " + std::to_string(pt.want) +
                              " values, found " + std::to_string(pt.values.size());
      if (opt_.strict) fail(n, msg);
      warn(pt.record, n, msg);
    }
    f.value = FieldValue::numbers(std::move(pt.values));
  }

  void finish_block() {
    PendingBlock pb = std::move(*block_);
    block_.reset();
    out_.records[pb.record].fields[pb.field].value = FieldValue::string(join(pb.lines, "\n"));
  }

  const FileLayout& layout_;
  const ParseSettings& opt_;
  ParsedTextFile out_;

  std::optional<std::size_t> current_;
  const SectionLayout* current_layout_ = nullptr;
  bool opaque_ = false;
  bool last_unknown_ = false;
  std::optional<PendingTable> table_;
  std::optional<PendingBlock> block_;
};

} // namespace

std::string find_version_marker(std::string_view content) {
  for (const auto& line : split_lines(content)) {
    const std::string t = trim(line);
    if (starts_with(t, "Program Version=")) return trim(std::string_view(t).substr(16));
  }
  return {};
}

ParsedTextFile parse_with_layout(std::string_view content,
                                 const SourceRef& source,
                                 const FileLayout& layout,
                                 const ParseSettings& opt) {
  SectionParser p(source, layout, opt);
  ParsedTextFile out = p.run(content);
  out.version = find_version_marker(content);
  return out;
}

ParsedTextFile parse_text(std::string_view content,
                          const SourceRef& source,
                          const ParseSettings& opt,
                          const LayoutRegistry& registry) {
  if (content.find('\0') != std::string_view::npos) {
    throw ParseError(source.path, 0, "file contains NUL bytes; not a text model file");
  }

  const std::string marker = find_version_marker(content);
  const std::optional<Version> version = marker.empty() ? std::nullopt : Version::parse(marker);

  const FileLayout* layout = registry.select(source.kind, version);
  if (!layout) {
    throw ParseError(source.path, 0,
                     std::string("no text layout registered for file kind '") +
                         file_kind_name(source.kind) + "'");
  }

  ParsedTextFile out = parse_with_layout(content, source, *layout, opt);
  if (registry.count(source.kind) > 1) {
    if (!version) {
      out.warnings.push_back(Diagnostic{0, marker.empty()
          ? "no 'Program Version=' marker; using layout '" + layout->name + "'"
          : "unreadable version marker '" + marker + "'; using layout '" + layout->name + "'"});
    } else {
      log_debug(source.path + ": version " + marker + " -> layout " + layout->name);
    }
  }
  return out;
}

ParsedTextFile parse_text_file(const std::string& path, const Settings& settings) {
  SourceRef src = make_source(path);
  const std::string content = read_file_bounded(path, settings.io);
  src.kind = refine_flow_kind(src.kind, content);
  if (!is_text_kind(src.kind)) {
    throw ParseError(path, 0, "not a recognized text model file (expected .prj/.gNN/.pNN/.fNN/.uNN/.qNN)");
  }
  return parse_text(content, src, settings.parse);
}

} // namespace rascheck::text
