#include "engine/text/records.hpp"

#include <cmath>
#include <limits>

namespace rascheck::text {
namespace {

bool same_number(double a, double b) noexcept {
  if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
  return a == b;
}

const std::string kEmptyString;
const std::vector<double> kEmptyNumbers;
const std::vector<std::string> kEmptyStrings;

} // namespace

double FieldValue::as_number() const noexcept {
  if (const auto* d = std::get_if<double>(&v_)) return *d;
  return std::numeric_limits<double>::quiet_NaN();
}

const std::string& FieldValue::as_string() const noexcept {
  if (const auto* s = std::get_if<std::string>(&v_)) return *s;
  return kEmptyString;
}

const std::vector<double>& FieldValue::as_numbers() const noexcept {
  if (const auto* v = std::get_if<std::vector<double>>(&v_)) return *v;
  return kEmptyNumbers;
}

const std::vector<std::string>& FieldValue::as_strings() const noexcept {
  if (const auto* v = std::get_if<std::vector<std::string>>(&v_)) return *v;
  return kEmptyStrings;
}

bool FieldValue::operator==(const FieldValue& o) const noexcept {
  if (v_.index() != o.v_.index()) return false;
  switch (kind()) {
    case FieldValueKind::kMissing:
      return true;
    case FieldValueKind::kNumber:
      return same_number(as_number(), o.as_number());
    case FieldValueKind::kString:
      return as_string() == o.as_string();
    case FieldValueKind::kNumberList: {
      const auto& a = as_numbers();
      const auto& b = o.as_numbers();
      if (a.size() != b.size()) return false;
      for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_number(a[i], b[i])) return false;
      }
      return true;
    }
    case FieldValueKind::kStringList:
      return as_strings() == o.as_strings();
  }
  return false;
}

const Field* RawRecord::find(std::string_view name) const noexcept {
  for (const auto& f : fields) {
    if (!f.raw && f.name == name) return &f;
  }
  return nullptr;
}

std::vector<std::string> ParsedTextFile::all_warnings() const {
  std::vector<std::string> out;
  const std::string prefix = source.path + ": ";
  for (const auto& w : warnings) out.push_back(prefix + w.to_string());
  for (const auto& r : records) {
    for (const auto& w : r.warnings) out.push_back(prefix + w.to_string());
  }
  return out;
}

} // namespace rascheck::text
