#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rascheck {

std::string trim(std::string_view v);

// Split on a single delimiter; keeps empty fields ("a,,b" -> 3 fields).
std::vector<std::string> split(std::string_view s, char delim);

// Split on runs of whitespace; never yields empty fields.
std::vector<std::string> split_whitespace(std::string_view s);

std::string to_lower(std::string_view s);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

// Whole-token finite decimal (strtod in the "C" locale). Surrounding
// whitespace is ignored; anything else left over is a failure.
std::optional<double> try_parse_double(std::string_view s);

// Shortest text that parses back to exactly the same double ("0.035", "5000",
// "1e-05"). Non-finite values render as "nan" / "inf" / "-inf".
std::string format_number(double v);

// Natural ordering: digit runs compare numerically ("XS 9" < "XS 10"),
// everything else byte-wise. Ties fall back to plain byte comparison so the
// order is total.
bool natural_less(std::string_view a, std::string_view b) noexcept;

} // namespace rascheck
