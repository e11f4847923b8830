#pragma once

#include <string>
#include <vector>

#include "engine/text/layout.hpp"
#include "engine/text/records.hpp"

namespace rascheck::text {

// Canonical text for a record sequence: the root record's fields first, then
// every section in order. Re-parsing the output with the same layout yields
// records equal to the input.
//
// Numbers use the shortest exact representation; counted-table values are
// right-aligned in layout.column_width columns, values_per_line per row
// (rounded down to whole entries).
std::string write_records(const std::vector<RawRecord>& records, const FileLayout& layout);

// Same, using the layout that parsed the file. Throws InvalidArgument when
// that layout is not registered.
std::string write_text(const ParsedTextFile& file,
                       const LayoutRegistry& registry = LayoutRegistry::builtin());

} // namespace rascheck::text
