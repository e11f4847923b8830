#pragma once
/*
================================================================================
Fragment 2.3 — Text: Section Parser
FILE: cpp/engine/text/section_parser.hpp

Purpose:
  - Turn one keyword-sectioned text file (geometry / plan / flow / project)
    into an ordered sequence of RawRecords, driven by a FileLayout.

State machine:
  OUTSIDE_SECTION --(opener | BEGIN <name>)--> INSIDE_SECTION
  INSIDE_SECTION  --(END <name> | next opener | EOF)--> OUTSIDE_SECTION

  - Lines outside any section land in the root record (ordinal 0).
  - BEGIN <name> for an unregistered name opens an opaque record that keeps
    its lines verbatim until END <name>.
  - Unparsable numbers become missing (scalars) or NaN (list / table
    elements) with a warning naming the line.
  - Unknown "key=value" lines are kept as string fields with a warning.
  - EOF inside a section that needs an explicit terminator is a warning
    (truncated); the partial record is still emitted.

Strict mode (ParseSettings::strict):
  - unknown keywords, malformed numeric tokens and unterminated sections
    raise ParseError(line, reason) instead.
================================================================================
*/

#include <string>
#include <string_view>

#include "engine/core/settings.hpp"
#include "engine/core/source.hpp"
#include "engine/text/layout.hpp"
#include "engine/text/records.hpp"

namespace rascheck::text {

// Parse with an explicit layout (version marker is still recorded).
ParsedTextFile parse_with_layout(std::string_view content,
                                 const SourceRef& source,
                                 const FileLayout& layout,
                                 const ParseSettings& opt = {});

// Select the layout from source.kind and the "Program Version=" marker.
// Throws ParseError when no layout exists for the kind or the content is
// not text.
ParsedTextFile parse_text(std::string_view content,
                          const SourceRef& source,
                          const ParseSettings& opt = {},
                          const LayoutRegistry& registry = LayoutRegistry::builtin());

// Bounded read + kind detection (suffix, then content for flow files) + parse.
// Throws IoError (unreadable / timeout) or ParseError.
ParsedTextFile parse_text_file(const std::string& path, const Settings& settings);

// Value of the first "Program Version=" line, if any.
std::string find_version_marker(std::string_view content);

} // namespace rascheck::text
