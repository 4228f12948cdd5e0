#pragma once
#include <string>
#include "common/types.hpp"

namespace transit::io {

// RFC 4180-style CSV: first record is the header, quoted fields may hold
// commas, quotes ("") and line breaks. CRLF and a leading UTF-8 BOM are
// tolerated; blank lines are skipped.
RawTable ParseCsv(const std::string& text, const std::string& name);

// Throws SourceReadError when the file cannot be opened.
RawTable ReadCsvTable(const std::string& path);

} // namespace transit::io
