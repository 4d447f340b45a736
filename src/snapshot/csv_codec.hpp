#pragma once

#include <string>
#include <vector>

namespace sysdelta {

using CsvRow = std::vector<std::string>;

/**
 * Parse RFC 4180 style CSV text.
 *
 * - Fields may be quoted; a doubled quote inside a quoted field is a literal quote.
 * - Quoted fields may contain commas and line breaks.
 * - LF and CRLF line endings are both accepted; a leading UTF-8 BOM is skipped.
 * - Blank lines are dropped.
 *
 * Throws MalformedInputError when a quoted field is never closed.
 */
std::vector<CsvRow> parseCsv(const std::string &content);

// One CSV line including the trailing newline. Cells with a comma, quote or
// line break are quoted.
std::string formatCsvRow(const CsvRow &cells);

} // namespace sysdelta
