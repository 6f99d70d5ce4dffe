#pragma once
#include <string>
#include <vector>

// One CSV record, cells already trimmed of surrounding whitespace.
using CsvRow = std::vector<std::string>;

// Split one line on commas. Double-quoted cells may contain commas.
// A trailing '\r' is dropped. Throws SourceError(MalformedRow) on an
// unterminated quote.
CsvRow parse_csv_line(const std::string& line);

// True for a row with no cells or only empty cells.
bool is_blank_row(const CsvRow& row);

// Trimmed and lowercased copy of a cell.
std::string normalize_cell(const std::string& cell);

// True if the whole cell parses as a floating point number.
bool is_number(const std::string& cell);
