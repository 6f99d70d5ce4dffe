#pragma once
#include "CsvRow.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

// Endless row reader over one CSV file.
//
// On open (and on every rewind) the first non-blank row is classified:
//  - contains all header tokens          -> header, dropped
//  - >= columns cells, first N numeric   -> data, buffered for next_row()
//  - anything else                       -> header-like, dropped
// Blank rows are never returned. At end of file the cursor rewinds to the
// start of the same file and keeps going.
class CsvCursor {
public:
  CsvCursor(std::string path, std::vector<std::string> header_tokens,
            std::size_t columns);

  // Throws SourceError(NotFound) if the file does not exist.
  void open();
  void close();
  bool is_open() const { return in_.is_open(); }

  // Throws SourceError(NotStarted) when closed and SourceError(EmptySource)
  // when the file holds no data row at all.
  CsvRow next_row();

  const std::string& path() const { return path_; }
  std::size_t columns() const { return columns_; }
  bool header_detected() const { return has_header_; }
  bool has_pending_row() const { return pending_.has_value(); }
  std::size_t rewinds() const { return rewinds_; }

private:
  bool read_line(std::string& line);
  bool read_record(CsvRow& row);
  void detect_header();
  void rewind();

  std::string path_;
  std::vector<std::string> tokens_;
  std::size_t columns_;

  std::ifstream in_;
  std::optional<CsvRow> pending_;
  bool has_header_ = false;
  std::size_t rewinds_ = 0;
};
