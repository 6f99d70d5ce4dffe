#include "CsvCursor.hpp"
#include "SourceError.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <utility>

CsvCursor::CsvCursor(std::string path, std::vector<std::string> header_tokens,
                     std::size_t columns)
  : path_(std::move(path)), tokens_(std::move(header_tokens)), columns_(columns) {}

void CsvCursor::open() {
  close();

  if (!std::filesystem::exists(path_)) {
    throw SourceError(SourceErrc::NotFound, "CSV file not found: " + path_);
  }
  in_.open(path_, std::ios::in | std::ios::binary);
  if (!in_.is_open()) {
    throw std::runtime_error("Could not open CSV file: " + path_);
  }
  detect_header();
}

void CsvCursor::close() {
  if (in_.is_open()) {
    in_.clear();
    in_.close();
    if (in_.fail()) {
      std::cerr << "Closing " << path_ << " failed\n";
    }
  }
  in_.clear();
  pending_.reset();
  has_header_ = false;
  rewinds_ = 0;
}

// A record ends at "\n", "\r\n" or a lone "\r".
bool CsvCursor::read_line(std::string& line) {
  using traits = std::ifstream::traits_type;

  line.clear();
  traits::int_type c = in_.get();
  if (traits::eq_int_type(c, traits::eof())) return false;

  while (!traits::eq_int_type(c, traits::eof()) && c != '\n' && c != '\r') {
    line.push_back(traits::to_char_type(c));
    c = in_.get();
  }
  if (c == '\r' && in_.peek() == '\n') {
    in_.get();
  }
  return true;
}

bool CsvCursor::read_record(CsvRow& row) {
  std::string line;
  if (!read_line(line)) return false;
  row = parse_csv_line(line);
  return true;
}

void CsvCursor::detect_header() {
  pending_.reset();
  has_header_ = false;

  CsvRow first;
  do {
    if (!read_record(first)) return;   // nothing but blank rows
  } while (is_blank_row(first));

  std::vector<std::string> norm;
  norm.reserve(first.size());
  for (const auto& c : first) norm.push_back(normalize_cell(c));

  bool all_tokens = std::all_of(tokens_.begin(), tokens_.end(),
    [&](const std::string& t) {
      return std::find(norm.begin(), norm.end(), t) != norm.end();
    });
  if (all_tokens) {
    has_header_ = true;
    return;
  }

  if (norm.size() >= columns_ &&
      std::all_of(norm.begin(),
                  norm.begin() + static_cast<std::ptrdiff_t>(columns_), is_number)) {
    pending_ = std::move(first);
    return;
  }

  // neither header nor data, skip it like a header
  has_header_ = true;
}

void CsvCursor::rewind() {
  in_.clear();
  in_.seekg(0);
  rewinds_++;
  detect_header();
}

CsvRow CsvCursor::next_row() {
  if (!in_.is_open()) {
    throw SourceError(SourceErrc::NotStarted, "CSV cursor is not open: " + path_);
  }

  bool rewound = false;
  for (;;) {
    CsvRow row;
    if (pending_) {
      row = std::move(*pending_);
      pending_.reset();
    } else if (!read_record(row)) {
      if (rewound) {
        throw SourceError(SourceErrc::EmptySource, "CSV file has no data rows: " + path_);
      }
      rewind();
      rewound = true;
      continue;
    }

    if (is_blank_row(row)) continue;
    return row;
  }
}
