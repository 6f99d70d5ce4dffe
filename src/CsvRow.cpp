#include "CsvRow.hpp"
#include "SourceError.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <algorithm>

CsvRow parse_csv_line(const std::string& line) {
  std::string text = line;
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }

  CsvRow row;
  if (text.empty()) return row;

  // the tokenizer accepts a dangling quote, so check the pairing here
  if (std::count(text.begin(), text.end(), '"') % 2 != 0) {
    throw SourceError(SourceErrc::MalformedRow,
                      "Bad CSV line '" + text + "': unterminated quote");
  }

  // no escape character, comma separator, double quote
  boost::escaped_list_separator<char> sep("", ",", "\"");
  try {
    boost::tokenizer<boost::escaped_list_separator<char>> tok(text, sep);
    for (const auto& cell : tok) {
      row.push_back(boost::algorithm::trim_copy(cell));
    }
  } catch (const boost::escaped_list_error& e) {
    throw SourceError(SourceErrc::MalformedRow,
                      "Bad CSV line '" + text + "': " + e.what());
  }
  return row;
}

bool is_blank_row(const CsvRow& row) {
  return std::all_of(row.begin(), row.end(),
                     [](const std::string& c) { return c.empty(); });
}

std::string normalize_cell(const std::string& cell) {
  return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(cell));
}

bool is_number(const std::string& cell) {
  double v = 0.0;
  return !cell.empty() && boost::conversion::try_lexical_convert(cell, v);
}
