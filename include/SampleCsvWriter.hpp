#pragma once
#include "SensorReading.hpp"

#include <cstddef>
#include <fstream>
#include <string>

// Writes samples as "x,y,z" CSV, readable back by CsvReplaySource.
class SampleCsvWriter {
public:
  explicit SampleCsvWriter(const std::string& path);

  void write(const Sample& s);
  void close();

  std::size_t rows_written() const { return rows_; }

private:
  std::string path_;
  std::ofstream out_;
  std::size_t rows_ = 0;
};
