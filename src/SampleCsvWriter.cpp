#include "SampleCsvWriter.hpp"

#include <stdexcept>

SampleCsvWriter::SampleCsvWriter(const std::string& path) : path_(path), out_(path) {
  if (!out_.is_open()) throw std::runtime_error("Could not open output file: " + path);
  out_ << "x,y,z\n";
}

void SampleCsvWriter::write(const Sample& s) {
  out_ << s.x << ',' << s.y << ',' << s.z << '\n';
  if (!out_) throw std::runtime_error("Write failed: " + path_);
  rows_++;
}

void SampleCsvWriter::close() {
  if (!out_.is_open()) return;
  out_.close();
  if (out_.fail()) throw std::runtime_error("Could not close output file: " + path_);
}
