#include "CsvReplaySource.hpp"
#include "SourceError.hpp"

#include <boost/lexical_cast.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

std::string join(const CsvRow& row) {
  std::string out;
  for (size_t i = 0; i < row.size(); ++i) {
    if (i) out += ',';
    out += row[i];
  }
  return out;
}

double to_double(const CsvRow& row, size_t i, const char* what) {
  double v = 0.0;
  if (!boost::conversion::try_lexical_convert(row[i], v)) {
    throw SourceError(SourceErrc::MalformedRow,
                      std::string(what) + " value is not a number: '" + row[i] +
                      "' in row [" + join(row) + "]");
  }
  return v;
}

// Truncates toward zero like a float -> int cast. Only NaN, inf and values
// beyond int64 are rejected, since those have no integer value to store.
std::int64_t to_int(const CsvRow& row, size_t i) {
  double v = std::trunc(to_double(row, i, "Accelerometer"));
  // 2^63 is exact as a double; anything >= it does not fit
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(v) || v < -kLimit || v >= kLimit) {
    throw SourceError(SourceErrc::MalformedRow,
                      "Accelerometer value out of range: '" + row[i] + "'");
  }
  return static_cast<std::int64_t>(v);
}

}  // namespace

CsvReplaySource::CsvReplaySource(ReplayConfig cfg)
  : cfg_(std::move(cfg)),
    acc_(cfg_.accelerometer_file, {"x", "y", "z"}, 3),
    gps_(cfg_.gps_file, {"longitude", "latitude"}, 2) {
  if (cfg_.delay.count() < 0) {
    throw std::invalid_argument("Replay delay must not be negative");
  }
}

CsvReplaySource::~CsvReplaySource() {
  stop();
}

void CsvReplaySource::start() {
  if (started_) return;

  if (!std::filesystem::exists(cfg_.accelerometer_file)) {
    throw SourceError(SourceErrc::NotFound,
                      "Accelerometer file not found: " + cfg_.accelerometer_file);
  }
  if (!std::filesystem::exists(cfg_.gps_file)) {
    throw SourceError(SourceErrc::NotFound, "GPS file not found: " + cfg_.gps_file);
  }

  try {
    acc_.open();
    gps_.open();
  } catch (...) {
    acc_.close();
    gps_.close();
    throw;
  }
  started_ = true;
}

void CsvReplaySource::stop() {
  acc_.close();
  gps_.close();
  started_ = false;
}

AggregatedReading CsvReplaySource::read() {
  if (!started_) {
    throw SourceError(SourceErrc::NotStarted,
                      "Datasource is not started. Call start() before read().");
  }

  // advance both cursors before parsing so a bad row is never re-read
  CsvRow acc_row = acc_.next_row();
  CsvRow gps_row = gps_.next_row();

  AggregatedReading r;
  r.accelerometer = parse_accelerometer(acc_row);
  r.gps = parse_gps(gps_row);
  r.timestamp = std::chrono::system_clock::now();
  r.user_id = cfg_.user_id;

  if (cfg_.delay.count() > 0) {
    std::this_thread::sleep_for(cfg_.delay);
  }
  return r;
}

bool CsvReplaySource::next(AggregatedReading& out) {
  out = read();
  return true;
}

Sample CsvReplaySource::parse_accelerometer(const CsvRow& row) {
  if (row.size() < 3) {
    throw SourceError(SourceErrc::MalformedRow,
                      "Accelerometer row must have 3 values (x,y,z). Got: [" + join(row) + "]");
  }
  Sample s;
  s.x = to_int(row, 0);
  s.y = to_int(row, 1);
  s.z = to_int(row, 2);
  return s;
}

GeoPoint CsvReplaySource::parse_gps(const CsvRow& row) {
  if (row.size() < 2) {
    throw SourceError(SourceErrc::MalformedRow,
                      "GPS row must have 2 values (longitude,latitude). Got: [" + join(row) + "]");
  }
  GeoPoint g;
  g.longitude = to_double(row, 0, "GPS");
  g.latitude = to_double(row, 1, "GPS");
  return g;
}
