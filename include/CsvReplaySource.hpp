#pragma once
#include "CsvCursor.hpp"
#include "IDataSource.hpp"

#include <chrono>
#include <string>

struct ReplayConfig {
  std::string accelerometer_file;
  std::string gps_file;
  std::chrono::milliseconds delay{0};   // pause after each read(), 0 disables
  int user_id = 0;                      // copied into every reading
};

// Replays an accelerometer CSV (x,y,z) and a GPS CSV (longitude,latitude)
// as an endless stream of readings. Each file rewinds on its own, so the
// combined stream repeats after lcm(accel rows, gps rows) reads.
class CsvReplaySource : public IDataSource<AggregatedReading> {
public:
  explicit CsvReplaySource(ReplayConfig cfg);
  ~CsvReplaySource() override;

  // Must be called before read(). Throws SourceError(NotFound) if either
  // file is missing; nothing stays open in that case.
  void start();
  void stop();
  bool started() const { return started_; }

  // One accelerometer row + one GPS row, timestamped now.
  // Throws SourceError(MalformedRow) for a bad row; the bad row is consumed.
  AggregatedReading read();

  // Never returns false.
  bool next(AggregatedReading& out) override;

  const ReplayConfig& config() const { return cfg_; }
  const CsvCursor& accelerometer_cursor() const { return acc_; }
  const CsvCursor& gps_cursor() const { return gps_; }

  static Sample parse_accelerometer(const CsvRow& row);
  static GeoPoint parse_gps(const CsvRow& row);

private:
  ReplayConfig cfg_;
  CsvCursor acc_;
  CsvCursor gps_;
  bool started_ = false;
};
