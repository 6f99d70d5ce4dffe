#pragma once
#include <array>
#include <chrono>
#include <cstdint>

// 6 raw payload bytes of one UART frame
using FramePayload = std::array<std::uint8_t, 6>;

// One 3-axis accelerometer reading.
// UART samples always fit int16; replay samples are not range-checked
// against it and may use the full 64-bit range.
struct Sample {
  std::int64_t x = 0, y = 0, z = 0;
};

struct GeoPoint {
  double longitude = 0.0;
  double latitude = 0.0;
};

using Timestamp = std::chrono::system_clock::time_point;

struct AggregatedReading {
  Sample accelerometer;
  GeoPoint gps;
  Timestamp timestamp{};
  int user_id = 0;
};

inline bool operator==(const Sample& a, const Sample& b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Sample& a, const Sample& b) { return !(a == b); }

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
  return a.longitude == b.longitude && a.latitude == b.latitude;
}
inline bool operator!=(const GeoPoint& a, const GeoPoint& b) { return !(a == b); }
