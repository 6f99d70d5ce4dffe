#include "ReadingJson.hpp"

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <chrono>
#include <cstdio>

using nlohmann::json;

void to_json(json& j, const Sample& s) {
  j = json{{"x", s.x}, {"y", s.y}, {"z", s.z}};
}

void to_json(json& j, const GeoPoint& g) {
  j = json{{"longitude", g.longitude}, {"latitude", g.latitude}};
}

void to_json(json& j, const AggregatedReading& r) {
  j = json{
    {"accelerometer", r.accelerometer},
    {"gps", r.gps},
    {"timestamp", format_timestamp(r.timestamp)},
    {"user_id", r.user_id},
  };
}

std::string format_timestamp(Timestamp t) {
  namespace pt = boost::posix_time;

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  const pt::ptime epoch(boost::gregorian::date(1970, 1, 1));
  pt::ptime utc = epoch + pt::milliseconds(ms);

  boost::gregorian::date d = utc.date();
  pt::time_duration tod = utc.time_of_day();

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                static_cast<int>(d.year()), static_cast<int>(d.month().as_number()),
                static_cast<int>(d.day()), static_cast<int>(tod.hours()),
                static_cast<int>(tod.minutes()), static_cast<int>(tod.seconds()),
                static_cast<int>(tod.total_milliseconds() % 1000));
  return buf;
}
