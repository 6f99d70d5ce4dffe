#pragma once
#include "SensorReading.hpp"

#include <nlohmann/json.hpp>

#include <string>

// JSON mapping used for the one-object-per-line output stream.
void to_json(nlohmann::json& j, const Sample& s);
void to_json(nlohmann::json& j, const GeoPoint& g);
void to_json(nlohmann::json& j, const AggregatedReading& r);

// UTC, millisecond precision: 2024-01-31T12:34:56.789Z
std::string format_timestamp(Timestamp t);
