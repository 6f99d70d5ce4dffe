#pragma once
#include "SensorReading.hpp"

#include <cstdint>

// Two's-complement reinterpretation of a 16-bit unsigned value.
int to_int16(std::uint16_t raw);

// Decode [x_lo, x_hi, y_lo, y_hi, z_lo, z_hi] into a Sample.
Sample decode_sample(const FramePayload& payload);
