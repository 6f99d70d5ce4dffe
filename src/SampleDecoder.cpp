#include "SampleDecoder.hpp"

int to_int16(std::uint16_t raw) {
  return raw >= 0x8000 ? static_cast<int>(raw) - 0x10000 : static_cast<int>(raw);
}

namespace {

int axis(const FramePayload& p, int i) {
  std::uint16_t lo = p[2 * i];
  std::uint16_t hi = p[2 * i + 1];
  return to_int16(static_cast<std::uint16_t>(lo | (hi << 8)));
}

}  // namespace

Sample decode_sample(const FramePayload& payload) {
  Sample s;
  s.x = axis(payload, 0);
  s.y = axis(payload, 1);
  s.z = axis(payload, 2);
  return s;
}
