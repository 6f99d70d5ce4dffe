#pragma once
#include "SensorReading.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

enum class SyncState { Seeking, Collecting };

// Recovers frames from a raw UART byte stream.
// A frame is a run of at least kPreambleLen 0xFF bytes followed by a
// kPayloadLen byte payload. There is no checksum.
class FrameSynchronizer {
public:
  static constexpr std::uint8_t kPreambleByte = 0xFF;
  static constexpr int kPreambleLen = 10;
  static constexpr std::size_t kPayloadLen = 6;

  struct Seeking {
    int count = 0;   // 0xFF bytes seen so far, saturates at kPreambleLen
  };
  struct Collecting {
    FramePayload buffer{};
    std::size_t filled = 0;
  };

  // Feed one byte. Returns the payload once the 6th payload byte arrives.
  std::optional<FramePayload> push(std::uint8_t byte);

  void reset() { state_ = Seeking{}; }

  SyncState state() const;
  // Preamble bytes counted so far (0 while collecting)
  int preamble_count() const;

private:
  std::variant<Seeking, Collecting> state_{Seeking{}};
};
