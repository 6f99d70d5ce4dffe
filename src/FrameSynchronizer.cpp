#include "FrameSynchronizer.hpp"

std::optional<FramePayload> FrameSynchronizer::push(std::uint8_t byte) {
  if (auto* seek = std::get_if<Seeking>(&state_)) {
    if (byte == kPreambleByte) {
      // any run of kPreambleLen or more is the same preamble
      if (seek->count < kPreambleLen) seek->count++;
      return std::nullopt;
    }

    // Stray bytes before the preamble is complete are ignored and do not
    // reset the count.
    if (seek->count < kPreambleLen) {
      return std::nullopt;
    }

    // First non-0xFF byte after the preamble is payload byte 0
    Collecting col;
    col.buffer[0] = byte;
    col.filled = 1;
    state_ = col;
    return std::nullopt;
  }

  auto& col = std::get<Collecting>(state_);
  col.buffer[col.filled++] = byte;
  if (col.filled < kPayloadLen) {
    return std::nullopt;
  }

  FramePayload payload = col.buffer;
  state_ = Seeking{};
  return payload;
}

SyncState FrameSynchronizer::state() const {
  return std::holds_alternative<Seeking>(state_) ? SyncState::Seeking
                                                 : SyncState::Collecting;
}

int FrameSynchronizer::preamble_count() const {
  if (const auto* seek = std::get_if<Seeking>(&state_)) {
    return seek->count;
  }
  return 0;
}
