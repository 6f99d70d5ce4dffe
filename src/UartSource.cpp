#include "UartSource.hpp"
#include "SampleDecoder.hpp"
#include "SourceError.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

UartSource::UartSource() = default;

UartSource::UartSource(const std::string& port, unsigned baud)
  : factory_([port, baud]() -> std::unique_ptr<IByteLink> {
      if (!std::filesystem::exists(port)) {
        throw SourceError(SourceErrc::NotFound, "Serial port not found: " + port);
      }
      return std::make_unique<SerialLink>(port, baud);
    }) {}

UartSource::UartSource(LinkFactory factory) : factory_(std::move(factory)) {}

UartSource::~UartSource() {
  close();
}

void UartSource::open() {
  if (!configured()) {
    throw SourceError(SourceErrc::NotConfigured, "UART source has no port configured");
  }
  if (link_) return;

  link_ = factory_();
  sync_.reset();
  rx_len_ = rx_pos_ = 0;
}

bool UartSource::fill_buffer() {
  rx_len_ = link_->read(rx_.data(), rx_.size());
  rx_pos_ = 0;
  return rx_len_ > 0;
}

bool UartSource::next(Sample& out) {
  if (!configured()) {
    throw SourceError(SourceErrc::NotConfigured, "UART source has no port configured");
  }
  if (!link_) {
    throw SourceError(SourceErrc::NotStarted, "UART source is not open. Call open() before next().");
  }

  for (;;) {
    if (rx_pos_ >= rx_len_ && !fill_buffer()) {
      // end-of-stream is terminal
      close();
      return false;
    }

    std::uint8_t b = rx_[rx_pos_++];
    bytes_++;

    if (auto payload = sync_.push(b)) {
      frames_++;
      out = decode_sample(*payload);
      return true;
    }
  }
}

Sample UartSource::read_next() {
  Sample s;
  if (!next(s)) {
    throw SourceError(SourceErrc::StreamExhausted, "UART stream exhausted");
  }
  return s;
}

void UartSource::close() {
  if (!link_) return;

  try {
    link_->close();
  } catch (const std::exception& e) {
    std::cerr << "UART close failed: " << e.what() << "\n";
  }
  link_.reset();
  rx_len_ = rx_pos_ = 0;
}
