#pragma once
#include "ByteLink.hpp"
#include "FrameSynchronizer.hpp"
#include "IDataSource.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Decoded accelerometer samples from the framed UART protocol.
//
// A default-constructed source is in testing mode: it has no port, open()
// and next() throw SourceError(NotConfigured) and close() does nothing.
class UartSource : public IDataSource<Sample> {
public:
  using LinkFactory = std::function<std::unique_ptr<IByteLink>()>;

  static constexpr unsigned kDefaultBaud = 115200;

  UartSource();
  explicit UartSource(const std::string& port, unsigned baud = kDefaultBaud);
  explicit UartSource(LinkFactory factory);
  ~UartSource() override;

  UartSource(const UartSource&) = delete;
  UartSource& operator=(const UartSource&) = delete;

  void open();

  // false once the link reports end-of-stream; the source is closed then
  // and does not reopen by itself.
  bool next(Sample& out) override;

  // Like next(), but throws SourceError(StreamExhausted) at end-of-stream.
  Sample read_next();

  void close();

  bool configured() const { return static_cast<bool>(factory_); }
  bool is_open() const { return static_cast<bool>(link_); }

  std::size_t frames_decoded() const { return frames_; }
  std::size_t bytes_consumed() const { return bytes_; }

private:
  bool fill_buffer();

  LinkFactory factory_;
  std::unique_ptr<IByteLink> link_;
  FrameSynchronizer sync_;

  std::array<std::uint8_t, 64> rx_{};
  std::size_t rx_len_ = 0;
  std::size_t rx_pos_ = 0;

  std::size_t frames_ = 0;
  std::size_t bytes_ = 0;
};
