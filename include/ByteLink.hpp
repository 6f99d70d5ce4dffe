#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>

// Byte transport underneath the UART source.
class IByteLink {
public:
  virtual ~IByteLink() = default;

  // Blocks until at least one byte is available. Returns 0 on end-of-stream.
  virtual std::size_t read(std::uint8_t* buf, std::size_t len) = 0;
  virtual void close() = 0;
};

// Serial device opened raw: 8 data bits, no parity, one stop bit,
// no flow control.
class SerialLink : public IByteLink {
public:
  SerialLink(const std::string& device, unsigned baud);

  std::size_t read(std::uint8_t* buf, std::size_t len) override;
  void close() override;

private:
  boost::asio::io_context io_;
  boost::asio::serial_port port_;
};

// Any std::istream, e.g. a raw capture file recorded from the device.
class StreamLink : public IByteLink {
public:
  explicit StreamLink(std::unique_ptr<std::istream> in);

  // Opens a binary capture file; throws SourceError(NotFound) if missing.
  static std::unique_ptr<StreamLink> open_file(const std::string& path);

  std::size_t read(std::uint8_t* buf, std::size_t len) override;
  void close() override;

private:
  std::unique_ptr<std::istream> in_;
};
