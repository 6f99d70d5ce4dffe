#include "ByteLink.hpp"
#include "SourceError.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <filesystem>
#include <fstream>

namespace asio = boost::asio;

SerialLink::SerialLink(const std::string& device, unsigned baud)
  : port_(io_, device) {
  port_.set_option(asio::serial_port_base::baud_rate(baud));
  port_.set_option(asio::serial_port_base::character_size(8));
  port_.set_option(
    asio::serial_port_base::flow_control(
      asio::serial_port_base::flow_control::none
    )
  );
  port_.set_option(
    asio::serial_port_base::parity(
      asio::serial_port_base::parity::none
    )
  );
  port_.set_option(
    asio::serial_port_base::stop_bits(
      asio::serial_port_base::stop_bits::one
    )
  );
}

std::size_t SerialLink::read(std::uint8_t* buf, std::size_t len) {
  boost::system::error_code ec;
  std::size_t n = port_.read_some(asio::buffer(buf, len), ec);
  if (ec == asio::error::eof) {
    return 0;
  }
  if (ec) {
    throw boost::system::system_error(ec, "serial read");
  }
  return n;
}

void SerialLink::close() {
  if (!port_.is_open()) return;
  boost::system::error_code ec;
  port_.close(ec);
  if (ec) {
    throw boost::system::system_error(ec, "serial close");
  }
}

StreamLink::StreamLink(std::unique_ptr<std::istream> in) : in_(std::move(in)) {}

std::unique_ptr<StreamLink> StreamLink::open_file(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw SourceError(SourceErrc::NotFound, "Capture file not found: " + path);
  }
  auto f = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!f->is_open()) {
    throw std::runtime_error("Could not open capture file: " + path);
  }
  return std::make_unique<StreamLink>(std::move(f));
}

std::size_t StreamLink::read(std::uint8_t* buf, std::size_t len) {
  if (!in_ || !*in_) return 0;
  in_->read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
  return static_cast<std::size_t>(in_->gcount());
}

void StreamLink::close() {
  in_.reset();
}
