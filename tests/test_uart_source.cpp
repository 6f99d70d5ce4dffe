#include <gtest/gtest.h>
#include "SourceError.hpp"
#include "UartSource.hpp"
#include "test_util.hpp"

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string frame(std::vector<std::uint8_t> payload, int preamble = 10) {
  std::string s(preamble, '\xFF');
  for (auto b : payload) s.push_back(static_cast<char>(b));
  return s;
}

UartSource::LinkFactory memory_link(const std::string& bytes) {
  return [bytes]() -> std::unique_ptr<IByteLink> {
    return std::make_unique<StreamLink>(std::make_unique<std::istringstream>(bytes));
  };
}

// Counts close() calls and fails on demand.
class RecordingLink : public IByteLink {
public:
  RecordingLink(std::string data, int* closes, bool fail_close)
    : data_(std::move(data)), closes_(closes), fail_close_(fail_close) {}

  std::size_t read(std::uint8_t* buf, std::size_t len) override {
    // one byte at a time, like a slow serial line
    if (pos_ >= data_.size() || len == 0) return 0;
    buf[0] = static_cast<std::uint8_t>(data_[pos_++]);
    return 1;
  }
  void close() override {
    (*closes_)++;
    if (fail_close_) throw std::runtime_error("close failed");
  }

private:
  std::string data_;
  std::size_t pos_ = 0;
  int* closes_;
  bool fail_close_;
};

}  // namespace

TEST(UartSource, DecodesFramesThenExhausts) {
  std::string bytes = "\x01\x02" + frame({0x01, 0x00, 0xFF, 0x7F, 0x00, 0x80}) +
                      frame({0x02, 0x00, 0xFF, 0xFF, 0x03, 0x00}, 15);
  UartSource src(memory_link(bytes));
  src.open();

  Sample s;
  ASSERT_TRUE(src.next(s));
  EXPECT_EQ(s, (Sample{1, 32767, -32768}));

  ASSERT_TRUE(src.next(s));
  EXPECT_EQ(s, (Sample{2, -1, 3}));

  EXPECT_FALSE(src.next(s));
  EXPECT_FALSE(src.is_open());
  EXPECT_EQ(src.frames_decoded(), 2u);
  EXPECT_EQ(src.bytes_consumed(), bytes.size());
}

TEST(UartSource, NextAfterExhaustionIsNotStarted) {
  UartSource src(memory_link(frame({1, 0, 2, 0, 3, 0})));
  src.open();

  Sample s;
  ASSERT_TRUE(src.next(s));
  ASSERT_FALSE(src.next(s));

  try {
    src.next(s);
    FAIL() << "expected NotStarted";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotStarted);
  }
}

TEST(UartSource, ReadNextThrowsStreamExhausted) {
  UartSource src(memory_link(frame({5, 0, 6, 0, 7, 0})));
  src.open();

  EXPECT_EQ(src.read_next(), (Sample{5, 6, 7}));
  try {
    src.read_next();
    FAIL() << "expected StreamExhausted";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::StreamExhausted);
  }
  EXPECT_FALSE(src.is_open());
}

TEST(UartSource, PartialFrameAtEndIsDropped) {
  std::string bytes = frame({1, 0, 1, 0, 1, 0}) + std::string(10, '\xFF') + "\x01\x02";
  UartSource src(memory_link(bytes));
  src.open();

  Sample s;
  EXPECT_TRUE(src.next(s));
  EXPECT_FALSE(src.next(s));
}

TEST(UartSource, NextBeforeOpenIsNotStarted) {
  UartSource src(memory_link(frame({1, 0, 1, 0, 1, 0})));
  Sample s;
  try {
    src.next(s);
    FAIL() << "expected NotStarted";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotStarted);
  }
}

TEST(UartSource, TestingModeIsNotConfigured) {
  UartSource src;
  EXPECT_FALSE(src.configured());
  EXPECT_NO_THROW(src.close());

  try {
    src.open();
    FAIL() << "expected NotConfigured";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotConfigured);
  }

  Sample s;
  try {
    src.next(s);
    FAIL() << "expected NotConfigured";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotConfigured);
  }
}

TEST(UartSource, MissingPortIsNotFound) {
  UartSource src("/dev/definitely-not-a-serial-port-xyz");
  EXPECT_TRUE(src.configured());
  try {
    src.open();
    FAIL() << "expected NotFound";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotFound);
  }
  EXPECT_FALSE(src.is_open());
}

TEST(UartSource, CloseIsIdempotentAndLogsFailures) {
  int closes = 0;
  UartSource src([&closes]() -> std::unique_ptr<IByteLink> {
    return std::make_unique<RecordingLink>(frame({1, 0, 2, 0, 3, 0}), &closes, true);
  });
  src.open();
  EXPECT_NO_THROW(src.close());
  EXPECT_NO_THROW(src.close());
  EXPECT_EQ(closes, 1);
  EXPECT_FALSE(src.is_open());
}

TEST(UartSource, ByteAtATimeLink) {
  int closes = 0;
  UartSource src([&closes]() -> std::unique_ptr<IByteLink> {
    return std::make_unique<RecordingLink>(frame({9, 0, 8, 0, 7, 0}), &closes, false);
  });
  src.open();

  Sample s;
  ASSERT_TRUE(src.next(s));
  EXPECT_EQ(s, (Sample{9, 8, 7}));
  EXPECT_FALSE(src.next(s));
  EXPECT_EQ(closes, 1);
}

TEST(UartSource, ReopenStartsFreshSync) {
  UartSource src(memory_link(frame({1, 0, 2, 0, 3, 0})));
  src.open();
  Sample s;
  ASSERT_TRUE(src.next(s));
  ASSERT_FALSE(src.next(s));

  src.open();
  ASSERT_TRUE(src.next(s));
  EXPECT_EQ(s, (Sample{1, 2, 3}));
}

TEST(UartSource, ReadsCaptureFile) {
  TempDir dir;
  std::string path = dir.file("capture.bin", frame({0x10, 0x00, 0x20, 0x00, 0x30, 0x00}));

  UartSource src([path]() -> std::unique_ptr<IByteLink> { return StreamLink::open_file(path); });
  src.open();
  EXPECT_EQ(src.read_next(), (Sample{16, 32, 48}));
}

TEST(UartSource, MissingCaptureFileIsNotFound) {
  UartSource src([]() -> std::unique_ptr<IByteLink> {
    return StreamLink::open_file("/nonexistent/capture.bin");
  });
  try {
    src.open();
    FAIL() << "expected NotFound";
  } catch (const SourceError& e) {
    EXPECT_EQ(e.code(), SourceErrc::NotFound);
  }
}
