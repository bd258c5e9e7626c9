#include "maestro/runtime/output_sink.hpp"
#include "maestro/runtime/stream_demux.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace maestro::runtime::test {

namespace {

auto frame(StreamType type, std::string_view payload)
    -> std::vector<std::uint8_t> {
  auto len = static_cast<std::uint32_t>(payload.size());
  std::vector<std::uint8_t> out{static_cast<std::uint8_t>(type),
                                0,
                                0,
                                0,
                                static_cast<std::uint8_t>(len >> 24),
                                static_cast<std::uint8_t>(len >> 16),
                                static_cast<std::uint8_t>(len >> 8),
                                static_cast<std::uint8_t>(len)};
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

}  // namespace

class StreamDemuxTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto out = OutputSink::open(dir_.path() / "out.log");
    auto err = OutputSink::open(dir_.path() / "err.log");
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(err.has_value());
    out_ = *out;
    err_ = *err;
  }

  auto stdout_text() -> std::string {
    out_->close();
    return maestro::test::read_file(dir_.path() / "out.log");
  }

  auto stderr_text() -> std::string {
    err_->close();
    return maestro::test::read_file(dir_.path() / "err.log");
  }

  maestro::test::TempDir dir_;
  std::shared_ptr<OutputSink> out_;
  std::shared_ptr<OutputSink> err_;
};

TEST_F(StreamDemuxTest, RoutesFramesByStreamType) {
  StreamDemuxer demux(*out_, *err_);

  auto data = frame(StreamType::Stdout, "hello\n");
  auto more = frame(StreamType::Stderr, "oops\n");
  data.insert(data.end(), more.begin(), more.end());
  demux.feed(data);

  EXPECT_EQ(demux.frames(), 2u);
  EXPECT_EQ(demux.pending(), 0u);
  EXPECT_EQ(stdout_text(), "hello\n");
  EXPECT_EQ(stderr_text(), "oops\n");
}

TEST_F(StreamDemuxTest, ReassemblesFramesSplitAcrossChunks) {
  StreamDemuxer demux(*out_, *err_);
  auto data = frame(StreamType::Stdout, "split payload");

  for (auto b : data) {
    demux.feed(std::span<const std::uint8_t>(&b, 1));
  }

  EXPECT_EQ(demux.frames(), 1u);
  EXPECT_EQ(demux.pending(), 0u);
  EXPECT_EQ(stdout_text(), "split payload");
}

TEST_F(StreamDemuxTest, HoldsBackIncompleteFrame) {
  StreamDemuxer demux(*out_, *err_);
  auto data = frame(StreamType::Stdout, "abcdef");
  data.resize(data.size() - 2);

  demux.feed(data);

  EXPECT_EQ(demux.frames(), 0u);
  EXPECT_EQ(demux.pending(), kFrameHeaderSize + 4);
  EXPECT_EQ(out_->bytes_written(), 0u);
}

TEST_F(StreamDemuxTest, DropsStdinAndUnknownStreams) {
  StreamDemuxer demux(*out_, *err_);

  auto data = frame(StreamType::Stdin, "in");
  auto unknown = frame(static_cast<StreamType>(7), "??");
  auto out = frame(StreamType::Stdout, "ok");
  data.insert(data.end(), unknown.begin(), unknown.end());
  data.insert(data.end(), out.begin(), out.end());
  demux.feed(data);

  EXPECT_EQ(demux.frames(), 3u);
  EXPECT_EQ(stdout_text(), "ok");
  EXPECT_EQ(stderr_text(), "");
}

TEST_F(StreamDemuxTest, EmptyFrameIsConsumed) {
  StreamDemuxer demux(*out_, *err_);
  demux.feed(frame(StreamType::Stdout, ""));

  EXPECT_EQ(demux.frames(), 1u);
  EXPECT_EQ(demux.pending(), 0u);
}

TEST_F(StreamDemuxTest, SinkDropsWritesAfterClose) {
  out_->write(std::string_view("before"));
  out_->close();
  out_->write(std::string_view("after"));

  EXPECT_FALSE(out_->is_open());
  EXPECT_EQ(out_->bytes_written(), 6u);
  EXPECT_EQ(maestro::test::read_file(dir_.path() / "out.log"), "before");
}

TEST_F(StreamDemuxTest, SinkDoesNotCreateDirectories) {
  auto sink = OutputSink::open(dir_.path() / "a" / "b" / "run.log");
  ASSERT_FALSE(sink.has_value());
  EXPECT_EQ(sink.error(), Error::FileOpenFailed);
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "a"));
}

}  // namespace maestro::runtime::test
