#include "maestro/runtime/stream_demux.hpp"

#include "maestro/util/log.hpp"

namespace maestro::runtime {

namespace {

auto frame_length(std::span<const std::uint8_t> header) -> std::size_t {
  return (static_cast<std::size_t>(header[4]) << 24) |
         (static_cast<std::size_t>(header[5]) << 16) |
         (static_cast<std::size_t>(header[6]) << 8) |
         static_cast<std::size_t>(header[7]);
}

}  // namespace

StreamDemuxer::StreamDemuxer(OutputSink& out, OutputSink& err)
    : out_(out), err_(err) {}

auto StreamDemuxer::feed(std::span<const std::uint8_t> data) -> void {
  buffer_.insert(buffer_.end(), data.begin(), data.end());

  std::size_t pos = 0;
  while (buffer_.size() - pos >= kFrameHeaderSize) {
    std::span<const std::uint8_t> view{buffer_.data() + pos,
                                       buffer_.size() - pos};
    auto length = frame_length(view);
    if (view.size() < kFrameHeaderSize + length) {
      break;
    }
    dispatch(view[0], view.subspan(kFrameHeaderSize, length));
    pos += kFrameHeaderSize + length;
    ++frames_;
  }

  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
}

auto StreamDemuxer::dispatch(std::uint8_t type,
                             std::span<const std::uint8_t> payload) -> void {
  switch (static_cast<StreamType>(type)) {
    case StreamType::Stdout:
      out_.write(payload);
      break;
    case StreamType::Stderr:
      err_.write(payload);
      break;
    case StreamType::Stdin:
      break;
    default:
      log::debug("Dropping {} bytes from unknown stream type {}",
                 payload.size(), type);
      break;
  }
}

}  // namespace maestro::runtime
