#pragma once

#include "maestro/runtime/output_sink.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace maestro::runtime {

inline constexpr std::size_t kFrameHeaderSize = 8;

enum class StreamType : std::uint8_t {
  Stdin = 0,
  Stdout = 1,
  Stderr = 2,
};

// Splits a multiplexed attach stream (8-byte header: stream type, three
// padding bytes, big-endian payload length) into its stdout and stderr
// payloads. Frames may arrive split across any number of feed() calls.
class StreamDemuxer {
public:
  StreamDemuxer(OutputSink& out, OutputSink& err);

  auto feed(std::span<const std::uint8_t> data) -> void;

  // Bytes of an incomplete frame still held back.
  [[nodiscard]] auto pending() const noexcept -> std::size_t {
    return buffer_.size();
  }
  [[nodiscard]] auto frames() const noexcept -> std::size_t { return frames_; }

private:
  auto dispatch(std::uint8_t type, std::span<const std::uint8_t> payload)
      -> void;

  OutputSink& out_;
  OutputSink& err_;
  std::vector<std::uint8_t> buffer_;
  std::size_t frames_{0};
};

}  // namespace maestro::runtime
