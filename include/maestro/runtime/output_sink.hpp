#pragma once

#include "maestro/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>

namespace maestro::runtime {

// Append-only file that captures one output stream of one container run.
// Written by the attaching worker, closed by whoever observes the run end;
// writes after close() are dropped.
class OutputSink {
public:
  // The parent directory must already exist.
  [[nodiscard]] static auto open(const std::filesystem::path& path)
      -> Result<std::shared_ptr<OutputSink>>;

  explicit OutputSink(std::filesystem::path path, std::ofstream out);
  ~OutputSink();

  OutputSink(const OutputSink&) = delete;
  auto operator=(const OutputSink&) -> OutputSink& = delete;

  auto write(std::span<const std::uint8_t> data) -> void;
  auto write(std::string_view text) -> void;
  auto close() -> void;

  [[nodiscard]] auto is_open() const -> bool;
  [[nodiscard]] auto bytes_written() const -> std::uint64_t;
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  std::filesystem::path path_;
  mutable std::mutex mu_;
  std::ofstream out_;
  std::uint64_t written_{0};
};

}  // namespace maestro::runtime
