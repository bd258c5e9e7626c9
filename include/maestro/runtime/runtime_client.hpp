#pragma once

#include "maestro/runtime/output_sink.hpp"
#include "maestro/util/time.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace maestro::runtime {

enum class RuntimeError {
  ConnectionFailed,
  ApiError,
  NotFound,
  Conflict,
  ParseError,
  InvalidInput,
  BuildFailed,
  StreamClosed,
};

[[nodiscard]] constexpr auto to_string_view(RuntimeError error) noexcept
    -> std::string_view {
  switch (error) {
    case RuntimeError::ConnectionFailed:
      return "connection failed";
    case RuntimeError::ApiError:
      return "API error";
    case RuntimeError::NotFound:
      return "not found";
    case RuntimeError::Conflict:
      return "conflict";
    case RuntimeError::ParseError:
      return "parse error";
    case RuntimeError::InvalidInput:
      return "invalid input";
    case RuntimeError::BuildFailed:
      return "build failed";
    case RuntimeError::StreamClosed:
      return "stream closed";
  }
  return "unknown error";
}

template <typename T>
using RuntimeResult = std::expected<T, RuntimeError>;

enum class RemoteStatus {
  Created,
  Running,
  Paused,
  Exited,
  Other,
};

[[nodiscard]] auto parse_remote_status(std::string_view status) noexcept
    -> RemoteStatus;

struct ContainerState {
  RemoteStatus status{RemoteStatus::Other};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;
  int exit_code{0};
};

// Session with one host's container runtime. Implementations must tolerate
// concurrent calls from the run worker, the reconciler and request handlers.
class RuntimeClient {
public:
  virtual ~RuntimeClient() = default;

  // Builds an image from the contents of `context_dir` and returns its id.
  [[nodiscard]] virtual auto build_image(const std::filesystem::path& context_dir)
      -> RuntimeResult<std::string> = 0;
  [[nodiscard]] virtual auto remove_image(std::string_view image_id)
      -> RuntimeResult<void> = 0;

  [[nodiscard]] virtual auto create_container(std::string_view image_id,
                                              std::string_view name)
      -> RuntimeResult<std::string> = 0;
  [[nodiscard]] virtual auto start_container(std::string_view container_id)
      -> RuntimeResult<void> = 0;
  // Stops with no grace period.
  [[nodiscard]] virtual auto stop_container(std::string_view container_id)
      -> RuntimeResult<void> = 0;
  [[nodiscard]] virtual auto remove_container(std::string_view container_id,
                                              bool remove_volumes)
      -> RuntimeResult<void> = 0;
  [[nodiscard]] virtual auto inspect_container(std::string_view container_id)
      -> RuntimeResult<ContainerState> = 0;

  // Blocks until the container's output stream ends, copying stdout frames
  // to `out` and stderr frames to `err`. `on_attached` runs once the stream
  // is established, before any output is copied. A stop request detaches
  // early with StreamClosed; the container keeps running.
  [[nodiscard]] virtual auto attach_container(
      std::string_view container_id, OutputSink& out, OutputSink& err,
      const std::function<void()>& on_attached, std::stop_token stop)
      -> RuntimeResult<void> = 0;

  [[nodiscard]] virtual auto ping() -> RuntimeResult<void> = 0;
};

}  // namespace maestro::runtime
