#pragma once

#include "maestro/runtime/output_sink.hpp"
#include "maestro/util/time.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace maestro {

enum class ContainerStatus : std::uint8_t {
  Waiting,
  Running,
  Error,
  Stopped,
  Finished,
};

[[nodiscard]] constexpr auto to_string_view(ContainerStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case ContainerStatus::Waiting:
      return "waiting";
    case ContainerStatus::Running:
      return "running";
    case ContainerStatus::Error:
      return "error";
    case ContainerStatus::Stopped:
      return "stopped";
    case ContainerStatus::Finished:
      return "finished";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(ContainerStatus status) noexcept
    -> bool {
  return status == ContainerStatus::Error ||
         status == ContainerStatus::Stopped ||
         status == ContainerStatus::Finished;
}

// One run of an Image on a host.
struct Container {
  std::string id;
  std::string name;
  ContainerStatus status{ContainerStatus::Running};
  TimePoint created_at{};
  std::optional<TimePoint> finished_at;

  std::shared_ptr<runtime::OutputSink> stdout_sink;
  std::shared_ptr<runtime::OutputSink> stderr_sink;

  auto close_sinks() -> void {
    if (stdout_sink) {
      stdout_sink->close();
    }
    if (stderr_sink) {
      stderr_sink->close();
    }
  }
};

}  // namespace maestro
