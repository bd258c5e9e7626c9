#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace maestro {

namespace io {
inline constexpr std::size_t kReadBufferSize = 8192;
inline constexpr std::size_t kMaxResponseSize = 100 * 1024 * 1024;
}

namespace timing {
inline constexpr auto kReconcileInterval = std::chrono::milliseconds(2000);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kTunnelReadyTimeout = std::chrono::seconds(15);
inline constexpr auto kTunnelPollInterval = std::chrono::milliseconds(100);
}

namespace layout {
// Per-image scratch directory; excluded from build contexts and file listings.
inline constexpr std::string_view kRunDir = ".maestro";
inline constexpr std::string_view kLogDir = "logs";
}

}  // namespace maestro
