#pragma once

#include "maestro/config/config.hpp"
#include "maestro/core/error.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace maestro::runtime {

// Forwards a remote runtime socket to a local Unix socket with
// `ssh -nNT -L local:remote`. The ssh child lives as long as the tunnel.
class SshTunnel {
public:
  [[nodiscard]] static auto open(
      const ServerInfo& server,
      std::chrono::milliseconds ready_timeout = timing::kTunnelReadyTimeout)
      -> Result<std::unique_ptr<SshTunnel>>;

  // Argument vector passed to ssh; exposed for diagnostics and tests.
  [[nodiscard]] static auto command_line(const ServerInfo& server,
                                         const std::filesystem::path& local)
      -> std::vector<std::string>;

  [[nodiscard]] static auto local_socket_for(const ServerInfo& server)
      -> std::filesystem::path;

  SshTunnel(pid_t pid, std::filesystem::path local_socket);
  ~SshTunnel();

  SshTunnel(const SshTunnel&) = delete;
  auto operator=(const SshTunnel&) -> SshTunnel& = delete;

  auto close() -> void;

  // Reaps the child if it has exited.
  [[nodiscard]] auto is_alive() -> bool;
  [[nodiscard]] auto local_socket() const noexcept
      -> const std::filesystem::path& {
    return local_socket_;
  }

private:
  pid_t pid_{-1};
  std::filesystem::path local_socket_;
};

}  // namespace maestro::runtime
