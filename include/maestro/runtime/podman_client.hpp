#pragma once

#include "maestro/config/config.hpp"
#include "maestro/http/http_client.hpp"
#include "maestro/runtime/runtime_client.hpp"
#include "maestro/runtime/ssh_tunnel.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace maestro::runtime {

struct PodmanClientConfig {
  std::string api_version{"v1.41"};
  std::chrono::milliseconds read_timeout{0};
};

// Build responses are a stream of JSON objects, one per line. Returns the
// built image id, or BuildFailed if the stream reports an error or never
// names an image.
[[nodiscard]] auto parse_build_output(std::string_view body)
    -> RuntimeResult<std::string>;

// Parses the body of GET /containers/{id}/json.
[[nodiscard]] auto parse_inspect_response(std::string_view body)
    -> RuntimeResult<ContainerState>;

// RuntimeClient for the Docker-compatible REST API served by Podman (and
// Docker). Remote hosts are reached through an owned SSH tunnel.
class PodmanClient final : public RuntimeClient {
public:
  PodmanClient(std::string socket_path, PodmanClientConfig config,
               std::unique_ptr<SshTunnel> tunnel = nullptr);
  ~PodmanClient() override;

  PodmanClient(const PodmanClient&) = delete;
  auto operator=(const PodmanClient&) -> PodmanClient& = delete;

  // Opens a session to `server`: dials its socket directly when it is local,
  // otherwise through a fresh SSH tunnel, and pings it.
  [[nodiscard]] static auto connect(const ServerInfo& server,
                                    const RuntimeConfig& config)
      -> Result<std::unique_ptr<PodmanClient>>;

  [[nodiscard]] auto build_image(const std::filesystem::path& context_dir)
      -> RuntimeResult<std::string> override;
  [[nodiscard]] auto remove_image(std::string_view image_id)
      -> RuntimeResult<void> override;

  [[nodiscard]] auto create_container(std::string_view image_id,
                                      std::string_view name)
      -> RuntimeResult<std::string> override;
  [[nodiscard]] auto start_container(std::string_view container_id)
      -> RuntimeResult<void> override;
  [[nodiscard]] auto stop_container(std::string_view container_id)
      -> RuntimeResult<void> override;
  [[nodiscard]] auto remove_container(std::string_view container_id,
                                      bool remove_volumes)
      -> RuntimeResult<void> override;
  [[nodiscard]] auto inspect_container(std::string_view container_id)
      -> RuntimeResult<ContainerState> override;
  [[nodiscard]] auto attach_container(std::string_view container_id,
                                      OutputSink& out, OutputSink& err,
                                      const std::function<void()>& on_attached,
                                      std::stop_token stop)
      -> RuntimeResult<void> override;

  [[nodiscard]] auto ping() -> RuntimeResult<void> override;

private:
  [[nodiscard]] auto endpoint(std::string_view path) const -> std::string;

  http::HttpClient http_;
  PodmanClientConfig config_;
  std::unique_ptr<SshTunnel> tunnel_;
};

}  // namespace maestro::runtime
