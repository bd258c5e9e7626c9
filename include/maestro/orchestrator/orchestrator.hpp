#pragma once

#include "maestro/config/config.hpp"
#include "maestro/core/concurrent_map.hpp"
#include "maestro/core/error.hpp"
#include "maestro/model/image.hpp"
#include "maestro/orchestrator/connection.hpp"
#include "maestro/orchestrator/file_store.hpp"
#include "maestro/orchestrator/reconciler.hpp"
#include "maestro/runtime/runtime_client.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace maestro {

// Opens the runtime session for one configured host.
using RuntimeFactory =
    std::function<Result<std::shared_ptr<runtime::RuntimeClient>>(
        const ServerInfo&)>;

// Owns the image and connection registries, the per-host run workers and the
// reconciler, and exposes the operations callers drive them with.
class Orchestrator {
public:
  Orchestrator(SystemConfig config, RuntimeFactory factory);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  auto operator=(const Orchestrator&) -> Orchestrator& = delete;

  // Registers every directory under images_dir, opens one session per
  // configured server and starts the workers and the reconciler. Any session
  // failure aborts startup.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Images
  [[nodiscard]] auto list_images() const -> std::vector<ImageView>;
  [[nodiscard]] auto get_image(std::string_view name) const
      -> Result<ImageView>;
  [[nodiscard]] auto create_image(std::string_view name) -> Result<void>;
  [[nodiscard]] auto delete_image(std::string_view name) -> Result<void>;

  [[nodiscard]] auto run_image(std::string_view name,
                               std::string_view server_name) -> Result<void>;
  [[nodiscard]] auto build_image(std::string_view name,
                                 std::string_view server_name) -> Result<void>;
  // Idempotent: an Image with nothing to stop succeeds untouched.
  [[nodiscard]] auto stop_image(std::string_view name) -> Result<void>;

  [[nodiscard]] auto list_servers() const -> std::vector<ServerInfo>;

  // Files
  [[nodiscard]] auto upload_files(std::string_view name,
                                  const std::vector<UploadedFile>& files)
      -> Result<void>;
  [[nodiscard]] auto list_files(std::string_view name) const
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto read_file(std::string_view name,
                               std::string_view file_name) const
      -> Result<std::string>;
  [[nodiscard]] auto delete_file(std::string_view name,
                                 std::string_view file_name) -> Result<void>;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto images() noexcept -> StringMap<std::shared_ptr<Image>>& {
    return images_;
  }
  [[nodiscard]] auto connections() noexcept
      -> StringMap<std::shared_ptr<Connection>>& {
    return connections_;
  }
  [[nodiscard]] auto reconciler() noexcept -> Reconciler& {
    return reconciler_;
  }

private:
  [[nodiscard]] auto scan_images() -> Result<std::size_t>;
  [[nodiscard]] auto open_connections() -> Result<void>;
  [[nodiscard]] auto find_image(std::string_view name) const
      -> Result<std::shared_ptr<Image>>;
  [[nodiscard]] auto find_connection(std::string_view name) const
      -> Result<std::shared_ptr<Connection>>;

  SystemConfig config_;
  RuntimeFactory factory_;
  std::atomic<bool> running_{false};

  StringMap<std::shared_ptr<Image>> images_;
  StringMap<std::shared_ptr<Connection>> connections_;
  Reconciler reconciler_;
};

}  // namespace maestro
