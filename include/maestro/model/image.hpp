#pragma once

#include "maestro/core/error.hpp"
#include "maestro/model/container.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace maestro {

class Connection;

// Read-only copy of an Image taken under its shared lock.
struct ImageView {
  std::string name;
  std::optional<std::string> build_id;
  std::optional<std::string> server_name;
  std::optional<Container> container;
  bool run_pending{false};

  // Status reported to callers: `waiting` while a run is accepted but has no
  // container yet, otherwise the container's own status.
  [[nodiscard]] auto status() const -> std::optional<ContainerStatus>;
};

// A named source directory and the state of its builds and runs. Everything
// below the identity fields is guarded by mu().
class Image {
public:
  Image(std::string name, std::filesystem::path files_dir);

  Image(const Image&) = delete;
  auto operator=(const Image&) -> Image& = delete;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto files_dir() const noexcept
      -> const std::filesystem::path& {
    return files_dir_;
  }
  [[nodiscard]] auto log_dir() const -> std::filesystem::path;
  // Creates log_dir() below an existing files_dir(); never recreates the
  // source directory itself.
  [[nodiscard]] auto prepare_log_dir() const -> Result<void>;

  [[nodiscard]] auto mu() const noexcept -> std::shared_mutex& { return mu_; }

  // Build id and owning connection always change together.
  auto set_build(std::string build_id, std::shared_ptr<Connection> connection)
      -> void;
  auto clear_build() -> void;
  [[nodiscard]] auto build_id() const noexcept
      -> const std::optional<std::string>& {
    return build_id_;
  }
  [[nodiscard]] auto connection() const noexcept
      -> const std::shared_ptr<Connection>& {
    return connection_;
  }

  [[nodiscard]] auto container() noexcept -> std::optional<Container>& {
    return container_;
  }
  [[nodiscard]] auto container() const noexcept
      -> const std::optional<Container>& {
    return container_;
  }
  auto clear_container() -> void;

  [[nodiscard]] auto run_pending() const noexcept -> bool {
    return run_pending_;
  }
  auto set_run_pending(bool pending) noexcept -> void {
    run_pending_ = pending;
  }

  // Set once the Image has left the registry. Queued work for a deleted
  // Image is dropped.
  [[nodiscard]] auto is_deleted() const noexcept -> bool { return deleted_; }
  auto mark_deleted() noexcept -> void { deleted_ = true; }

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return container_ && container_->status == ContainerStatus::Running;
  }

  // Takes the shared lock.
  [[nodiscard]] auto view() const -> ImageView;

private:
  std::string name_;
  std::filesystem::path files_dir_;

  mutable std::shared_mutex mu_;
  std::optional<std::string> build_id_;
  std::shared_ptr<Connection> connection_;
  std::optional<Container> container_;
  bool run_pending_{false};
  bool deleted_{false};
};

}  // namespace maestro
