#include "maestro/model/image.hpp"

#include "maestro/core/constants.hpp"
#include "maestro/orchestrator/connection.hpp"

#include <mutex>

namespace maestro {

auto ImageView::status() const -> std::optional<ContainerStatus> {
  if (run_pending) {
    return ContainerStatus::Waiting;
  }
  if (container) {
    return container->status;
  }
  return std::nullopt;
}

Image::Image(std::string name, std::filesystem::path files_dir)
    : name_(std::move(name)), files_dir_(std::move(files_dir)) {}

auto Image::log_dir() const -> std::filesystem::path {
  return files_dir_ / layout::kRunDir / layout::kLogDir;
}

auto Image::prepare_log_dir() const -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::is_directory(files_dir_, ec)) {
    return fail(Error::FileNotFound);
  }
  std::filesystem::create_directories(log_dir(), ec);
  if (ec) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto Image::set_build(std::string build_id,
                      std::shared_ptr<Connection> connection) -> void {
  build_id_ = std::move(build_id);
  connection_ = std::move(connection);
}

auto Image::clear_build() -> void {
  build_id_.reset();
  connection_.reset();
}

auto Image::clear_container() -> void {
  if (container_) {
    container_->close_sinks();
    container_.reset();
  }
}

auto Image::view() const -> ImageView {
  std::shared_lock lock(mu_);
  ImageView v{
      .name = name_,
      .build_id = build_id_,
      .server_name = std::nullopt,
      .container = container_,
      .run_pending = run_pending_,
  };
  if (connection_) {
    v.server_name = connection_->name();
  }
  return v;
}

}  // namespace maestro
