#include "maestro/orchestrator/orchestrator.hpp"

#include "maestro/orchestrator/build_coordinator.hpp"
#include "maestro/orchestrator/run_dispatcher.hpp"
#include "maestro/util/log.hpp"
#include "maestro/util/names.hpp"

#include <algorithm>
#include <mutex>

namespace maestro {

Orchestrator::Orchestrator(SystemConfig config, RuntimeFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      reconciler_(images_, config_.reconcile_interval) {}

Orchestrator::~Orchestrator() {
  stop();
}

auto Orchestrator::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  auto scanned = scan_images();
  if (!scanned) {
    running_.store(false);
    return fail(scanned.error());
  }
  log::info("Registered {} images from {}", *scanned, config_.images_dir);

  if (auto opened = open_connections(); !opened) {
    for (const auto& connection : connections_.values()) {
      connection->stop();
    }
    connections_.clear();
    running_.store(false);
    return opened;
  }

  reconciler_.start();
  log::info("Orchestrator started with {} servers", connections_.size());
  return ok();
}

auto Orchestrator::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping orchestrator...");
  reconciler_.stop();
  for (const auto& connection : connections_.values()) {
    connection->stop();
  }
  log::info("Orchestrator stopped");
}

auto Orchestrator::is_running() const noexcept -> bool {
  return running_.load();
}

auto Orchestrator::scan_images() -> Result<std::size_t> {
  std::error_code ec;
  std::filesystem::directory_iterator it(config_.images_dir, ec);
  if (ec) {
    log::error("Failed to read images directory {}: {}", config_.images_dir,
               ec.message());
    return fail(Error::FileNotFound);
  }

  std::size_t count = 0;
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) {
      continue;
    }
    auto name = it->path().filename().string();
    if (!is_valid_image_name(name)) {
      log::debug("Skipping directory {} in images directory", name);
      continue;
    }
    if (images_.try_store(name, std::make_shared<Image>(name, it->path()))) {
      ++count;
    }
  }
  if (ec) {
    log::error("Failed to scan images directory {}: {}", config_.images_dir,
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  return ok(count);
}

auto Orchestrator::open_connections() -> Result<void> {
  for (const auto& [name, server] : config_.servers) {
    auto client = factory_(server);
    if (!client) {
      log::error("Failed to open session to server {}: {}", name,
                 client.error().message());
      return fail(client.error());
    }

    auto connection = std::make_shared<Connection>(server, std::move(*client));
    connection->start(&RunDispatcher::execute);
    connections_.store(name, std::move(connection));
  }
  return ok();
}

auto Orchestrator::find_image(std::string_view name) const
    -> Result<std::shared_ptr<Image>> {
  auto image = images_.load(name);
  if (!image) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*image));
}

auto Orchestrator::find_connection(std::string_view name) const
    -> Result<std::shared_ptr<Connection>> {
  auto connection = connections_.load(name);
  if (!connection) {
    return fail(Error::NotFound);
  }
  return ok(std::move(*connection));
}

auto Orchestrator::list_images() const -> std::vector<ImageView> {
  std::vector<ImageView> views;
  images_.range([&](const std::string&, const std::shared_ptr<Image>& image) {
    views.push_back(image->view());
    return true;
  });
  std::ranges::sort(views, {}, &ImageView::name);
  return views;
}

auto Orchestrator::get_image(std::string_view name) const -> Result<ImageView> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  return ok((*image)->view());
}

auto Orchestrator::create_image(std::string_view name) -> Result<void> {
  if (!is_valid_image_name(name)) {
    log::warn("Rejected image name {}", name);
    return fail(Error::InvalidArgument);
  }

  auto dir = std::filesystem::path(config_.images_dir) / name;
  std::error_code ec;
  if (!std::filesystem::create_directory(dir, ec)) {
    if (ec) {
      log::error("Failed to create {}: {}", dir.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }
    return fail(Error::AlreadyExists);
  }

  if (!images_.try_store(std::string(name),
                         std::make_shared<Image>(std::string(name), dir))) {
    return fail(Error::AlreadyExists);
  }
  log::info("Created image {}", name);
  return ok();
}

auto Orchestrator::delete_image(std::string_view name) -> Result<void> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  if (!images_.erase(name)) {
    return fail(Error::NotFound);
  }

  std::unique_lock lock((*image)->mu());
  (*image)->mark_deleted();
  (*image)->set_run_pending(false);
  if (auto& container = (*image)->container()) {
    container->close_sinks();
  }

  std::error_code ec;
  std::filesystem::remove_all((*image)->files_dir(), ec);
  if (ec) {
    log::error("Failed to delete {}: {}", (*image)->files_dir().string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  log::info("Deleted image {}", name);
  return ok();
}

auto Orchestrator::run_image(std::string_view name,
                             std::string_view server_name) -> Result<void> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  auto connection = find_connection(server_name);
  if (!connection) {
    return fail(connection.error());
  }
  return RunDispatcher::run(*image, *connection);
}

auto Orchestrator::build_image(std::string_view name,
                               std::string_view server_name) -> Result<void> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  auto connection = find_connection(server_name);
  if (!connection) {
    return fail(connection.error());
  }
  return BuildCoordinator::build(**image, *connection);
}

auto Orchestrator::stop_image(std::string_view name) -> Result<void> {
  auto found = find_image(name);
  if (!found) {
    return fail(found.error());
  }
  auto& image = **found;

  std::unique_lock lock(image.mu());
  if (!image.connection() || !image.container()) {
    return ok();
  }

  auto container_id = image.container()->id;
  auto connection = image.connection();
  image.clear_container();
  if (container_id.empty()) {
    return ok();
  }

  auto stopped = connection->client().stop_container(container_id);
  if (!stopped) {
    if (stopped.error() == runtime::RuntimeError::NotFound) {
      log::warn("Container {} of image {} was already gone", container_id,
                image.name());
      return ok();
    }
    log::error("Failed to stop container {} of image {}: {}", container_id,
               image.name(), runtime::to_string_view(stopped.error()));
    return fail(Error::RuntimeFailure);
  }
  log::info("Stopped container {} of image {}", container_id, image.name());
  return ok();
}

auto Orchestrator::list_servers() const -> std::vector<ServerInfo> {
  std::vector<ServerInfo> servers;
  for (const auto& connection : connections_.values()) {
    servers.push_back(connection->server());
  }
  std::ranges::sort(servers, {}, &ServerInfo::name);
  return servers;
}

auto Orchestrator::upload_files(std::string_view name,
                                const std::vector<UploadedFile>& files)
    -> Result<void> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  return FileStore::save(**image, files);
}

auto Orchestrator::list_files(std::string_view name) const
    -> Result<std::vector<std::string>> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  return FileStore::list(**image);
}

auto Orchestrator::read_file(std::string_view name,
                             std::string_view file_name) const
    -> Result<std::string> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  return FileStore::read(**image, file_name);
}

auto Orchestrator::delete_file(std::string_view name,
                               std::string_view file_name) -> Result<void> {
  auto image = find_image(name);
  if (!image) {
    return fail(image.error());
  }
  return FileStore::remove(**image, file_name);
}

}  // namespace maestro
