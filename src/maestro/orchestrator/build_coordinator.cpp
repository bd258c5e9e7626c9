#include "maestro/orchestrator/build_coordinator.hpp"

#include "maestro/util/log.hpp"

#include <mutex>

namespace maestro {

namespace {

auto remove_stale_container(Image& image) -> void {
  auto& container = image.container();
  const auto& owner = image.connection();
  if (owner && !container->id.empty()) {
    auto removed = owner->client().remove_container(container->id, true);
    if (!removed && removed.error() != runtime::RuntimeError::NotFound) {
      log::warn("Failed to remove container {} of image {} on {}: {}",
                container->id, image.name(), owner->name(),
                runtime::to_string_view(removed.error()));
    }
  }
  image.clear_container();
}

auto remove_stale_build(Image& image) -> void {
  const auto& owner = image.connection();
  if (!owner) {
    return;
  }
  auto removed = owner->client().remove_image(*image.build_id());
  if (!removed && removed.error() != runtime::RuntimeError::NotFound) {
    log::warn("Failed to remove build {} of image {} on {}: {}",
              *image.build_id(), image.name(), owner->name(),
              runtime::to_string_view(removed.error()));
  }
}

}  // namespace

auto BuildCoordinator::build(Image& image,
                             const std::shared_ptr<Connection>& connection)
    -> Result<void> {
  std::unique_lock lock(image.mu());
  if (image.is_deleted()) {
    return fail(Error::NotFound);
  }
  return build_locked(image, connection);
}

auto BuildCoordinator::build_locked(
    Image& image, const std::shared_ptr<Connection>& connection)
    -> Result<void> {
  if (image.container()) {
    remove_stale_container(image);
  }
  if (image.build_id()) {
    remove_stale_build(image);
  }

  log::info("Building image {} on server {}", image.name(), connection->name());
  auto built = connection->client().build_image(image.files_dir());
  if (!built) {
    log::error("Failed to build image {} on server {}: {}", image.name(),
               connection->name(), runtime::to_string_view(built.error()));
    return fail(Error::BuildFailed);
  }

  image.set_build(std::move(*built), connection);
  log::info("Built image {} on server {} as {}", image.name(),
            connection->name(), *image.build_id());
  return ok();
}

}  // namespace maestro
