#include "maestro/orchestrator/run_dispatcher.hpp"

#include "maestro/orchestrator/build_coordinator.hpp"
#include "maestro/util/log.hpp"
#include "maestro/util/time.hpp"

#include <format>
#include <mutex>

namespace maestro {

namespace {

auto record_failure(Image& image, std::string id, std::string name,
                    TimePoint created_at) -> void {
  image.clear_container();
  image.container() = Container{
      .id = std::move(id),
      .name = std::move(name),
      .status = ContainerStatus::Error,
      .created_at = created_at,
  };
}

}  // namespace

auto RunDispatcher::run(const std::shared_ptr<Image>& image,
                        const std::shared_ptr<Connection>& connection)
    -> Result<void> {
  {
    std::unique_lock lock(image->mu());
    if (image->is_deleted()) {
      return fail(Error::NotFound);
    }
    if (image->is_running() || image->run_pending()) {
      log::warn("Image {} already has a running or queued container",
                image->name());
      return fail(Error::Conflict);
    }

    if (!image->build_id() || image->connection() != connection) {
      if (auto built = BuildCoordinator::build_locked(*image, connection);
          !built) {
        return built;
      }
    }
    image->set_run_pending(true);
  }

  log::debug("Queueing run of {} on server {}", image->name(),
             connection->name());
  if (auto queued = connection->enqueue(image); !queued) {
    std::unique_lock lock(image->mu());
    image->set_run_pending(false);
    log::warn("Run of {} on server {} was not accepted: {}", image->name(),
              connection->name(), queued.error().message());
    return queued;
  }
  return ok();
}

auto RunDispatcher::execute(const std::shared_ptr<Image>& image,
                            Connection& connection, std::stop_token stop)
    -> void {
  std::unique_lock lock(image->mu());
  image->set_run_pending(false);
  if (image->is_deleted()) {
    log::info("Dropping queued run of deleted image {}", image->name());
    return;
  }

  auto now = Clock::now();
  auto stamp = format_compact_local(now);
  auto name = container_name_for(image->name(), now);
  auto& client = connection.client();

  // A rebuild elsewhere may have moved the Image while its run was queued.
  if (!image->build_id() || image->connection().get() != &connection) {
    log::error("Image {} is no longer built on server {}", image->name(),
               connection.name());
    record_failure(*image, {}, std::move(name), now);
    return;
  }

  if (auto prepared = image->prepare_log_dir(); !prepared) {
    log::error("Failed to prepare output logs for {} under {}: {}",
               image->name(), image->log_dir().string(),
               prepared.error().message());
    record_failure(*image, {}, std::move(name), now);
    return;
  }

  auto created = client.create_container(*image->build_id(), name);
  if (!created) {
    log::error("Failed to create container for {} on server {}: {}",
               image->name(), connection.name(),
               runtime::to_string_view(created.error()));
    record_failure(*image, {}, std::move(name), now);
    return;
  }
  std::string container_id = std::move(*created);

  auto out = runtime::OutputSink::open(image->log_dir() /
                                       std::format("{}.stdout.log", stamp));
  auto err = runtime::OutputSink::open(image->log_dir() /
                                       std::format("{}.stderr.log", stamp));
  if (!out || !err) {
    log::error("Failed to open output logs for {} under {}", image->name(),
               image->log_dir().string());
    record_failure(*image, container_id, std::move(name), now);
    return;
  }

  image->clear_container();
  image->container() = Container{
      .id = container_id,
      .name = name,
      .status = ContainerStatus::Running,
      .created_at = now,
      .finished_at = std::nullopt,
      .stdout_sink = *out,
      .stderr_sink = *err,
  };

  if (auto started = client.start_container(container_id); !started) {
    log::error("Failed to start container {} for {}: {}", name, image->name(),
               runtime::to_string_view(started.error()));
    image->container()->status = ContainerStatus::Error;
    image->container()->close_sinks();
    return;
  }
  log::info("Started container {} ({}) for {} on server {}", name,
            container_id, image->name(), connection.name());

  // The sinks stay alive here even if the Image drops its container while
  // output is still being copied.
  auto out_sink = *out;
  auto err_sink = *err;
  auto attached = client.attach_container(
      container_id, *out_sink, *err_sink, [&lock] { lock.unlock(); }, stop);

  if (attached) {
    log::debug("Output stream of {} ended", name);
    return;
  }
  if (stop.stop_requested()) {
    return;
  }

  if (!lock.owns_lock()) {
    lock.lock();
  }
  auto& container = image->container();
  if (container && container->id == container_id &&
      container->status == ContainerStatus::Running) {
    log::error("Lost output stream of container {} for {}: {}", name,
               image->name(), runtime::to_string_view(attached.error()));
    container->status = ContainerStatus::Error;
    container->close_sinks();
  }
}

}  // namespace maestro
