#include "maestro/orchestrator/reconciler.hpp"

#include "maestro/orchestrator/connection.hpp"
#include "maestro/util/log.hpp"

namespace maestro {

Reconciler::Reconciler(const StringMap<std::shared_ptr<Image>>& images,
                       std::chrono::milliseconds interval)
    : images_(images), interval_(interval) {}

Reconciler::~Reconciler() {
  stop();
}

auto Reconciler::start() -> void {
  if (running_.exchange(true)) {
    return;
  }

  thread_ = std::jthread([this](std::stop_token st) {
    while (!st.stop_requested()) {
      tick();
      std::unique_lock lock(wait_mu_);
      wait_cv_.wait_for(lock, st, interval_, [] { return false; });
    }
  });

  log::info("Reconciler started (interval {}ms)", interval_.count());
}

auto Reconciler::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }

  log::info("Reconciler stopped");
}

auto Reconciler::is_running() const noexcept -> bool {
  return running_.load();
}

auto Reconciler::tick() -> std::size_t {
  std::size_t finished = 0;
  images_.range([&](const std::string&, const std::shared_ptr<Image>& image) {
    if (reconcile(*image)) {
      ++finished;
    }
    return true;
  });
  return finished;
}

auto Reconciler::reconcile(Image& image) -> bool {
  std::unique_lock lock(image.mu());

  const auto& connection = image.connection();
  auto& container = image.container();
  if (!connection || !container ||
      container->status != ContainerStatus::Running) {
    return false;
  }

  auto state = connection->client().inspect_container(container->id);
  if (!state) {
    log::warn("Failed to inspect container {} of image {}: {}", container->id,
              image.name(), runtime::to_string_view(state.error()));
    return false;
  }

  if (state->status != runtime::RemoteStatus::Exited) {
    return false;
  }

  container->finished_at = state->finished_at.value_or(Clock::now());
  container->status = ContainerStatus::Finished;
  container->close_sinks();
  log::info("Container {} of image {} finished with exit code {}",
            container->name, image.name(), state->exit_code);
  return true;
}

}  // namespace maestro
