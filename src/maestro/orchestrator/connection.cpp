#include "maestro/orchestrator/connection.hpp"

#include "maestro/util/log.hpp"

namespace maestro {

Connection::Connection(ServerInfo server,
                       std::shared_ptr<runtime::RuntimeClient> client)
    : server_(std::move(server)), client_(std::move(client)) {}

Connection::~Connection() {
  stop();
}

auto Connection::start(RunHandler handler) -> void {
  if (running_.exchange(true)) {
    return;
  }
  handler_ = std::move(handler);
  worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
  log::debug("Run worker started for server {}", server_.name);
}

auto Connection::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.close();
  if (worker_.joinable()) {
    worker_.request_stop();
    worker_.join();
  }
  log::debug("Run worker stopped for server {}", server_.name);
}

auto Connection::is_running() const noexcept -> bool {
  return running_.load();
}

auto Connection::enqueue(std::shared_ptr<Image> image) -> Result<void> {
  if (!queue_.push(std::move(image))) {
    return fail(Error::QueueClosed);
  }
  return ok();
}

auto Connection::worker_loop(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    auto image = queue_.pop();
    if (!image) {
      break;
    }
    handler_(*image, *this, st);
  }
}

}  // namespace maestro
