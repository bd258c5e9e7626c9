#pragma once

#include "maestro/config/config.hpp"
#include "maestro/core/error.hpp"
#include "maestro/core/rendezvous_queue.hpp"
#include "maestro/model/image.hpp"
#include "maestro/runtime/runtime_client.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace maestro {

// A live session to one host's container runtime and the worker that drains
// its run queue. Runs handed to a Connection execute one at a time, in the
// order they were enqueued.
class Connection {
public:
  using RunHandler = std::function<void(const std::shared_ptr<Image>&,
                                        Connection&, std::stop_token)>;

  Connection(ServerInfo server, std::shared_ptr<runtime::RuntimeClient> client);
  ~Connection();

  Connection(const Connection&) = delete;
  auto operator=(const Connection&) -> Connection& = delete;

  auto start(RunHandler handler) -> void;
  // Closes the queue, asks the current run to detach and joins the worker.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Blocks until the worker takes the image. Fails with QueueClosed once the
  // connection is stopping.
  [[nodiscard]] auto enqueue(std::shared_ptr<Image> image) -> Result<void>;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return server_.name;
  }
  [[nodiscard]] auto server() const noexcept -> const ServerInfo& {
    return server_;
  }
  [[nodiscard]] auto client() const noexcept -> runtime::RuntimeClient& {
    return *client_;
  }
  [[nodiscard]] auto queued() const -> std::size_t {
    return queue_.waiting_producers();
  }

private:
  auto worker_loop(std::stop_token st) -> void;

  ServerInfo server_;
  std::shared_ptr<runtime::RuntimeClient> client_;
  RendezvousQueue<std::shared_ptr<Image>> queue_;
  RunHandler handler_;
  std::atomic<bool> running_{false};
  std::jthread worker_;
};

}  // namespace maestro
