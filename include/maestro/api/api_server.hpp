#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace maestro {

class Orchestrator;

// REST front end for the Orchestrator, served by Crow on its own thread pool.
class ApiServer {
public:
  ApiServer(Orchestrator& orchestrator, uint16_t port = 3003,
            const std::string& host = "127.0.0.1");
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  auto operator=(const ApiServer&) -> ApiServer& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace maestro
