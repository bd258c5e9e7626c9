#pragma once

#include "maestro/core/concurrent_map.hpp"
#include "maestro/model/image.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace maestro {

// Polls the runtime for every Image with a running container and moves it to
// `finished` once the host reports it exited.
class Reconciler {
public:
  Reconciler(const StringMap<std::shared_ptr<Image>>& images,
             std::chrono::milliseconds interval);
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  auto operator=(const Reconciler&) -> Reconciler& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // One sweep over a snapshot of the registry. Returns how many Images
  // reached a terminal state.
  auto tick() -> std::size_t;

  [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds {
    return interval_;
  }

private:
  auto reconcile(Image& image) -> bool;

  const StringMap<std::shared_ptr<Image>>& images_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> running_{false};
  std::mutex wait_mu_;
  std::condition_variable_any wait_cv_;
  std::jthread thread_;
};

}  // namespace maestro
