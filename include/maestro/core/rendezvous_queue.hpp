#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace maestro {

// Zero-capacity channel. push() hands a value directly to a consumer and
// returns only once a pop() has taken it, so a producer is paced by consumer
// availability. Competing producers are served in arrival order.
template <typename T>
class RendezvousQueue {
public:
  RendezvousQueue() = default;
  ~RendezvousQueue() {
    close();
  }

  RendezvousQueue(const RendezvousQueue&) = delete;
  auto operator=(const RendezvousQueue&) -> RendezvousQueue& = delete;

  // Blocks until a consumer receives the value. Returns false (and drops the
  // value) if the queue is closed before the handoff happens.
  [[nodiscard]] auto push(T value) -> bool {
    std::unique_lock lock(mu_);
    if (closed_) {
      return false;
    }

    auto ticket = next_ticket_++;
    pending_.push_back(Offer{ticket, std::move(value)});
    consumer_cv_.notify_one();

    producer_cv_.wait(lock, [&] { return taken_ >= ticket + 1 || closed_; });
    if (taken_ >= ticket + 1) {
      return true;
    }

    std::erase_if(pending_,
                  [ticket](const Offer& o) { return o.ticket == ticket; });
    return false;
  }

  // Blocks until a producer offers a value. Returns nullopt once the queue is
  // closed.
  [[nodiscard]] auto pop() -> std::optional<T> {
    std::unique_lock lock(mu_);
    consumer_cv_.wait(lock, [&] { return !pending_.empty() || closed_; });
    if (closed_) {
      return std::nullopt;
    }

    auto offer = std::move(pending_.front());
    pending_.pop_front();
    taken_ = offer.ticket + 1;
    producer_cv_.notify_all();
    return std::move(offer.value);
  }

  // Wakes every blocked producer and consumer. Offers not yet taken are
  // discarded and their push() calls return false.
  auto close() -> void {
    {
      std::lock_guard lock(mu_);
      closed_ = true;
    }
    consumer_cv_.notify_all();
    producer_cv_.notify_all();
  }

  [[nodiscard]] auto is_closed() const -> bool {
    std::lock_guard lock(mu_);
    return closed_;
  }

  // Number of producers currently blocked in push().
  [[nodiscard]] auto waiting_producers() const -> std::size_t {
    std::lock_guard lock(mu_);
    return pending_.size();
  }

private:
  struct Offer {
    std::uint64_t ticket;
    T value;
  };

  mutable std::mutex mu_;
  std::condition_variable consumer_cv_;
  std::condition_variable producer_cv_;
  std::deque<Offer> pending_;
  std::uint64_t next_ticket_{0};
  std::uint64_t taken_{0};
  bool closed_{false};
};

}  // namespace maestro
