#pragma once

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace maestro::test {

// Accepts connections on a Unix socket and answers each one with a canned
// response. With a tail, the response is sent in two parts separated by a
// quiet gap. The raw request head of the last connection is kept.
class CannedServer {
public:
  CannedServer(std::string path, std::string response, bool hold_open = false,
               std::string tail = {},
               std::chrono::milliseconds tail_delay = {})
      : path_(std::move(path)), response_(std::move(response)),
        tail_(std::move(tail)), tail_delay_(tail_delay),
        hold_open_(hold_open) {
    fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 4);
    thread_ = std::thread([this] { serve(); });
  }

  ~CannedServer() {
    done_ = true;
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    thread_.join();
  }

  CannedServer(const CannedServer&) = delete;
  CannedServer& operator=(const CannedServer&) = delete;

  [[nodiscard]] auto last_request() -> std::string {
    std::lock_guard lock(mu_);
    return last_request_;
  }

private:
  auto serve() -> void {
    while (!done_) {
      int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      std::string request;
      char buf[1024];
      while (request.find("\r\n\r\n") == std::string::npos) {
        auto n = ::read(client, buf, sizeof(buf));
        if (n <= 0) {
          break;
        }
        request.append(buf, static_cast<std::size_t>(n));
      }
      {
        std::lock_guard lock(mu_);
        last_request_ = request;
      }
      ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
      if (!tail_.empty()) {
        std::this_thread::sleep_for(tail_delay_);
        ::send(client, tail_.data(), tail_.size(), MSG_NOSIGNAL);
      }
      while (hold_open_ && !done_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      ::close(client);
    }
  }

  std::string path_;
  std::string response_;
  std::string tail_;
  std::chrono::milliseconds tail_delay_;
  bool hold_open_;
  int fd_{-1};
  std::atomic<bool> done_{false};
  std::mutex mu_;
  std::string last_request_;
  std::thread thread_;
};

}  // namespace maestro::test
