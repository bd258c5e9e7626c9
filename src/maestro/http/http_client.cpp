#include "maestro/http/http_client.hpp"

#include "maestro/util/log.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

namespace maestro::http {

namespace {

struct SocketGuard {
  int fd{-1};
  ~SocketGuard() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};

auto write_all(int fd, std::span<const std::uint8_t> data) -> bool {
  std::size_t sent = 0;
  while (sent < data.size()) {
    auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

// Waits until `fd` is readable. A zero timeout waits indefinitely; a stop
// request is noticed within one poll slice.
auto wait_readable(int fd, std::chrono::milliseconds timeout,
                   const std::stop_token& stop) -> bool {
  bool cancellable = stop.stop_possible();
  if (timeout.count() <= 0 && !cancellable) {
    return true;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (stop.stop_requested()) {
      errno = ECANCELED;
      return false;
    }

    auto slice = cancellable ? std::chrono::milliseconds(
                                   timing::kShutdownPollInterval)
                             : timeout;
    if (timeout.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        errno = ETIMEDOUT;
        return false;
      }
      slice = std::min(slice, remaining);
    }

    pollfd pfd{fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (ready > 0) {
      return true;
    }
    if (ready < 0 && errno != EINTR) {
      return false;
    }
  }
}

// Returns bytes read, 0 on EOF, -1 on error, timeout or cancellation.
auto read_some(int fd, std::span<std::uint8_t> buffer,
               std::chrono::milliseconds timeout, const std::stop_token& stop)
    -> ssize_t {
  if (!wait_readable(fd, timeout, stop)) {
    return -1;
  }
  ssize_t n = 0;
  do {
    n = ::read(fd, buffer.data(), buffer.size());
  } while (n < 0 && errno == EINTR);
  return n;
}

}  // namespace

HttpClient::HttpClient(std::string socket_path, HttpClientConfig config)
    : socket_path_(std::move(socket_path)), config_(config) {}

auto HttpClient::connect() const -> Result<int> {
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    log::error("Failed to create unix socket: {}", std::strerror(errno));
    return fail(Error::ConnectionFailed);
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;

  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    log::error("Socket path too long: {}", socket_path_);
    ::close(fd);
    return fail(Error::InvalidArgument);
  }

  std::memcpy(addr.sun_path, socket_path_.data(), socket_path_.size());
  addr.sun_path[socket_path_.size()] = '\0';

  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log::debug("Failed to connect to {}: {}", socket_path_,
               std::strerror(errno));
    ::close(fd);
    return fail(Error::ConnectionFailed);
  }
  return ok(fd);
}

auto HttpClient::exchange(HttpRequest req, BodyCallback on_body,
                          HeadersCallback on_headers, std::stop_token stop)
    -> Result<HttpResponse> {
  auto fd = connect();
  if (!fd) {
    return fail(fd.error());
  }
  SocketGuard guard{*fd};

  if (!req.headers.contains("Host")) {
    req.headers["Host"] = "d";
  }
  req.headers["Connection"] = "close";

  if (!write_all(guard.fd, req.serialize())) {
    log::error("Failed to write request {} {}: {}", method_name(req.method),
               req.path, std::strerror(errno));
    return fail(Error::ConnectionFailed);
  }

  HttpResponseParser parser;
  std::size_t buffered = 0;
  bool streaming = static_cast<bool>(on_body);
  auto timeout = streaming ? config_.stream_idle_timeout : config_.read_timeout;
  if (streaming) {
    parser.set_body_callback(std::move(on_body));
  }
  if (on_headers) {
    parser.set_headers_callback(std::move(on_headers));
  }

  std::array<std::uint8_t, io::kReadBufferSize> buffer{};
  while (true) {
    auto n = read_some(guard.fd, buffer, timeout, stop);
    if (n < 0 && errno == ECANCELED) {
      log::debug("Request {} {} cancelled", method_name(req.method), req.path);
      return fail(Error::Cancelled);
    }
    if (n < 0) {
      log::error("Failed to read response for {} {}: {}",
                 method_name(req.method), req.path, std::strerror(errno));
      return fail(Error::ConnectionFailed);
    }
    if (n == 0) {
      if (auto response = parser.finish()) {
        return ok(std::move(*response));
      }
      log::error("Connection closed before response to {} {} completed",
                 method_name(req.method), req.path);
      return fail(Error::ConnectionFailed);
    }

    buffered += static_cast<std::size_t>(n);
    auto response =
        parser.parse(std::span{buffer.data(), static_cast<std::size_t>(n)});
    if (response) {
      return ok(std::move(*response));
    }
    if (parser.failed()) {
      return fail(Error::ParseError);
    }
    // Streamed bodies are unbounded; only buffered ones are capped.
    if (!streaming && buffered > config_.max_response_size) {
      log::error("Response to {} {} exceeds {} bytes", method_name(req.method),
                 req.path, config_.max_response_size);
      return fail(Error::ParseError);
    }
  }
}

auto HttpClient::request(HttpRequest req) -> Result<HttpResponse> {
  return exchange(std::move(req), {}, {}, {});
}

auto HttpClient::stream(HttpRequest req, BodyCallback on_body,
                        HeadersCallback on_headers, std::stop_token stop)
    -> Result<HttpResponse> {
  return exchange(std::move(req), std::move(on_body), std::move(on_headers),
                  std::move(stop));
}

auto HttpClient::get(std::string_view path) -> Result<HttpResponse> {
  return request(HttpRequest{HttpMethod::GET, std::string(path), {}, {}});
}

auto HttpClient::post(std::string_view path, std::vector<std::uint8_t> body,
                      const HttpHeaders& headers) -> Result<HttpResponse> {
  return request(
      HttpRequest{HttpMethod::POST, std::string(path), headers, std::move(body)});
}

auto HttpClient::post_json(std::string_view path, std::string_view json)
    -> Result<HttpResponse> {
  HttpHeaders headers{{"Content-Type", "application/json"}};
  return request(HttpRequest{HttpMethod::POST, std::string(path),
                             std::move(headers),
                             std::vector<std::uint8_t>(json.begin(), json.end())});
}

auto HttpClient::delete_(std::string_view path) -> Result<HttpResponse> {
  return request(HttpRequest{HttpMethod::DELETE, std::string(path), {}, {}});
}

}  // namespace maestro::http
