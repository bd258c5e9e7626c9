#pragma once

#include "maestro/core/constants.hpp"
#include "maestro/core/error.hpp"
#include "maestro/http/http_parser.hpp"
#include "maestro/http/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace maestro::http {

struct HttpClientConfig {
  // Applies to request(). Zero disables the timeout.
  std::chrono::milliseconds read_timeout{0};
  // Longest quiet gap tolerated by stream(). Zero disables it; a streamed
  // body may stay silent for as long as the remote work takes.
  std::chrono::milliseconds stream_idle_timeout{0};
  std::size_t max_response_size{io::kMaxResponseSize};
};

// Blocking HTTP/1.1 client for a Unix-domain socket. Every request dials its
// own connection and closes it afterwards, so one client may be used from
// several threads at once.
class HttpClient {
public:
  using BodyCallback = HttpResponseParser::BodyCallback;
  using HeadersCallback = HttpResponseParser::HeadersCallback;

  explicit HttpClient(std::string socket_path, HttpClientConfig config = {});

  [[nodiscard]] auto request(HttpRequest req) -> Result<HttpResponse>;

  // Like request(), but the body of a 2xx response is passed to `on_body` as
  // it arrives and is not kept in the returned response. `on_headers` fires
  // once the response head is in. Returns when the server finishes the
  // message or closes the connection, or with Cancelled once `stop` is
  // requested.
  [[nodiscard]] auto stream(HttpRequest req, BodyCallback on_body,
                            HeadersCallback on_headers = {},
                            std::stop_token stop = {})
      -> Result<HttpResponse>;

  [[nodiscard]] auto get(std::string_view path) -> Result<HttpResponse>;
  [[nodiscard]] auto post(std::string_view path,
                          std::vector<std::uint8_t> body = {},
                          const HttpHeaders& headers = {})
      -> Result<HttpResponse>;
  [[nodiscard]] auto post_json(std::string_view path, std::string_view json)
      -> Result<HttpResponse>;
  [[nodiscard]] auto delete_(std::string_view path) -> Result<HttpResponse>;

  [[nodiscard]] auto socket_path() const noexcept -> const std::string& {
    return socket_path_;
  }

private:
  [[nodiscard]] auto connect() const -> Result<int>;
  [[nodiscard]] auto exchange(HttpRequest req, BodyCallback on_body,
                              HeadersCallback on_headers, std::stop_token stop)
      -> Result<HttpResponse>;

  std::string socket_path_;
  HttpClientConfig config_;
};

}  // namespace maestro::http
