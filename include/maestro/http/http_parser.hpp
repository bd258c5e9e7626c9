#pragma once

#include "maestro/http/http_types.hpp"

#include <llhttp.h>

#include <functional>
#include <memory>
#include <optional>
#include <span>

namespace maestro::http {

// Incremental HTTP/1.1 response parser on top of llhttp. By default the body
// is accumulated into the returned response; with a body callback installed,
// body bytes of successful (2xx) responses are handed to the callback as they
// arrive instead.
class HttpResponseParser {
public:
  using BodyCallback = std::function<void(std::span<const std::uint8_t>)>;
  using HeadersCallback = std::function<void(HttpStatus)>;

  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  auto set_body_callback(BodyCallback cb) -> void;
  // Called once the status line and headers have been parsed.
  auto set_headers_callback(HeadersCallback cb) -> void;

  // Returns the response once the message is complete.
  auto parse(std::span<const std::uint8_t> data) -> std::optional<HttpResponse>;

  // Signals end of stream. Completes responses whose body is delimited by
  // connection close.
  auto finish() -> std::optional<HttpResponse>;

  [[nodiscard]] auto failed() const noexcept -> bool;
  [[nodiscard]] auto headers_complete() const noexcept -> bool;

  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace maestro::http
