#pragma once

#include "maestro/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maestro::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD
};

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  NoContent = 204,

  NotModified = 304,

  BadRequest = 400,
  NotFound = 404,
  Conflict = 409,

  InternalServerError = 500,
};

[[nodiscard]] constexpr auto is_success(HttpStatus status) noexcept -> bool {
  auto code = static_cast<std::uint16_t>(status);
  return code >= 200 && code < 300;
}

using HttpHeaders =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  [[nodiscard]] auto serialize() const -> std::vector<std::uint8_t>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
};

[[nodiscard]] auto method_name(HttpMethod method) noexcept -> std::string_view;

}  // namespace maestro::http

template <>
struct std::formatter<maestro::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(maestro::http::HttpStatus status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
