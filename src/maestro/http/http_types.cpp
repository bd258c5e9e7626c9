#include "maestro/http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace maestro::http {

namespace {

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

}  // namespace

auto method_name(HttpMethod method) noexcept -> std::string_view {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::HEAD:
      return "HEAD";
  }
  return "GET";
}

auto HttpRequest::serialize() const -> std::vector<std::uint8_t> {
  std::string head;
  head.reserve(256);
  std::format_to(std::back_inserter(head), "{} {} HTTP/1.1\r\n",
                 method_name(method), path);

  bool has_length = false;
  for (const auto& [key, value] : headers) {
    if (iequals(key, "Content-Length")) {
      has_length = true;
    }
    std::format_to(std::back_inserter(head), "{}: {}\r\n", key, value);
  }
  if (!has_length && (!body.empty() || method == HttpMethod::POST ||
                      method == HttpMethod::PUT)) {
    std::format_to(std::back_inserter(head), "Content-Length: {}\r\n",
                   body.size());
  }
  head += "\r\n";

  std::vector<std::uint8_t> out;
  out.reserve(head.size() + body.size());
  out.insert(out.end(), head.begin(), head.end());
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  for (const auto& [k, v] : headers) {
    if (iequals(k, key)) {
      return v;
    }
  }
  return std::nullopt;
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char*>(body.data()), body.size()};
}

}  // namespace maestro::http
