#include "maestro/api/json_view.hpp"

#include "maestro/util/time.hpp"

namespace maestro::api {

using json = nlohmann::json;

auto to_json(const Container& container) -> json {
  json j = {{"id", container.id},
            {"name", container.name},
            {"status", to_string_view(container.status)},
            {"created_at", format_iso8601(container.created_at)},
            {"finished_at", nullptr}};
  if (container.finished_at) {
    j["finished_at"] = format_iso8601(*container.finished_at);
  }
  return j;
}

auto to_json(const ImageView& image) -> json {
  json j = {{"id", nullptr},
            {"name", image.name},
            {"connection", nullptr},
            {"container", nullptr},
            {"status", nullptr}};
  if (image.build_id) {
    j["id"] = *image.build_id;
  }
  if (image.server_name) {
    j["connection"] = {{"server", {{"name", *image.server_name}}}};
  }
  if (image.container) {
    j["container"] = to_json(*image.container);
  }
  if (auto status = image.status()) {
    j["status"] = to_string_view(*status);
  }
  return j;
}

auto to_json(const ServerInfo& server) -> json {
  return {{"name", server.name}, {"local", server.is_local()}};
}

auto status_for(const std::error_code& ec) noexcept -> int {
  if (ec.category() != error_category()) {
    return 500;
  }
  switch (static_cast<Error>(ec.value())) {
    case Error::NotFound:
    case Error::FileNotFound:
      return 404;
    case Error::Conflict:
    case Error::AlreadyExists:
      return 409;
    case Error::InvalidArgument:
    case Error::ParseError:
      return 400;
    default:
      return 500;
  }
}

}  // namespace maestro::api
