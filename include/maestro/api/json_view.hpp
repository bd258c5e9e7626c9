#pragma once

#include "maestro/config/config.hpp"
#include "maestro/model/image.hpp"

#include <nlohmann/json.hpp>

#include <system_error>

namespace maestro::api {

// JSON shapes served by the API. Host credentials never leave the process.
[[nodiscard]] auto to_json(const Container& container) -> nlohmann::json;
[[nodiscard]] auto to_json(const ImageView& image) -> nlohmann::json;
[[nodiscard]] auto to_json(const ServerInfo& server) -> nlohmann::json;

// HTTP status for a failed operation.
[[nodiscard]] auto status_for(const std::error_code& ec) noexcept -> int;

}  // namespace maestro::api
