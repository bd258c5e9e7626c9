#include "maestro/util/names.hpp"

#include "maestro/core/constants.hpp"

namespace maestro {

namespace {

auto is_plain_component(std::string_view name) noexcept -> bool {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return true;
}

}  // namespace

auto is_valid_image_name(std::string_view name) noexcept -> bool {
  return is_plain_component(name) && name.front() != '.';
}

auto is_valid_file_name(std::string_view name) noexcept -> bool {
  return is_plain_component(name) && name != layout::kRunDir;
}

}  // namespace maestro
