#pragma once

#include <string_view>

namespace maestro {

// Image names double as directory names under the images directory: no
// separators, no `.`/`..`, and nothing hidden.
[[nodiscard]] auto is_valid_image_name(std::string_view name) noexcept -> bool;

// A plain file name that resolves to a direct child of its directory and
// does not collide with the per-image run directory.
[[nodiscard]] auto is_valid_file_name(std::string_view name) noexcept -> bool;

}  // namespace maestro
