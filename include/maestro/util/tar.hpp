#pragma once

#include "maestro/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string_view>
#include <vector>

namespace maestro::tar {

inline constexpr std::size_t kBlockSize = 512;

// Return true to leave a path (relative to the archive root) out of the
// archive. Excluding a directory excludes everything below it.
using ExcludeFn = std::function<bool(const std::filesystem::path& relative)>;

// Builds an uncompressed POSIX ustar archive of everything below `root`,
// suitable as a container build context. Entries are sorted so the archive is
// deterministic for a given tree. Symlinks are stored as links.
[[nodiscard]] auto archive_directory(const std::filesystem::path& root,
                                     const ExcludeFn& exclude = {})
    -> Result<std::vector<std::uint8_t>>;

}  // namespace maestro::tar
