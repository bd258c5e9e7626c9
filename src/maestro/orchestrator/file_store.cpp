#include "maestro/orchestrator/file_store.hpp"

#include "maestro/core/constants.hpp"
#include "maestro/util/log.hpp"
#include "maestro/util/names.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <shared_mutex>

namespace maestro {

auto FileStore::save(Image& image, const std::vector<UploadedFile>& files)
    -> Result<void> {
  if (files.empty()) {
    return fail(Error::InvalidArgument);
  }
  for (const auto& file : files) {
    if (!is_valid_file_name(file.name)) {
      log::warn("Rejected upload {} for image {}", file.name, image.name());
      return fail(Error::InvalidArgument);
    }
  }

  std::unique_lock lock(image.mu());

  // Contents are staged under the run directory and only moved into place
  // once every file has been written, so a failed upload changes nothing.
  auto staging = image.files_dir() / layout::kRunDir;
  std::error_code ec;
  std::filesystem::create_directory(staging, ec);
  if (ec) {
    log::error("Failed to prepare {}: {}", staging.string(), ec.message());
    return fail(Error::FileOpenFailed);
  }

  std::vector<std::filesystem::path> staged;
  auto discard = [&staged] {
    for (const auto& path : staged) {
      std::error_code ignored;
      std::filesystem::remove(path, ignored);
    }
  };

  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto& file = files[i];
    auto path = staging / std::format("upload-{}", i);
    staged.push_back(path);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      log::error("Failed to open {} for writing", path.string());
      discard();
      return fail(Error::FileOpenFailed);
    }
    out.write(file.content.data(),
              static_cast<std::streamsize>(file.content.size()));
    out.close();
    if (!out) {
      log::error("Failed to write {} for image {}", file.name, image.name());
      discard();
      return fail(Error::FileOpenFailed);
    }
  }

  for (const auto& file : files) {
    auto target = image.files_dir() / file.name;
    if (std::filesystem::is_directory(target, ec)) {
      log::error("Cannot replace directory {} with an upload", target.string());
      discard();
      return fail(Error::FileOpenFailed);
    }
  }

  for (std::size_t i = 0; i < files.size(); ++i) {
    auto target = image.files_dir() / files[i].name;
    std::filesystem::rename(staged[i], target, ec);
    if (ec) {
      log::error("Failed to move upload into {}: {}", target.string(),
                 ec.message());
      discard();
      return fail(Error::FileOpenFailed);
    }
    log::debug("Saved {} ({} bytes) for image {}", files[i].name,
               files[i].content.size(), image.name());
  }
  return ok();
}

auto FileStore::list(const Image& image) -> Result<std::vector<std::string>> {
  std::shared_lock lock(image.mu());

  std::error_code ec;
  std::filesystem::directory_iterator it(image.files_dir(), ec);
  if (ec) {
    log::error("Failed to read directory {}: {}", image.files_dir().string(),
               ec.message());
    return fail(Error::FileNotFound);
  }

  std::vector<std::string> names;
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    log::error("Failed to list {}: {}", image.files_dir().string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }
  std::ranges::sort(names);
  return ok(std::move(names));
}

auto FileStore::read(const Image& image, std::string_view name)
    -> Result<std::string> {
  if (!is_valid_file_name(name)) {
    return fail(Error::InvalidArgument);
  }

  std::shared_lock lock(image.mu());
  auto path = image.files_dir() / name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::NotFound);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    log::error("Failed to open {}", path.string());
    return fail(Error::FileOpenFailed);
  }
  std::string content{std::istreambuf_iterator<char>(in),
                      std::istreambuf_iterator<char>()};
  return ok(std::move(content));
}

auto FileStore::remove(Image& image, std::string_view name) -> Result<void> {
  if (!is_valid_file_name(name)) {
    return fail(Error::InvalidArgument);
  }

  std::unique_lock lock(image.mu());
  auto path = image.files_dir() / name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::NotFound);
  }
  if (!std::filesystem::remove(path, ec) || ec) {
    log::error("Failed to delete {}: {}", path.string(), ec.message());
    return fail(Error::FileOpenFailed);
  }
  log::info("Deleted {} from image {}", name, image.name());
  return ok();
}

}  // namespace maestro
