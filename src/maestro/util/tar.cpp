#include "maestro/util/tar.hpp"

#include "maestro/util/log.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <fstream>
#include <string>

namespace maestro::tar {

namespace fs = std::filesystem;

namespace {

struct Entry {
  std::string name;  // relative, '/'-separated
  fs::path source;
  char type;         // '0' file, '5' directory, '2' symlink
  std::uintmax_t size{0};
  std::string link_target;
  unsigned mode{0644};
  std::int64_t mtime{0};
};

auto write_octal(char* field, std::size_t width, std::uint64_t value) -> bool {
  // width includes the trailing NUL
  auto text = std::format("{:0{}o}", value, width - 1);
  if (text.size() > width - 1) {
    return false;
  }
  std::memcpy(field, text.data(), text.size());
  field[width - 1] = '\0';
  return true;
}

auto split_name(const std::string& name, std::string& prefix, std::string& base)
    -> bool {
  if (name.size() <= 100) {
    prefix.clear();
    base = name;
    return true;
  }
  // Split on a '/' so that prefix <= 155 and base <= 100.
  for (auto pos = name.find('/'); pos != std::string::npos;
       pos = name.find('/', pos + 1)) {
    if (pos <= 155 && name.size() - pos - 1 <= 100) {
      prefix = name.substr(0, pos);
      base = name.substr(pos + 1);
      return !base.empty();
    }
  }
  return false;
}

auto make_header(const Entry& e, std::array<char, kBlockSize>& block) -> bool {
  block.fill('\0');

  std::string prefix, base;
  if (!split_name(e.name, prefix, base)) {
    return false;
  }

  std::memcpy(block.data(), base.data(), base.size());
  write_octal(block.data() + 100, 8, e.mode);
  write_octal(block.data() + 108, 8, 0);
  write_octal(block.data() + 116, 8, 0);
  if (!write_octal(block.data() + 124, 12, e.type == '0' ? e.size : 0)) {
    return false;
  }
  write_octal(block.data() + 136, 12,
              static_cast<std::uint64_t>(std::max<std::int64_t>(e.mtime, 0)));
  std::memset(block.data() + 148, ' ', 8);
  block[156] = e.type;
  if (e.type == '2') {
    if (e.link_target.size() > 100) {
      return false;
    }
    std::memcpy(block.data() + 157, e.link_target.data(), e.link_target.size());
  }
  std::memcpy(block.data() + 257, "ustar", 6);
  std::memcpy(block.data() + 263, "00", 2);
  std::memcpy(block.data() + 345, prefix.data(), prefix.size());

  unsigned checksum = 0;
  for (char c : block) {
    checksum += static_cast<unsigned char>(c);
  }
  auto text = std::format("{:06o}", checksum);
  std::memcpy(block.data() + 148, text.data(), 6);
  block[154] = '\0';
  block[155] = ' ';
  return true;
}

auto append_padding(std::vector<std::uint8_t>& out) -> void {
  auto rem = out.size() % kBlockSize;
  if (rem != 0) {
    out.insert(out.end(), kBlockSize - rem, 0);
  }
}

auto collect(const fs::path& root, const ExcludeFn& exclude,
             std::vector<Entry>& entries) -> Result<void> {
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    log::error("Cannot read build context {}: {}", root.string(), ec.message());
    return fail(Error::FileNotFound);
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      log::error("Failed to walk {}: {}", root.string(), ec.message());
      return fail(Error::FileOpenFailed);
    }

    auto rel = fs::relative(it->path(), root, ec);
    if (ec) {
      return fail(Error::FileOpenFailed);
    }
    if (exclude && exclude(rel)) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }

    struct stat st{};
    if (::lstat(it->path().c_str(), &st) != 0) {
      log::warn("Skipping unreadable path {}", it->path().string());
      continue;
    }

    Entry e;
    e.name = rel.generic_string();
    e.source = it->path();
    e.mode = st.st_mode & 07777;
    e.mtime = st.st_mtime;

    if (S_ISDIR(st.st_mode)) {
      e.type = '5';
      e.name += '/';
    } else if (S_ISLNK(st.st_mode)) {
      e.type = '2';
      e.link_target = fs::read_symlink(it->path(), ec).generic_string();
      if (ec) {
        continue;
      }
    } else if (S_ISREG(st.st_mode)) {
      e.type = '0';
      e.size = static_cast<std::uintmax_t>(st.st_size);
    } else {
      continue;
    }
    entries.push_back(std::move(e));
  }
  return ok();
}

}  // namespace

auto archive_directory(const fs::path& root, const ExcludeFn& exclude)
    -> Result<std::vector<std::uint8_t>> {
  std::vector<Entry> entries;
  if (auto r = collect(root, exclude, entries); !r) {
    return fail(r.error());
  }

  std::ranges::sort(entries, {}, &Entry::name);

  std::vector<std::uint8_t> out;
  std::array<char, kBlockSize> header{};

  for (const auto& e : entries) {
    if (!make_header(e, header)) {
      log::error("Path cannot be stored in a tar header: {}", e.name);
      return fail(Error::InvalidArgument);
    }
    out.insert(out.end(), header.begin(), header.end());

    if (e.type != '0') {
      continue;
    }

    std::ifstream in(e.source, std::ios::binary);
    if (!in) {
      log::error("Failed to open {} for archiving", e.source.string());
      return fail(Error::FileOpenFailed);
    }
    auto start = out.size();
    out.resize(start + e.size);
    in.read(reinterpret_cast<char*>(out.data() + start),
            static_cast<std::streamsize>(e.size));
    if (static_cast<std::uintmax_t>(in.gcount()) != e.size) {
      log::error("Short read while archiving {}", e.source.string());
      return fail(Error::FileOpenFailed);
    }
    append_padding(out);
  }

  out.insert(out.end(), 2 * kBlockSize, 0);
  return ok(std::move(out));
}

}  // namespace maestro::tar
