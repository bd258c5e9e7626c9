#include "maestro/runtime/output_sink.hpp"

#include "maestro/util/log.hpp"

namespace maestro::runtime {

auto OutputSink::open(const std::filesystem::path& path)
    -> Result<std::shared_ptr<OutputSink>> {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out.is_open()) {
    log::error("Failed to open output sink {}", path.string());
    return fail(Error::FileOpenFailed);
  }
  return ok(std::make_shared<OutputSink>(path, std::move(out)));
}

OutputSink::OutputSink(std::filesystem::path path, std::ofstream out)
    : path_(std::move(path)), out_(std::move(out)) {}

OutputSink::~OutputSink() {
  close();
}

auto OutputSink::write(std::span<const std::uint8_t> data) -> void {
  std::lock_guard lock(mu_);
  if (!out_.is_open()) {
    return;
  }
  out_.write(reinterpret_cast<const char*>(data.data()),
             static_cast<std::streamsize>(data.size()));
  out_.flush();
  written_ += data.size();
}

auto OutputSink::write(std::string_view text) -> void {
  write(std::span{reinterpret_cast<const std::uint8_t*>(text.data()),
                  text.size()});
}

auto OutputSink::close() -> void {
  std::lock_guard lock(mu_);
  if (out_.is_open()) {
    out_.close();
  }
}

auto OutputSink::is_open() const -> bool {
  std::lock_guard lock(mu_);
  return out_.is_open();
}

auto OutputSink::bytes_written() const -> std::uint64_t {
  std::lock_guard lock(mu_);
  return written_;
}

}  // namespace maestro::runtime
