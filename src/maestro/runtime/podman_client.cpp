#include "maestro/runtime/podman_client.hpp"

#include "maestro/core/constants.hpp"
#include "maestro/runtime/stream_demux.hpp"
#include "maestro/util/log.hpp"
#include "maestro/util/tar.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <format>
#include <iterator>

namespace maestro::runtime {

using json = nlohmann::json;

namespace {

auto url_encode(std::string_view input) -> std::string {
  std::string result;
  result.reserve(input.size() * 3);
  for (char c : input) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      result += c;
    } else {
      std::format_to(std::back_inserter(result), "%{:02X}",
                     static_cast<unsigned char>(c));
    }
  }
  return result;
}

auto is_valid_id(std::string_view id) -> bool {
  if (id.empty() || id.size() > 128) {
    return false;
  }
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != ':' && c != '-' &&
        c != '_' && c != '.') {
      return false;
    }
  }
  return true;
}

// Runtimes report "never" as the zero time, 0001-01-01T00:00:00Z.
auto parse_optional_time(const json& state, const char* key)
    -> std::optional<TimePoint> {
  auto it = state.find(key);
  if (it == state.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto text = it->get<std::string>();
  if (text.empty() || text.starts_with("0001-")) {
    return std::nullopt;
  }
  auto tp = parse_rfc3339(text);
  if (!tp) {
    log::warn("Unparseable {} timestamp from runtime: {}", key, text);
    return std::nullopt;
  }
  return *tp;
}

auto api_error_message(const http::HttpResponse& response) -> std::string {
  try {
    auto body = json::parse(response.body.begin(), response.body.end());
    if (body.contains("message") && body["message"].is_string()) {
      return body["message"].get<std::string>();
    }
  } catch (const json::exception&) {
    // Not JSON; fall through to the raw body.
  }
  return std::string(response.body_as_string());
}

auto to_runtime_error(const std::error_code& ec) -> RuntimeError {
  if (ec == Error::ParseError) {
    return RuntimeError::ParseError;
  }
  return RuntimeError::ConnectionFailed;
}

}  // namespace

auto parse_remote_status(std::string_view status) noexcept -> RemoteStatus {
  if (status == "running") {
    return RemoteStatus::Running;
  }
  if (status == "exited" || status == "stopped") {
    return RemoteStatus::Exited;
  }
  if (status == "created" || status == "configured") {
    return RemoteStatus::Created;
  }
  if (status == "paused") {
    return RemoteStatus::Paused;
  }
  return RemoteStatus::Other;
}

auto parse_build_output(std::string_view body) -> RuntimeResult<std::string> {
  std::string image_id;

  while (!body.empty()) {
    auto eol = body.find('\n');
    auto line = body.substr(0, eol);
    body = eol == std::string_view::npos ? std::string_view{}
                                         : body.substr(eol + 1);
    if (line.empty() || line == "\r") {
      continue;
    }

    json entry;
    try {
      entry = json::parse(line);
    } catch (const json::exception& e) {
      log::debug("Skipping malformed build output line: {}", e.what());
      continue;
    }
    if (!entry.is_object()) {
      continue;
    }

    if (auto it = entry.find("error");
        it != entry.end() && it->is_string() && !it->get<std::string>().empty()) {
      log::error("Image build failed: {}", it->get<std::string>());
      return std::unexpected(RuntimeError::BuildFailed);
    }

    if (auto aux = entry.find("aux"); aux != entry.end() && aux->is_object()) {
      if (auto id = aux->find("ID"); id != aux->end() && id->is_string()) {
        image_id = id->get<std::string>();
        continue;
      }
    }

    if (auto stream = entry.find("stream");
        stream != entry.end() && stream->is_string()) {
      std::string_view text = stream->get_ref<const std::string&>();
      constexpr std::string_view kMarker = "Successfully built ";
      if (text.starts_with(kMarker) && image_id.empty()) {
        auto id = text.substr(kMarker.size());
        while (!id.empty() && std::isspace(static_cast<unsigned char>(id.back()))) {
          id.remove_suffix(1);
        }
        image_id = std::string(id);
      }
    }
  }

  if (image_id.empty()) {
    log::error("Image build finished without reporting an image id");
    return std::unexpected(RuntimeError::BuildFailed);
  }
  return image_id;
}

auto parse_inspect_response(std::string_view body)
    -> RuntimeResult<ContainerState> {
  try {
    auto doc = json::parse(body);
    auto state_it = doc.find("State");
    if (state_it == doc.end() || !state_it->is_object()) {
      log::error("Inspect response has no State object");
      return std::unexpected(RuntimeError::ParseError);
    }
    const auto& state = *state_it;

    ContainerState result;
    result.status = parse_remote_status(state.value("Status", ""));
    result.started_at = parse_optional_time(state, "StartedAt");
    result.finished_at = parse_optional_time(state, "FinishedAt");
    result.exit_code = state.value("ExitCode", 0);
    return result;
  } catch (const json::exception& e) {
    log::error("Failed to parse inspect response: {}", e.what());
    return std::unexpected(RuntimeError::ParseError);
  }
}

PodmanClient::PodmanClient(std::string socket_path, PodmanClientConfig config,
                           std::unique_ptr<SshTunnel> tunnel)
    : http_(std::move(socket_path),
            http::HttpClientConfig{.read_timeout = config.read_timeout}),
      config_(std::move(config)),
      tunnel_(std::move(tunnel)) {}

PodmanClient::~PodmanClient() = default;

auto PodmanClient::connect(const ServerInfo& server,
                           const RuntimeConfig& config)
    -> Result<std::unique_ptr<PodmanClient>> {
  std::unique_ptr<SshTunnel> tunnel;
  std::string socket_path = server.podman_socket;

  if (!server.is_local()) {
    auto opened = SshTunnel::open(server, config.connect_timeout);
    if (!opened) {
      return fail(opened.error());
    }
    tunnel = std::move(*opened);
    socket_path = tunnel->local_socket().string();
  }

  auto client = std::make_unique<PodmanClient>(
      std::move(socket_path),
      PodmanClientConfig{.api_version = config.api_version,
                         .read_timeout = config.read_timeout},
      std::move(tunnel));

  if (auto pong = client->ping(); !pong) {
    log::error("Runtime on server {} did not answer ping: {}", server.name,
               to_string_view(pong.error()));
    return fail(Error::ConnectionFailed);
  }

  log::info("Connected to container runtime on server {} ({})", server.name,
            server.is_local() ? server.podman_socket : server.host);
  return ok(std::move(client));
}

auto PodmanClient::endpoint(std::string_view path) const -> std::string {
  return std::format("/{}{}", config_.api_version, path);
}

auto PodmanClient::build_image(const std::filesystem::path& context_dir)
    -> RuntimeResult<std::string> {
  auto archive = tar::archive_directory(
      context_dir, [](const std::filesystem::path& relative) {
        return relative == std::filesystem::path(layout::kRunDir);
      });
  if (!archive) {
    log::error("Failed to archive build context {}: {}", context_dir.string(),
               archive.error().message());
    return std::unexpected(RuntimeError::InvalidInput);
  }

  log::info("Building image from {} ({} bytes of context)",
            context_dir.string(), archive->size());

  // Build steps can be silent for a long time, so the output is streamed
  // rather than read under the request timeout.
  std::string output;
  auto response = http_.stream(
      http::HttpRequest{
          .method = http::HttpMethod::POST,
          .path = endpoint("/build?rm=1&forcerm=1"),
          .headers = {{"Content-Type", "application/x-tar"}},
          .body = std::move(*archive),
      },
      [&output](std::span<const std::uint8_t> chunk) {
        output.append(chunk.begin(), chunk.end());
      });
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (!http::is_success(response->status)) {
    log::error("Image build request failed: status={} {}", response->status,
               api_error_message(*response));
    return std::unexpected(RuntimeError::BuildFailed);
  }

  return parse_build_output(output);
}

auto PodmanClient::remove_image(std::string_view image_id)
    -> RuntimeResult<void> {
  if (!is_valid_id(image_id)) {
    log::error("Invalid image ID: {}", image_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  auto response =
      http_.delete_(endpoint(std::format("/images/{}", url_encode(image_id))));
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status == http::HttpStatus::Conflict) {
    log::warn("Image {} is in use: {}", image_id, api_error_message(*response));
    return std::unexpected(RuntimeError::Conflict);
  }
  if (!http::is_success(response->status)) {
    log::error("Failed to remove image {}: status={}", image_id,
               response->status);
    return std::unexpected(RuntimeError::ApiError);
  }
  return {};
}

auto PodmanClient::create_container(std::string_view image_id,
                                    std::string_view name)
    -> RuntimeResult<std::string> {
  if (!is_valid_id(image_id)) {
    log::error("Invalid image ID: {}", image_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  json body;
  body["Image"] = image_id;
  body["AttachStdout"] = true;
  body["AttachStderr"] = true;
  body["Tty"] = false;

  std::string path = endpoint("/containers/create");
  if (!name.empty()) {
    std::format_to(std::back_inserter(path), "?name={}", url_encode(name));
  }

  auto response = http_.post_json(path, body.dump());
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::error("Image not found: {}", image_id);
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status == http::HttpStatus::Conflict) {
    log::error("Container name conflict: {}", name);
    return std::unexpected(RuntimeError::Conflict);
  }
  if (response->status != http::HttpStatus::Created) {
    log::error("Failed to create container: status={} {}", response->status,
               api_error_message(*response));
    return std::unexpected(RuntimeError::ApiError);
  }

  try {
    auto json_body = json::parse(response->body.begin(), response->body.end());
    auto id = json_body.value("Id", "");
    if (id.empty()) {
      return std::unexpected(RuntimeError::ParseError);
    }
    if (auto warnings = json_body.find("Warnings");
        warnings != json_body.end() && warnings->is_array()) {
      for (const auto& w : *warnings) {
        if (w.is_string()) {
          log::warn("Container {}: {}", name, w.get<std::string>());
        }
      }
    }
    return id;
  } catch (const json::exception& e) {
    log::error("Failed to parse create container response: {}", e.what());
    return std::unexpected(RuntimeError::ParseError);
  }
}

auto PodmanClient::start_container(std::string_view container_id)
    -> RuntimeResult<void> {
  if (!is_valid_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  auto response =
      http_.post(endpoint(std::format("/containers/{}/start", container_id)));
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::error("Container not found: {}", container_id);
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status != http::HttpStatus::NoContent &&
      response->status != http::HttpStatus::NotModified) {
    log::error("Failed to start container {}: status={} {}", container_id,
               response->status, api_error_message(*response));
    return std::unexpected(RuntimeError::ApiError);
  }
  return {};
}

auto PodmanClient::stop_container(std::string_view container_id)
    -> RuntimeResult<void> {
  if (!is_valid_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  auto response = http_.post(
      endpoint(std::format("/containers/{}/stop?t=0", container_id)));
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    log::error("Container not found: {}", container_id);
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status != http::HttpStatus::NoContent &&
      response->status != http::HttpStatus::NotModified) {
    log::error("Failed to stop container {}: status={}", container_id,
               response->status);
    return std::unexpected(RuntimeError::ApiError);
  }
  return {};
}

auto PodmanClient::remove_container(std::string_view container_id,
                                    bool remove_volumes)
    -> RuntimeResult<void> {
  if (!is_valid_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  auto response = http_.delete_(
      endpoint(std::format("/containers/{}?v={}&force=true", container_id,
                           remove_volumes ? 1 : 0)));
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status == http::HttpStatus::Conflict) {
    return std::unexpected(RuntimeError::Conflict);
  }
  if (!http::is_success(response->status)) {
    log::error("Failed to remove container {}: status={}", container_id,
               response->status);
    return std::unexpected(RuntimeError::ApiError);
  }
  return {};
}

auto PodmanClient::inspect_container(std::string_view container_id)
    -> RuntimeResult<ContainerState> {
  if (!is_valid_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  auto response =
      http_.get(endpoint(std::format("/containers/{}/json", container_id)));
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    return std::unexpected(RuntimeError::NotFound);
  }
  if (response->status != http::HttpStatus::Ok) {
    log::error("Failed to inspect container {}: status={}", container_id,
               response->status);
    return std::unexpected(RuntimeError::ApiError);
  }

  return parse_inspect_response(response->body_as_string());
}

auto PodmanClient::attach_container(std::string_view container_id,
                                    OutputSink& out, OutputSink& err,
                                    const std::function<void()>& on_attached,
                                    std::stop_token stop)
    -> RuntimeResult<void> {
  if (!is_valid_id(container_id)) {
    log::error("Invalid container ID: {}", container_id);
    return std::unexpected(RuntimeError::InvalidInput);
  }

  StreamDemuxer demux(out, err);
  bool attached = false;

  http::HttpRequest req{
      .method = http::HttpMethod::POST,
      .path = endpoint(std::format(
          "/containers/{}/attach?stream=1&logs=1&stdout=1&stderr=1",
          container_id)),
  };

  auto response = http_.stream(
      std::move(req),
      [&demux](std::span<const std::uint8_t> chunk) { demux.feed(chunk); },
      [&attached, &on_attached](http::HttpStatus status) {
        if (http::is_success(status) && !attached) {
          attached = true;
          if (on_attached) {
            on_attached();
          }
        }
      },
      std::move(stop));

  if (!response) {
    if (response.error() == Error::Cancelled) {
      log::info("Detached from container {}", container_id);
      return std::unexpected(RuntimeError::StreamClosed);
    }
    if (attached) {
      log::warn("Attach stream for {} ended abnormally: {}", container_id,
                response.error().message());
      return std::unexpected(RuntimeError::StreamClosed);
    }
    return std::unexpected(to_runtime_error(response.error()));
  }

  if (response->status == http::HttpStatus::NotFound) {
    return std::unexpected(RuntimeError::NotFound);
  }
  if (!http::is_success(response->status)) {
    log::error("Failed to attach to container {}: status={} {}", container_id,
               response->status, api_error_message(*response));
    return std::unexpected(RuntimeError::ApiError);
  }

  if (demux.pending() > 0) {
    log::warn("Attach stream for {} ended inside a frame ({} bytes dropped)",
              container_id, demux.pending());
  }
  log::debug("Attach stream for {} closed after {} frames", container_id,
             demux.frames());
  return {};
}

auto PodmanClient::ping() -> RuntimeResult<void> {
  auto response = http_.get("/_ping");
  if (!response) {
    return std::unexpected(to_runtime_error(response.error()));
  }
  if (response->status != http::HttpStatus::Ok) {
    return std::unexpected(RuntimeError::ApiError);
  }
  return {};
}

}  // namespace maestro::runtime
