#include "maestro/api/api_server.hpp"

#include "maestro/api/json_view.hpp"
#include "maestro/orchestrator/orchestrator.hpp"
#include "maestro/util/log.hpp"
#include "maestro/util/time.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <format>
#include <thread>

#include <crow.h>

namespace maestro {

using json = nlohmann::json;

namespace {

auto json_response(const json& j, int status = 200) -> crow::response {
  crow::response resp(status, j.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

auto message_response(std::string message, int status = 200)
    -> crow::response {
  return json_response({{"message", std::move(message)}}, status);
}

auto error_response(const std::error_code& ec, std::string message)
    -> crow::response {
  return json_response({{"error", std::move(message)}}, api::status_for(ec));
}

auto error_response(int status, std::string message) -> crow::response {
  return json_response({{"error", std::move(message)}}, status);
}

auto query(const crow::request& req, const char* key) -> std::string {
  const char* value = req.url_params.get(key);
  return value ? std::string(value) : std::string();
}

// Collects every part named `files` from a multipart/form-data body.
auto uploaded_files(const crow::request& req) -> std::vector<UploadedFile> {
  std::vector<UploadedFile> files;
  crow::multipart::message msg(req);
  for (const auto& part : msg.parts) {
    const auto& disposition =
        crow::multipart::get_header_object(part.headers, "Content-Disposition");
    auto name = disposition.params.find("name");
    auto filename = disposition.params.find("filename");
    if (name == disposition.params.end() || name->second != "files" ||
        filename == disposition.params.end()) {
      continue;
    }
    files.push_back(UploadedFile{filename->second, part.body});
  }
  return files;
}

}  // namespace

struct ApiServer::Impl {
  Orchestrator& orchestrator;
  uint16_t port;
  std::string host;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};

  Impl(Orchestrator& o, uint16_t p, const std::string& h)
      : orchestrator(o), port(p), host(h) {}

  auto setup_routes() -> void;
  auto setup_image_routes() -> void;
  auto setup_file_routes() -> void;
  auto setup_run_routes() -> void;
};

ApiServer::ApiServer(Orchestrator& orchestrator, uint16_t port,
                     const std::string& host)
    : impl_(std::make_unique<Impl>(orchestrator, port, host)) {}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);
  impl_->setup_routes();

  impl_->crow_app->signal_clear();

  impl_->server_thread = std::thread([this]() {
    log::info("API server starting on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .multithreaded()
        .run();
  });
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping API server...");

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->crow_app.reset();
  log::info("API server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/health")
  ([this]() {
    json j = {{"status", orchestrator.is_running() ? "healthy" : "stopped"},
              {"timestamp", format_iso8601(Clock::now())}};
    return json_response(j);
  });

  CROW_ROUTE((*crow_app), "/servers")
  ([this]() {
    json result = json::array();
    for (const auto& server : orchestrator.list_servers()) {
      result.push_back(api::to_json(server));
    }
    return json_response(result);
  });

  setup_image_routes();
  setup_file_routes();
  setup_run_routes();
}

auto ApiServer::Impl::setup_image_routes() -> void {
  CROW_ROUTE((*crow_app), "/containers")
  ([this]() {
    json result = json::object();
    for (const auto& image : orchestrator.list_images()) {
      result[image.name] = api::to_json(image);
    }
    return json_response(result);
  });

  CROW_ROUTE((*crow_app), "/container/<string>")
  ([this](const std::string& name) {
    auto image = orchestrator.get_image(name);
    if (!image) {
      return error_response(image.error(),
                            std::format("Container {} not found", name));
    }
    return json_response(api::to_json(*image));
  });

  CROW_ROUTE((*crow_app), "/container/<string>")
      .methods(crow::HTTPMethod::POST)([this](const std::string& name) {
        auto created = orchestrator.create_image(name);
        if (!created) {
          if (created.error() == Error::AlreadyExists) {
            return error_response(
                created.error(), std::format("Container {} already exists", name));
          }
          if (created.error() == Error::InvalidArgument) {
            return error_response(
                created.error(), std::format("Invalid container name: {}", name));
          }
          return error_response(created.error(),
                                std::format("Failed to create container: {}",
                                            created.error().message()));
        }
        return message_response(std::format("New container {} created", name),
                                201);
      });

  CROW_ROUTE((*crow_app), "/container/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const std::string& name) {
        auto deleted = orchestrator.delete_image(name);
        if (!deleted) {
          if (deleted.error() == Error::NotFound) {
            return error_response(deleted.error(),
                                  std::format("Container {} not found", name));
          }
          return error_response(deleted.error(),
                                std::format("Failed to delete container: {}",
                                            deleted.error().message()));
        }
        return message_response(
            std::format("Container {} deleted successfully", name));
      });
}

auto ApiServer::Impl::setup_file_routes() -> void {
  CROW_ROUTE((*crow_app), "/container/<string>/files")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req,
                                              const std::string& name) {
        if (!orchestrator.get_image(name)) {
          return error_response(404, std::format("Container {} not found", name));
        }

        auto files = uploaded_files(req);
        if (files.empty()) {
          return error_response(400, "No file uploaded");
        }

        auto saved = orchestrator.upload_files(name, files);
        if (!saved) {
          if (saved.error() == Error::InvalidArgument) {
            return error_response(saved.error(),
                                  "Invalid file path for uploaded file");
          }
          return error_response(saved.error(),
                                std::format("Failed to save files: {}",
                                            saved.error().message()));
        }
        return message_response(std::format("Files uploaded for image {}", name));
      });

  CROW_ROUTE((*crow_app), "/container/<string>/files")
  ([this](const std::string& name) {
    auto files = orchestrator.list_files(name);
    if (!files) {
      if (files.error() == Error::NotFound) {
        return error_response(files.error(),
                              std::format("Image {} not found", name));
      }
      return error_response(500,
                            std::format("Failed to read files: {}", name));
    }
    return json_response(json(*files));
  });

  CROW_ROUTE((*crow_app), "/container/<string>/file")
  ([this](const crow::request& req, const std::string& name) {
    auto file_name = query(req, "f_name");
    auto content = orchestrator.read_file(name, file_name);
    if (!content) {
      if (content.error() == Error::InvalidArgument) {
        return error_response(
            content.error(),
            std::format("Invalid file path for file: {}", file_name));
      }
      return error_response(
          content.error(),
          std::format("File {} not found for image {}", file_name, name));
    }

    crow::response resp(200, std::move(*content));
    resp.set_header("Content-Type", "application/octet-stream");
    resp.set_header("Content-Disposition",
                    std::format("attachment; filename=\"{}\"", file_name));
    return resp;
  });

  CROW_ROUTE((*crow_app), "/container/<string>/file")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request& req,
                                                const std::string& name) {
        auto file_name = query(req, "f_name");
        auto removed = orchestrator.delete_file(name, file_name);
        if (!removed) {
          if (removed.error() == Error::InvalidArgument) {
            return error_response(
                removed.error(),
                std::format("Invalid file path for file: {}", file_name));
          }
          if (removed.error() == Error::NotFound) {
            return error_response(
                removed.error(),
                std::format("File {} does not exist for image {}", file_name,
                            name));
          }
          return error_response(removed.error(),
                                std::format("Failed to delete file: {}",
                                            removed.error().message()));
        }
        return message_response(
            std::format("File {} deleted for image {}", file_name, name));
      });
}

auto ApiServer::Impl::setup_run_routes() -> void {
  CROW_ROUTE((*crow_app), "/container/<string>/run")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req,
                                              const std::string& name) {
        auto server = query(req, "serverName");
        if (!orchestrator.get_image(name)) {
          return error_response(404, std::format("Image {} not found", name));
        }

        auto queued = orchestrator.run_image(name, server);
        if (!queued) {
          if (queued.error() == Error::Conflict) {
            return error_response(
                queued.error(),
                std::format("A container for image {} is already running or "
                            "queued. Please stop the existing container before "
                            "starting a new one.",
                            name));
          }
          if (queued.error() == Error::NotFound) {
            return error_response(queued.error(),
                                  std::format("Server {} not found", server));
          }
          return error_response(
              queued.error(),
              std::format("Failed to run image {} on server {}: {}", name,
                          server, queued.error().message()));
        }
        return message_response(std::format(
            "Container for image {} started successfully on server {}", name,
            server));
      });

  CROW_ROUTE((*crow_app), "/container/<string>/build")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req,
                                              const std::string& name) {
        auto server = query(req, "serverName");
        if (!orchestrator.get_image(name)) {
          return error_response(404, std::format("Image {} not found", name));
        }

        auto built = orchestrator.build_image(name, server);
        if (!built) {
          if (built.error() == Error::NotFound) {
            return error_response(built.error(),
                                  std::format("Server {} not found", server));
          }
          return error_response(
              built.error(),
              std::format("Failed to build image {} on server {}: {}", name,
                          server, built.error().message()));
        }
        return message_response(
            std::format("Image {} built successfully on server {}", name,
                        server),
            201);
      });

  CROW_ROUTE((*crow_app), "/container/<string>/stop")
      .methods(crow::HTTPMethod::POST)([this](const std::string& name) {
        auto stopped = orchestrator.stop_image(name);
        if (!stopped) {
          if (stopped.error() == Error::NotFound) {
            return error_response(stopped.error(),
                                  std::format("Image {} not found", name));
          }
          return error_response(stopped.error(),
                                std::format("Failed to stop container: {}",
                                            stopped.error().message()));
        }
        return message_response(
            std::format("Container for image {} stopped successfully", name));
      });
}

}  // namespace maestro
