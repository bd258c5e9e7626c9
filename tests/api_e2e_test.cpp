#include "maestro/api/api_server.hpp"
#include "maestro/orchestrator/orchestrator.hpp"
#include "fake_runtime_client.hpp"
#include "test_utils.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <filesystem>
#include <format>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>

#include <unistd.h>

#include "gtest/gtest.h"
#include "nlohmann/json.hpp"

using namespace maestro;
using namespace std::chrono_literals;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr auto kServerStartupTimeout = std::chrono::milliseconds(2000);
constexpr auto kPollInterval = std::chrono::milliseconds(50);

struct HttpResult {
  int status{-1};
  std::string headers;
  std::string body;
};

auto pick_unused_tcp_port() -> uint16_t {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) return 0;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

  if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(sock);
    return 0;
  }

  socklen_t len = sizeof(addr);
  if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    close(sock);
    return 0;
  }

  uint16_t port = ntohs(addr.sin_port);
  close(sock);
  return port;
}

auto http_call(uint16_t port, std::string_view method, std::string_view path,
               std::string_view content_type = {}, std::string_view body = {})
    -> HttpResult {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0)
    return {};

  struct timeval tv;
  tv.tv_sec = 5;
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

  if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(sock);
    return {};
  }

  std::string request = std::format("{} {} HTTP/1.1\r\n"
                                    "Host: localhost\r\n"
                                    "Connection: close\r\n",
                                    method, path);
  if (!content_type.empty()) {
    request += std::format("Content-Type: {}\r\n", content_type);
  }
  request += std::format("Content-Length: {}\r\n\r\n", body.size());
  request += body;
  send(sock, request.data(), request.size(), 0);

  std::string response;
  char buffer[4096];
  ssize_t n;
  while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
    response.append(buffer, n);
  }
  close(sock);

  HttpResult result;
  if (response.size() > 12) {
    auto space_pos = response.find(' ');
    if (space_pos != std::string::npos) {
      result.status = std::stoi(response.substr(space_pos + 1, 3));
    }
  }

  auto body_start = response.find("\r\n\r\n");
  if (body_start != std::string::npos) {
    result.headers = response.substr(0, body_start);
    result.body = response.substr(body_start + 4);
  }
  return result;
}

auto multipart_body(std::string_view boundary,
                    std::initializer_list<std::pair<std::string, std::string>>
                        files) -> std::string {
  std::string body;
  for (const auto& [name, content] : files) {
    body += std::format(
        "--{}\r\n"
        "Content-Disposition: form-data; name=\"files\"; filename=\"{}\"\r\n"
        "Content-Type: application/octet-stream\r\n\r\n{}\r\n",
        boundary, name, content);
  }
  body += std::format("--{}--\r\n", boundary);
  return body;
}

}  // namespace

class ApiE2ETest : public ::testing::Test {
protected:
  void SetUp() override {
    images_dir_ = dir_.path() / "images";
    fs::create_directories(images_dir_ / "demo");
    maestro::test::write_file(images_dir_ / "demo" / "Dockerfile",
                              "FROM alpine\n");

    client_ = std::make_shared<maestro::test::FakeRuntimeClient>();
    client_->next_build_id = "img-1";

    SystemConfig config;
    config.images_dir = images_dir_.string();
    config.reconcile_interval = std::chrono::hours(1);
    config.servers["h1"] = ServerInfo{
        .name = "h1",
        .host = "10.0.0.5",
        .username = "deploy",
        .identity_file = "/keys/id",
        .podman_socket = "/run/podman/podman.sock",
    };

    orchestrator_ = std::make_unique<Orchestrator>(
        std::move(config),
        [this](const ServerInfo&)
            -> Result<std::shared_ptr<runtime::RuntimeClient>> {
          return ok(std::shared_ptr<runtime::RuntimeClient>(client_));
        });
    ASSERT_TRUE(orchestrator_->start().has_value());

    port_ = pick_unused_tcp_port();
    server_ = std::make_unique<ApiServer>(*orchestrator_, port_);
    server_->start();
    ASSERT_TRUE(wait_for_server_ready());
  }

  void TearDown() override {
    if (server_) {
      server_->stop();
    }
    if (orchestrator_) {
      orchestrator_->stop();
    }
  }

  [[nodiscard]] auto wait_for_server_ready() -> bool {
    auto deadline = std::chrono::steady_clock::now() + kServerStartupTimeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (http_call(port_, "GET", "/health").status == 200) {
        return true;
      }
      std::this_thread::sleep_for(kPollInterval);
    }
    ADD_FAILURE() << "Server failed to start within timeout";
    return false;
  }

  auto get(std::string_view path) -> HttpResult {
    return http_call(port_, "GET", path);
  }
  auto post(std::string_view path) -> HttpResult {
    return http_call(port_, "POST", path);
  }
  auto del(std::string_view path) -> HttpResult {
    return http_call(port_, "DELETE", path);
  }

  maestro::test::TempDir dir_;
  fs::path images_dir_;
  std::shared_ptr<maestro::test::FakeRuntimeClient> client_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::unique_ptr<ApiServer> server_;
  uint16_t port_{0};
};

TEST_F(ApiE2ETest, HealthReportsRunning) {
  auto res = get("/health");
  ASSERT_EQ(res.status, 200);
  auto body = json::parse(res.body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(ApiE2ETest, ServersHideCredentials) {
  auto res = get("/servers");
  ASSERT_EQ(res.status, 200);

  auto body = json::parse(res.body);
  ASSERT_TRUE(body.is_array());
  ASSERT_EQ(body.size(), 1u);
  EXPECT_EQ(body[0]["name"], "h1");
  EXPECT_EQ(body[0]["local"], false);
  EXPECT_EQ(res.body.find("deploy"), std::string::npos);
  EXPECT_EQ(res.body.find("/keys/id"), std::string::npos);
}

TEST_F(ApiE2ETest, ListAndGetImages) {
  auto list = get("/containers");
  ASSERT_EQ(list.status, 200);
  auto images = json::parse(list.body);
  ASSERT_TRUE(images.contains("demo"));
  EXPECT_TRUE(images["demo"]["id"].is_null());

  auto one = get("/container/demo");
  ASSERT_EQ(one.status, 200);
  EXPECT_EQ(json::parse(one.body)["name"], "demo");

  EXPECT_EQ(get("/container/nope").status, 404);
}

TEST_F(ApiE2ETest, CreateAndDeleteImage) {
  auto created = post("/container/web");
  EXPECT_EQ(created.status, 201);
  EXPECT_TRUE(fs::is_directory(images_dir_ / "web"));

  EXPECT_EQ(post("/container/web").status, 409);

  auto deleted = del("/container/web");
  EXPECT_EQ(deleted.status, 200);
  EXPECT_FALSE(fs::exists(images_dir_ / "web"));

  EXPECT_EQ(del("/container/web").status, 404);
}

TEST_F(ApiE2ETest, BuildRunStop) {
  auto built = post("/container/demo/build?serverName=h1");
  ASSERT_EQ(built.status, 201);

  auto view = json::parse(get("/container/demo").body);
  EXPECT_EQ(view["id"], "img-1");
  EXPECT_EQ(view["connection"]["server"]["name"], "h1");

  auto run = post("/container/demo/run?serverName=h1");
  ASSERT_EQ(run.status, 200);
  ASSERT_TRUE(client_->attached.try_pop_for(5s).has_value());

  ASSERT_TRUE(maestro::test::wait_until([&] {
    auto j = json::parse(get("/container/demo").body);
    return j["status"] == "running";
  }));
  EXPECT_EQ(post("/container/demo/run?serverName=h1").status, 409);

  EXPECT_EQ(post("/container/demo/stop").status, 200);
  auto stopped = json::parse(get("/container/demo").body);
  EXPECT_TRUE(stopped["container"].is_null());
  EXPECT_EQ(post("/container/demo/stop").status, 200);
}

TEST_F(ApiE2ETest, RunOnUnknownServerIsNotFound) {
  EXPECT_EQ(post("/container/demo/run?serverName=nope").status, 404);
  EXPECT_EQ(post("/container/demo/build?serverName=nope").status, 404);
  EXPECT_EQ(post("/container/nope/run?serverName=h1").status, 404);
}

TEST_F(ApiE2ETest, FailedBuildIsServerError) {
  client_->build_error = runtime::RuntimeError::BuildFailed;
  EXPECT_EQ(post("/container/demo/build?serverName=h1").status, 500);
}

TEST_F(ApiE2ETest, UploadListDownloadDelete) {
  constexpr std::string_view kBoundary = "maestro-boundary";
  auto body = multipart_body(kBoundary, {{"main.sh", "echo hi\n"},
                                         {"README", "docs"}});

  auto uploaded = http_call(
      port_, "POST", "/container/demo/files",
      std::format("multipart/form-data; boundary={}", kBoundary), body);
  ASSERT_EQ(uploaded.status, 200);

  auto listed = get("/container/demo/files");
  ASSERT_EQ(listed.status, 200);
  EXPECT_EQ(json::parse(listed.body),
            json({"Dockerfile", "README", "main.sh"}));

  auto file = get("/container/demo/file?f_name=main.sh");
  ASSERT_EQ(file.status, 200);
  EXPECT_EQ(file.body, "echo hi\n");
  EXPECT_NE(file.headers.find("attachment"), std::string::npos);

  EXPECT_EQ(del("/container/demo/file?f_name=README").status, 200);
  EXPECT_EQ(del("/container/demo/file?f_name=README").status, 404);
  EXPECT_EQ(get("/container/demo/file?f_name=..%2Fsecret").status, 400);
}

TEST_F(ApiE2ETest, UploadWithoutFilesFieldIsBadRequest) {
  constexpr std::string_view kBoundary = "maestro-boundary";
  auto body = std::format(
      "--{0}\r\n"
      "Content-Disposition: form-data; name=\"note\"\r\n\r\n"
      "hello\r\n"
      "--{0}--\r\n",
      kBoundary);

  auto res = http_call(
      port_, "POST", "/container/demo/files",
      std::format("multipart/form-data; boundary={}", kBoundary), body);
  EXPECT_EQ(res.status, 400);
}
