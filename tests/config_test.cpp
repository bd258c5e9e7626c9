#include "maestro/config/config.hpp"
#include "test_utils.hpp"

#include <fstream>

#include "gtest/gtest.h"

using namespace maestro;

TEST(ConfigTest, ServerInfoLocality) {
  ServerInfo server;
  server.name = "local";
  server.podman_socket = "/run/podman/podman.sock";
  EXPECT_TRUE(server.is_local());

  server.host = "10.0.0.5";
  EXPECT_FALSE(server.is_local());
}

TEST(ConfigTest, SystemConfigDefaults) {
  SystemConfig config;

  EXPECT_TRUE(config.images_dir.empty());
  EXPECT_EQ(config.reconcile_interval, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.log.level, "info");
  EXPECT_TRUE(config.log.file.empty());
  EXPECT_TRUE(config.api.enabled);
  EXPECT_EQ(config.api.port, 3003);
  EXPECT_EQ(config.api.host, "127.0.0.1");
  EXPECT_EQ(config.runtime.api_version, "v1.41");
  EXPECT_EQ(config.runtime.read_timeout, std::chrono::milliseconds(0));
  EXPECT_TRUE(config.servers.empty());
}

TEST(ConfigTest, LoadFromYamlString) {
  std::string yaml = R"(
images_dir: /srv/images
reconcile_interval_ms: 500
log:
  level: debug
api:
  port: 8080
  host: 0.0.0.0
runtime:
  api_version: v1.40
  connect_timeout_ms: 2500
servers:
  h1:
    host: 10.0.0.5
    username: deploy
    identityFile: /home/deploy/.ssh/id_ed25519
    podmanSocket: /run/user/1000/podman/podman.sock
    remoteDir: /home/deploy/maestro
  local:
    podmanSocket: /run/podman/podman.sock
)";

  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value());

  const auto& config = *result;
  EXPECT_EQ(config.images_dir, "/srv/images");
  EXPECT_EQ(config.reconcile_interval, std::chrono::milliseconds(500));
  EXPECT_EQ(config.log.level, "debug");
  EXPECT_EQ(config.api.port, 8080);
  EXPECT_EQ(config.api.host, "0.0.0.0");
  EXPECT_EQ(config.runtime.api_version, "v1.40");
  EXPECT_EQ(config.runtime.connect_timeout, std::chrono::milliseconds(2500));

  ASSERT_EQ(config.servers.size(), 2u);
  const auto& h1 = config.servers.at("h1");
  EXPECT_EQ(h1.name, "h1");
  EXPECT_EQ(h1.host, "10.0.0.5");
  EXPECT_EQ(h1.username, "deploy");
  EXPECT_EQ(h1.identity_file, "/home/deploy/.ssh/id_ed25519");
  EXPECT_EQ(h1.podman_socket, "/run/user/1000/podman/podman.sock");
  EXPECT_EQ(h1.remote_dir, "/home/deploy/maestro");
  EXPECT_FALSE(h1.is_local());

  const auto& local = config.servers.at("local");
  EXPECT_EQ(local.name, "local");
  EXPECT_TRUE(local.is_local());
}

TEST(ConfigTest, LoadFromYamlFile) {
  test::TempDir dir;
  auto path = dir.path() / "maestro.yaml";
  test::write_file(path, R"(
images_dir: /tmp/images
servers:
  local:
    podmanSocket: /run/podman/podman.sock
)");

  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->images_dir, "/tmp/images");
  EXPECT_EQ(result->servers.size(), 1u);
}

TEST(ConfigTest, LoadFromYamlMissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/path/config.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::FileNotFound);
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto result = ConfigLoader::load_from_string("images_dir: [unterminated");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::ParseError);
}

TEST(ConfigTest, ImagesDirIsRequired) {
  auto result = ConfigLoader::load_from_string(R"(
servers:
  local:
    podmanSocket: /run/podman/podman.sock
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, ServerWithoutSocketIsRejected) {
  auto result = ConfigLoader::load_from_string(R"(
images_dir: /srv/images
servers:
  h1:
    host: 10.0.0.5
    username: deploy
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, RemoteServerNeedsUsername) {
  auto result = ConfigLoader::load_from_string(R"(
images_dir: /srv/images
servers:
  h1:
    host: 10.0.0.5
    podmanSocket: /run/podman/podman.sock
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, NonPositiveReconcileIntervalIsRejected) {
  SystemConfig config;
  config.images_dir = "/srv/images";
  config.reconcile_interval = std::chrono::milliseconds(0);

  auto result = ConfigLoader::validate(config);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::InvalidArgument);
}

TEST(ConfigTest, NoServersIsValid) {
  auto result = ConfigLoader::load_from_string("images_dir: /srv/images\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->servers.empty());
}
