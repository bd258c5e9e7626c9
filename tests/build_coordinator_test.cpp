#include "maestro/orchestrator/build_coordinator.hpp"
#include "fake_runtime_client.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace maestro::test {

class BuildCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::filesystem::create_directories(dir_.path() / "demo");
    write_file(dir_.path() / "demo" / "Dockerfile", "FROM alpine\n");
    image_ = std::make_shared<Image>("demo", dir_.path() / "demo");

    h1_client_ = std::make_shared<FakeRuntimeClient>();
    h1_client_->prefix = "h1";
    h2_client_ = std::make_shared<FakeRuntimeClient>();
    h2_client_->prefix = "h2";
    h1_ = std::make_shared<Connection>(ServerInfo{.name = "h1"}, h1_client_);
    h2_ = std::make_shared<Connection>(ServerInfo{.name = "h2"}, h2_client_);
  }

  static void expect_build_invariant(const Image& image) {
    auto view = image.view();
    EXPECT_EQ(view.build_id.has_value(), view.server_name.has_value());
  }

  TempDir dir_;
  std::shared_ptr<Image> image_;
  std::shared_ptr<FakeRuntimeClient> h1_client_;
  std::shared_ptr<FakeRuntimeClient> h2_client_;
  std::shared_ptr<Connection> h1_;
  std::shared_ptr<Connection> h2_;
};

TEST_F(BuildCoordinatorTest, BuildSetsIdAndOwner) {
  h1_client_->next_build_id = "img-1";

  ASSERT_TRUE(BuildCoordinator::build(*image_, h1_).has_value());

  auto view = image_->view();
  EXPECT_EQ(view.build_id, "img-1");
  EXPECT_EQ(view.server_name, "h1");
  EXPECT_EQ(image_->connection(), h1_);
  EXPECT_EQ(h1_client_->builds.load(), 1);
  EXPECT_EQ(h1_client_->last_context, image_->files_dir());
  EXPECT_FALSE(view.container.has_value());
}

TEST_F(BuildCoordinatorTest, FirstBuildFailureLeavesImageUnbuilt) {
  h1_client_->build_error = runtime::RuntimeError::BuildFailed;

  auto result = BuildCoordinator::build(*image_, h1_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::BuildFailed);

  EXPECT_FALSE(image_->build_id().has_value());
  EXPECT_EQ(image_->connection(), nullptr);
  expect_build_invariant(*image_);
}

TEST_F(BuildCoordinatorTest, FailedRebuildKeepsPreviousBuild) {
  h1_client_->next_build_id = "img-1";
  ASSERT_TRUE(BuildCoordinator::build(*image_, h1_).has_value());

  h2_client_->build_error = runtime::RuntimeError::ConnectionFailed;
  auto result = BuildCoordinator::build(*image_, h2_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::BuildFailed);

  EXPECT_EQ(image_->build_id(), "img-1");
  EXPECT_EQ(image_->connection(), h1_);
  expect_build_invariant(*image_);

  // The old artifact was removed before the new build was attempted.
  ASSERT_EQ(h1_client_->removed_images.size(), 1u);
  EXPECT_EQ(h1_client_->removed_images[0], "img-1");
}

TEST_F(BuildCoordinatorTest, RebuildElsewhereCleansUpOldHost) {
  h1_client_->next_build_id = "img-1";
  ASSERT_TRUE(BuildCoordinator::build(*image_, h1_).has_value());

  auto ctr = h1_client_->create_container("img-1", "container-x");
  ASSERT_TRUE(ctr.has_value());
  {
    std::unique_lock lock(image_->mu());
    image_->container() = Container{.id = *ctr, .name = "container-x"};
  }

  ASSERT_TRUE(BuildCoordinator::build(*image_, h2_).has_value());

  EXPECT_EQ(h1_client_->removed_containers,
            (std::vector<std::string>{*ctr}));
  EXPECT_EQ(h1_client_->removed_images, (std::vector<std::string>{"img-1"}));
  EXPECT_FALSE(h1_client_->has_container(*ctr));
  EXPECT_EQ(h2_client_->container_removals.load(), 0);

  auto view = image_->view();
  EXPECT_EQ(view.build_id, "h2-build-1");
  EXPECT_EQ(view.server_name, "h2");
  EXPECT_FALSE(view.container.has_value());
}

TEST_F(BuildCoordinatorTest, MissingRemoteContainerIsIgnored) {
  ASSERT_TRUE(BuildCoordinator::build(*image_, h1_).has_value());
  {
    std::unique_lock lock(image_->mu());
    image_->container() = Container{.id = "gone", .name = "container-x"};
  }

  ASSERT_TRUE(BuildCoordinator::build(*image_, h1_).has_value());
  EXPECT_EQ(h1_client_->container_removals.load(), 1);
  EXPECT_FALSE(image_->view().container.has_value());
}

TEST_F(BuildCoordinatorTest, ConcurrentBuildsSerialize) {
  constexpr int kThreads = 4;
  Barrier barrier(kThreads);
  std::atomic<int> succeeded{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      barrier.arrive_and_wait();
      auto& target = i % 2 == 0 ? h1_ : h2_;
      if (BuildCoordinator::build(*image_, target)) {
        succeeded.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(succeeded.load(), kThreads);
  EXPECT_EQ(h1_client_->builds.load() + h2_client_->builds.load(), kThreads);
  // Every build but the last was cleaned up by its successor.
  EXPECT_EQ(h1_client_->image_removals.load() +
                h2_client_->image_removals.load(),
            kThreads - 1);
  expect_build_invariant(*image_);
}

}  // namespace maestro::test
