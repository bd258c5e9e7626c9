#include "maestro/util/tar.hpp"
#include "test_utils.hpp"

#include <cstring>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace maestro::tar::test {

namespace {

struct Member {
  std::string name;
  char type;
  std::string content;
};

auto parse_octal(const std::uint8_t* field, std::size_t width) -> std::size_t {
  std::size_t value = 0;
  for (std::size_t i = 0; i < width && field[i] >= '0' && field[i] <= '7'; ++i) {
    value = value * 8 + (field[i] - '0');
  }
  return value;
}

// Minimal ustar reader, enough to check what archive_directory wrote.
auto read_members(const std::vector<std::uint8_t>& archive)
    -> std::vector<Member> {
  std::vector<Member> members;
  std::size_t pos = 0;
  while (pos + kBlockSize <= archive.size()) {
    const auto* header = archive.data() + pos;
    if (header[0] == 0) {
      break;
    }
    std::string base(reinterpret_cast<const char*>(header),
                     strnlen(reinterpret_cast<const char*>(header), 100));
    std::string prefix(reinterpret_cast<const char*>(header + 345),
                       strnlen(reinterpret_cast<const char*>(header + 345), 155));
    auto size = parse_octal(header + 124, 12);
    char type = static_cast<char>(header[156]);
    pos += kBlockSize;

    Member m{prefix.empty() ? base : prefix + "/" + base, type, {}};
    m.content.assign(reinterpret_cast<const char*>(archive.data() + pos), size);
    pos += (size + kBlockSize - 1) / kBlockSize * kBlockSize;
    members.push_back(std::move(m));
  }
  return members;
}

}  // namespace

class TarTest : public ::testing::Test {
protected:
  maestro::test::TempDir dir_;
};

TEST_F(TarTest, ArchivesFilesAndDirectoriesInOrder) {
  maestro::test::write_file(dir_.path() / "Dockerfile", "FROM alpine\n");
  maestro::test::write_file(dir_.path() / "app" / "main.sh", "echo hi\n");

  auto archive = archive_directory(dir_.path());
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(archive->size() % kBlockSize, 0u);

  auto members = read_members(*archive);
  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[0].name, "Dockerfile");
  EXPECT_EQ(members[0].type, '0');
  EXPECT_EQ(members[0].content, "FROM alpine\n");
  EXPECT_EQ(members[1].name, "app/");
  EXPECT_EQ(members[1].type, '5');
  EXPECT_EQ(members[2].name, "app/main.sh");
  EXPECT_EQ(members[2].content, "echo hi\n");
}

TEST_F(TarTest, ExcludedDirectoryIsSkippedWithItsContents) {
  maestro::test::write_file(dir_.path() / "Dockerfile", "FROM alpine\n");
  maestro::test::write_file(dir_.path() / ".maestro" / "logs" / "a.log", "x");

  auto archive = archive_directory(
      dir_.path(), [](const std::filesystem::path& relative) {
        return relative == std::filesystem::path(".maestro");
      });
  ASSERT_TRUE(archive.has_value());

  auto members = read_members(*archive);
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].name, "Dockerfile");
}

TEST_F(TarTest, EndsWithTwoZeroBlocks) {
  maestro::test::write_file(dir_.path() / "f", std::string(600, 'a'));

  auto archive = archive_directory(dir_.path());
  ASSERT_TRUE(archive.has_value());
  // header + two data blocks + two end blocks
  ASSERT_EQ(archive->size(), 5 * kBlockSize);
  for (std::size_t i = 3 * kBlockSize; i < archive->size(); ++i) {
    ASSERT_EQ((*archive)[i], 0) << "at " << i;
  }
}

TEST_F(TarTest, HeaderChecksumIsValid) {
  maestro::test::write_file(dir_.path() / "Dockerfile", "FROM alpine\n");

  auto archive = archive_directory(dir_.path());
  ASSERT_TRUE(archive.has_value());

  std::vector<std::uint8_t> header(archive->begin(),
                                   archive->begin() + kBlockSize);
  auto stored = parse_octal(header.data() + 148, 8);
  std::memset(header.data() + 148, ' ', 8);
  std::size_t sum = 0;
  for (auto b : header) {
    sum += b;
  }
  EXPECT_EQ(stored, sum);
}

TEST_F(TarTest, LongPathsUsePrefixField) {
  std::string deep = std::string(60, 'd') + "/" + std::string(60, 'e');
  maestro::test::write_file(dir_.path() / deep / "file.txt", "x");

  auto archive = archive_directory(dir_.path());
  ASSERT_TRUE(archive.has_value());

  auto members = read_members(*archive);
  ASSERT_FALSE(members.empty());
  EXPECT_EQ(members.back().name, deep + "/file.txt");
}

TEST_F(TarTest, MissingRootFails) {
  auto archive = archive_directory(dir_.path() / "missing");
  ASSERT_FALSE(archive.has_value());
  EXPECT_EQ(archive.error(), Error::FileNotFound);
}

}  // namespace maestro::tar::test
