#include "events/events.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace events;
namespace fs = std::filesystem;

class EventsTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string tmpl = (fs::temp_directory_path() / "treewatch-events-XXXXXX").string();
    ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
    root = tmpl;
  }

  void TearDown() override { fs::remove_all(root); }

  void touch(const fs::path &path) { std::ofstream(path) << "x"; }

  fs::path root;
};

TEST(EventKindTest, Names) {
  EXPECT_EQ(kind_to_string({EventType::Created, FileType::File}), "file_created");
  EXPECT_EQ(kind_to_string({EventType::Moved, FileType::Directory}), "dir_moved");

  auto kind = kind_from_string("dir_deleted");
  ASSERT_TRUE(kind.has_value());
  EXPECT_EQ(kind->eventType, EventType::Deleted);
  EXPECT_EQ(kind->fileType, FileType::Directory);

  EXPECT_FALSE(kind_from_string("file_opened").has_value());
  EXPECT_FALSE(kind_from_string("").has_value());
}

TEST(EventKindTest, Factories) {
  auto event = moved("/a/x", "/a/y", FileType::File);
  EXPECT_EQ(event.eventType, EventType::Moved);
  EXPECT_EQ(event.src_path, "/a/x");
  EXPECT_EQ(event.dest_path, "/a/y");
  EXPECT_FALSE(event.is_synthetic);
  EXPECT_FALSE(event.is_directory());

  EXPECT_EQ(to_string(event), "file_moved: /a/x -> /a/y");
  EXPECT_EQ(to_string(created("/d", FileType::Directory)), "dir_created: /d");
  EXPECT_EQ(created("/d", FileType::Directory), created("/d", FileType::Directory));
  EXPECT_NE(created("/d", FileType::Directory), created("/d", FileType::File));
}

TEST_F(EventsTest, SubCreatedEventsParentsFirst) {
  fs::create_directories(root / "a" / "b");
  touch(root / "a" / "f1");
  touch(root / "a" / "b" / "f2");
  touch(root / "top");

  auto generated = generate_sub_created_events(root.string());

  std::vector<FileSystemEvent> expected{
      created((root / "a").string(), FileType::Directory),
      created((root / "top").string(), FileType::File),
      created((root / "a" / "b").string(), FileType::Directory),
      created((root / "a" / "f1").string(), FileType::File),
      created((root / "a" / "b" / "f2").string(), FileType::File),
  };
  for (auto &event : expected)
    event.is_synthetic = true;

  EXPECT_EQ(generated, expected);
}

TEST_F(EventsTest, SubCreatedEventsOfEmptyOrMissingDir) {
  EXPECT_TRUE(generate_sub_created_events(root.string()).empty());
  EXPECT_TRUE(generate_sub_created_events((root / "missing").string()).empty());
}

TEST_F(EventsTest, SubMovedEventsMapBackToSource) {
  fs::create_directories(root / "new" / "sub");
  touch(root / "new" / "sub" / "f");

  auto generated = generate_sub_moved_events((root / "old").string(), (root / "new").string());

  ASSERT_EQ(generated.size(), 2u);
  EXPECT_EQ(generated[0].eventType, EventType::Moved);
  EXPECT_TRUE(generated[0].is_directory());
  EXPECT_EQ(generated[0].src_path, (root / "old" / "sub").string());
  EXPECT_EQ(generated[0].dest_path, (root / "new" / "sub").string());
  EXPECT_TRUE(generated[0].is_synthetic);

  EXPECT_FALSE(generated[1].is_directory());
  EXPECT_EQ(generated[1].src_path, (root / "old" / "sub" / "f").string());
  EXPECT_EQ(generated[1].dest_path, (root / "new" / "sub" / "f").string());
}
