#include "observer/observer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace observer;
using namespace std::chrono_literals;
using events::EventType;
using events::FileSystemEvent;
using events::FileType;
namespace fs = std::filesystem;

namespace {

class CollectingHandler : public FileSystemEventHandler {
public:
  void onAnyEvent(const FileSystemEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    cv_.notify_all();
  }

  void onCreated(const FileSystemEvent &) override { ++created; }
  void onDeleted(const FileSystemEvent &) override { ++deleted; }
  void onModified(const FileSystemEvent &) override { ++modified; }
  void onMoved(const FileSystemEvent &) override { ++moved; }

  bool wait_for(const FileSystemEvent &expected, std::chrono::milliseconds timeout = 5000ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
      return std::find(events_.begin(), events_.end(), expected) != events_.end();
    });
  }

  std::vector<FileSystemEvent> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::atomic<int> created{0};
  std::atomic<int> deleted{0};
  std::atomic<int> modified{0};
  std::atomic<int> moved{0};

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<FileSystemEvent> events_;
};

class ThrowingHandler : public FileSystemEventHandler {
public:
  void onAnyEvent(const FileSystemEvent &) override { throw std::runtime_error("handler failure"); }
};

FileSystemEvent synthetic(FileSystemEvent event) {
  event.is_synthetic = true;
  return event;
}

} // namespace

TEST(FileSystemEventHandlerTest, DispatchCallsTypedHook) {
  CollectingHandler handler;
  handler.dispatch(events::created("/w/a", FileType::File));
  handler.dispatch(events::moved("/w/a", "/w/b", FileType::File));
  handler.dispatch(events::modified("/w", FileType::Directory));
  handler.dispatch(events::deleted("/w/b", FileType::File));

  EXPECT_EQ(handler.events().size(), 4u);
  EXPECT_EQ(handler.created.load(), 1);
  EXPECT_EQ(handler.moved.load(), 1);
  EXPECT_EQ(handler.modified.load(), 1);
  EXPECT_EQ(handler.deleted.load(), 1);
}

TEST(LoggingEventHandlerTest, LogsEveryKind) {
  LoggingEventHandler handler(MyLogger::create("events"));
  EXPECT_NO_THROW(handler.dispatch(events::created("/w/a", FileType::File)));
  EXPECT_NO_THROW(handler.dispatch(events::moved("/w/a", "/w/b", FileType::File)));
  EXPECT_NO_THROW(handler.dispatch(events::modified("/w", FileType::Directory)));
  EXPECT_NO_THROW(handler.dispatch(events::deleted("/w/b", FileType::File)));
}

class ObserverTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string tmpl = (fs::temp_directory_path() / "treewatch-observer-XXXXXX").string();
    ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
    base = tmpl;
    watched = base / "watched";
    outside = base / "outside";
    fs::create_directories(watched);
    fs::create_directories(outside);
  }

  void TearDown() override {
    observer.reset();
    fs::remove_all(base);
  }

  ObservedWatch schedule(std::shared_ptr<FileSystemEventHandler> handler, bool recursive = true) {
    emitter::WatchOptions options;
    options.path = watched.string();
    options.recursive = recursive;
    if (!observer)
      observer = std::make_unique<Observer>(MyLogger::create("observer"));
    return observer->schedule(std::move(handler), options);
  }

  // Give the watch thread time to install its inotify watches.
  void start() {
    observer->start();
    std::this_thread::sleep_for(200ms);
  }

  std::string at(const fs::path &relative) { return (watched / relative).string(); }

  fs::path base;
  fs::path watched;
  fs::path outside;
  std::unique_ptr<Observer> observer;
};

TEST_F(ObserverTest, ReportsCreateModifyDelete) {
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  std::ofstream(watched / "a.txt") << "hello";
  EXPECT_TRUE(handler->wait_for(events::created(at("a.txt"), FileType::File)));
  EXPECT_TRUE(handler->wait_for(events::modified(watched.string(), FileType::Directory)));

  {
    std::ofstream out(watched / "a.txt", std::ios::app);
    out << " again";
  }
  EXPECT_TRUE(handler->wait_for(events::modified(at("a.txt"), FileType::File)));

  fs::remove(watched / "a.txt");
  EXPECT_TRUE(handler->wait_for(events::deleted(at("a.txt"), FileType::File)));
}

TEST_F(ObserverTest, RenameInsideTreeIsMove) {
  std::ofstream(watched / "old.txt") << "x";
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  fs::rename(watched / "old.txt", watched / "new.txt");

  EXPECT_TRUE(handler->wait_for(events::moved(at("old.txt"), at("new.txt"), FileType::File)));
  for (const auto &event : handler->events()) {
    EXPECT_NE(event, events::created(at("new.txt"), FileType::File));
    EXPECT_NE(event, events::deleted(at("old.txt"), FileType::File));
  }
}

TEST_F(ObserverTest, DirectoryRenameFollowsChildren) {
  fs::create_directories(watched / "d1");
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  fs::rename(watched / "d1", watched / "d2");
  EXPECT_TRUE(handler->wait_for(events::moved(at("d1"), at("d2"), FileType::Directory)));

  // The watch of the renamed directory reports under its new name.
  std::ofstream(watched / "d2" / "f") << "x";
  EXPECT_TRUE(handler->wait_for(events::created(at("d2/f"), FileType::File)));
}

TEST_F(ObserverTest, NewDirectoryContentsAreReported) {
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  fs::create_directories(watched / "sub" / "deeper");
  std::ofstream(watched / "sub" / "deeper" / "f") << "x";

  EXPECT_TRUE(handler->wait_for(events::created(at("sub"), FileType::Directory)));
  EXPECT_TRUE(handler->wait_for(events::created(at("sub/deeper/f"), FileType::File)));
}

TEST_F(ObserverTest, MoveOutIsDelete) {
  std::ofstream(watched / "leaving") << "x";
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  fs::rename(watched / "leaving", outside / "leaving");

  EXPECT_TRUE(handler->wait_for(events::deleted(at("leaving"), FileType::File)));
}

TEST_F(ObserverTest, MoveInIsCreateWithChildren) {
  fs::create_directories(outside / "pkg" / "sub");
  std::ofstream(outside / "pkg" / "sub" / "f") << "x";
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  start();

  fs::rename(outside / "pkg", watched / "pkg");

  EXPECT_TRUE(handler->wait_for(events::created(at("pkg"), FileType::Directory)));
  EXPECT_TRUE(handler->wait_for(synthetic(events::created(at("pkg/sub"), FileType::Directory))));
  EXPECT_TRUE(handler->wait_for(synthetic(events::created(at("pkg/sub/f"), FileType::File))));
}

TEST_F(ObserverTest, NonRecursiveIgnoresGrandchildren) {
  fs::create_directories(watched / "sub");
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler, false);
  start();

  std::ofstream(watched / "sub" / "hidden") << "x";
  std::ofstream(watched / "top") << "x";

  EXPECT_TRUE(handler->wait_for(events::created(at("top"), FileType::File)));
  for (const auto &event : handler->events())
    EXPECT_NE(event.src_path, at("sub/hidden"));
}

TEST_F(ObserverTest, RootRemovalEndsWatch) {
  auto handler = std::make_shared<CollectingHandler>();
  auto watch = schedule(handler);
  start();
  EXPECT_TRUE(observer->is_alive(watch));

  fs::remove_all(watched);

  EXPECT_TRUE(handler->wait_for(events::deleted(watched.string(), FileType::Directory)));
  for (int i = 0; i < 500 && observer->is_alive(watch); ++i)
    std::this_thread::sleep_for(10ms);
  EXPECT_FALSE(observer->is_alive(watch));
}

TEST_F(ObserverTest, FailingHandlerDoesNotStopDelivery) {
  auto handler = std::make_shared<CollectingHandler>();
  auto watch = schedule(std::make_shared<ThrowingHandler>());
  observer->add_handler_for_watch(handler, watch);
  start();

  std::ofstream(watched / "a") << "x";
  EXPECT_TRUE(handler->wait_for(events::created(at("a"), FileType::File)));
}

TEST_F(ObserverTest, EqualOptionsShareOneWatch) {
  auto first = std::make_shared<CollectingHandler>();
  auto second = std::make_shared<CollectingHandler>();
  auto watch1 = schedule(first);
  auto watch2 = schedule(second);

  EXPECT_EQ(watch1, watch2);
  EXPECT_EQ(observer->watches().size(), 1u);
  start();

  std::ofstream(watched / "shared") << "x";
  EXPECT_TRUE(first->wait_for(events::created(at("shared"), FileType::File)));
  EXPECT_TRUE(second->wait_for(events::created(at("shared"), FileType::File)));

  observer->remove_handler_for_watch(second, watch2);
  observer->unschedule(watch1);
  EXPECT_TRUE(observer->watches().empty());
  EXPECT_FALSE(observer->is_alive(watch1));
}

TEST_F(ObserverTest, UnscheduleAll) {
  auto handler = std::make_shared<CollectingHandler>();
  schedule(handler);
  schedule(handler, false);
  EXPECT_EQ(observer->watches().size(), 2u);
  start();

  observer->unschedule_all();
  EXPECT_TRUE(observer->watches().empty());
}

TEST_F(ObserverTest, MissingRootEndsWatch) {
  auto handler = std::make_shared<CollectingHandler>();
  emitter::WatchOptions options;
  options.path = (base / "missing").string();
  observer = std::make_unique<Observer>(MyLogger::create("observer"));
  auto watch = observer->schedule(handler, options);
  observer->start();

  for (int i = 0; i < 500 && observer->is_alive(watch); ++i)
    std::this_thread::sleep_for(10ms);
  EXPECT_FALSE(observer->is_alive(watch));
}
