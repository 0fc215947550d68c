#include <gtest/gtest.h>

#include <sys/inotify.h>

#include <cstring>
#include <thread>

#include "../include/directorywatcher.hpp"
#include "../include/enginemetrics.hpp"
#include "../include/extensionmovestrategy.hpp"
#include "kirei/MetricsCollector.hpp"
#include "testsupport.hpp"

namespace fs = std::filesystem;
using namespace kirei;
using namespace kirei::testing_support;
using namespace std::chrono_literals;

namespace {

SeitonRule rule(const std::string &name, std::vector<std::string> extensions,
                const fs::path &destination) {
  SeitonRule result;
  result.name = name;
  result.extensions = std::move(extensions);
  result.destination = destination;
  return result;
}

// Запись в формате ядра: имя дополнено нулями до кратного 16 размера
void appendEvent(std::vector<char> &buffer, int wd, uint32_t mask,
                 const std::string &name = {}) {
  const std::size_t len = name.empty() ? 0 : (name.size() + 1 + 15) / 16 * 16;
  struct inotify_event header;
  std::memset(&header, 0, sizeof(header));
  header.wd = wd;
  header.mask = mask;
  header.len = static_cast<uint32_t>(len);

  const std::size_t offset = buffer.size();
  buffer.resize(offset + sizeof(header) + len, '\0');
  std::memcpy(buffer.data() + offset, &header, sizeof(header));
  std::memcpy(buffer.data() + offset + sizeof(header), name.data(), name.size());
}

double counter(const char *name) {
  return MetricsCollector::instance().counterValue(name).value_or(0.0);
}

}  // namespace

TEST(DirectoryWatcherDecodeTest, OverflowIsCountedAndDecodingContinues) {
  metrics::registerEngineMetrics();
  const double overflowsBefore = counter(metrics::kWatchOverflows);
  const double eventsBefore = counter(metrics::kWatchEvents);

  DirectoryWatcher::WatchTable watches{{3, "/srv/inbox"}};
  std::vector<char> buffer;
  appendEvent(buffer, 3, IN_CREATE, "a.pdf");
  appendEvent(buffer, -1, IN_Q_OVERFLOW);
  appendEvent(buffer, 3, IN_MOVED_TO, "b.txt");

  const auto batch =
      DirectoryWatcher::decodeEvents(buffer.data(), buffer.size(), watches);

  EXPECT_EQ(batch.overflows, 1u);
  EXPECT_EQ(batch.files, (std::vector<fs::path>{"/srv/inbox/a.pdf",
                                                "/srv/inbox/b.txt"}));
  EXPECT_EQ(counter(metrics::kWatchOverflows), overflowsBefore + 1);
  EXPECT_EQ(counter(metrics::kWatchEvents), eventsBefore + 2);
  EXPECT_EQ(watches.size(), 1u);
}

TEST(DirectoryWatcherDecodeTest, InvalidatedWatchesAndDirectoriesAreNotQueued) {
  DirectoryWatcher::WatchTable watches{{3, "/srv/inbox"}, {4, "/srv/desk"}};
  std::vector<char> buffer;
  appendEvent(buffer, 3, IN_CREATE | IN_ISDIR, "projects");
  appendEvent(buffer, 99, IN_CREATE, "unknown.pdf");
  appendEvent(buffer, 3, IN_MOVE_SELF);
  appendEvent(buffer, 4, IN_IGNORED);
  appendEvent(buffer, 3, IN_CREATE, "kept.pdf");
  // Обрезанная последняя запись не разбирается
  const std::size_t complete = buffer.size();
  appendEvent(buffer, 3, IN_CREATE, "truncated.pdf");

  const auto batch = DirectoryWatcher::decodeEvents(
      buffer.data(), complete + sizeof(struct inotify_event) + 4, watches);

  EXPECT_EQ(batch.overflows, 0u);
  EXPECT_EQ(batch.files, (std::vector<fs::path>{"/srv/inbox/kept.pdf"}));
  EXPECT_EQ(batch.movedWatches, (std::vector<int>{3}));
  EXPECT_EQ(watches.count(3), 1u);
  EXPECT_EQ(watches.count(4), 0u);
}

class DirectoryWatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::create_directories(inbox_);
    rules_ = {
        std::make_shared<ExtensionMoveStrategy>(rule("Docs", {"pdf"}, docs_)),
        std::make_shared<ExtensionMoveStrategy>(rule("Also", {"pdf", "txt"}, other_)),
    };
  }

  void TearDown() override {
    watcher_.stop();
    if (thread_.joinable()) thread_.join();
  }

  void startWatching(std::vector<fs::path> folders) {
    thread_ = std::thread([this, folders] { watcher_.start(folders, rules_); });
    ASSERT_TRUE(waitFor([this] { return watcher_.isRunning(); }));
  }

  TempDir root_{"kirei_watch"};
  fs::path inbox_ = root_ / "inbox";
  fs::path docs_ = root_ / "docs";
  fs::path other_ = root_ / "other";
  DirectoryWatcher::RuleList rules_;
  DirectoryWatcher watcher_{50ms};
  std::thread thread_;
};

TEST_F(DirectoryWatcherTest, NewFilesAreRoutedByFirstMatchingRule) {
  startWatching({inbox_});

  writeFile(inbox_ / "paper.pdf", "pdf");
  writeFile(inbox_ / "notes.txt", "txt");

  EXPECT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/paper.pdf"); }));
  EXPECT_TRUE(waitFor([this] { return fs::exists(other_ / "TXT/notes.txt"); }));
  EXPECT_FALSE(fs::exists(other_ / "PDF"));
}

TEST_F(DirectoryWatcherTest, UnmatchedAndExtensionlessFilesStay) {
  startWatching({inbox_});

  writeFile(inbox_ / "image.png", "png");
  writeFile(inbox_ / "README", "text");
  writeFile(inbox_ / "marker.pdf", "pdf");

  // Файлы обрабатываются по порядку событий; marker.pdf последний
  ASSERT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/marker.pdf"); }));
  EXPECT_TRUE(fs::exists(inbox_ / "image.png"));
  EXPECT_TRUE(fs::exists(inbox_ / "README"));
}

TEST_F(DirectoryWatcherTest, FilesMovedIntoFolderAreRouted) {
  writeFile(root_ / "staging/moved.pdf", "pdf");
  startWatching({inbox_});

  fs::rename(root_ / "staging/moved.pdf", inbox_ / "moved.pdf");

  EXPECT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/moved.pdf"); }));
}

TEST_F(DirectoryWatcherTest, NewSubdirectoriesAreNotWatched) {
  startWatching({inbox_});

  fs::create_directories(inbox_ / "sub");
  std::this_thread::sleep_for(100ms);
  writeFile(inbox_ / "sub/deep.pdf", "pdf");
  writeFile(inbox_ / "marker.pdf", "pdf");

  ASSERT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/marker.pdf"); }));
  EXPECT_TRUE(fs::exists(inbox_ / "sub/deep.pdf"));
  EXPECT_TRUE(fs::is_directory(inbox_ / "sub"));
}

TEST_F(DirectoryWatcherTest, RemovedFolderDoesNotStopOtherWatches) {
  const auto second = root_ / "second";
  fs::create_directories(second);
  startWatching({second, inbox_});

  fs::remove_all(second);
  std::this_thread::sleep_for(100ms);
  ASSERT_TRUE(watcher_.isRunning());

  writeFile(inbox_ / "after.pdf", "pdf");
  EXPECT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/after.pdf"); }));
}

TEST_F(DirectoryWatcherTest, StopEndsBlockingStart) {
  startWatching({inbox_});

  watcher_.stop();
  watcher_.stop();
  ASSERT_TRUE(waitFor([this] { return !watcher_.isRunning(); }, 2s));
  thread_.join();
}

TEST_F(DirectoryWatcherTest, MissingFoldersAreSkipped) {
  startWatching({root_ / "does-not-exist", inbox_});

  writeFile(inbox_ / "ok.pdf", "pdf");
  EXPECT_TRUE(waitFor([this] { return fs::exists(docs_ / "PDF/ok.pdf"); }));
}

TEST(DirectoryWatcherLifecycleTest, StopBeforeStartReturnsImmediately) {
  TempDir root("kirei_watch");
  DirectoryWatcher watcher(50ms);
  watcher.stop();

  const auto begin = std::chrono::steady_clock::now();
  watcher.start({root.path()}, {});
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
  EXPECT_FALSE(watcher.isRunning());
}

TEST(DirectoryWatcherLifecycleTest, NothingToWatchReturns) {
  DirectoryWatcher watcher(50ms);
  EXPECT_NO_THROW(watcher.start({"/nonexistent_kirei_dir"}, {}));
  EXPECT_FALSE(watcher.isRunning());
}
