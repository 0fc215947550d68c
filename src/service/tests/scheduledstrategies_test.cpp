#include <gtest/gtest.h>

#include <algorithm>

#include "../include/agebasedmovestrategy.hpp"
#include "../include/tempfoldercleanupstrategy.hpp"
#include "testsupport.hpp"

namespace fs = std::filesystem;
using namespace kirei;
using namespace kirei::testing_support;
using namespace std::chrono_literals;

namespace {

SeiriRule seiriRule(std::int64_t days, const fs::path &destination) {
  SeiriRule rule;
  rule.enabled = true;
  rule.days = days;
  rule.destination = destination;
  return rule;
}

ScanContext contextFor(const fs::path &folder, fs::file_time_type now) {
  ScanContext context;
  context.monitoredFolders = {folder};
  context.now = now;
  return context;
}

// Запоминает порядок удаления
class RecordingCleanup : public TempFolderCleanupStrategy {
 public:
  using TempFolderCleanupStrategy::TempFolderCleanupStrategy;
  std::vector<fs::path> removed;

 protected:
  bool removeEntry(const fs::path &entry) override {
    removed.push_back(entry);
    return TempFolderCleanupStrategy::removeEntry(entry);
  }
};

std::ptrdiff_t positionOf(const std::vector<fs::path> &items,
                          const fs::path &item) {
  return std::find(items.begin(), items.end(), item) - items.begin();
}

}  // namespace

class AgeBasedMoveStrategyTest : public ::testing::Test {
 protected:
  TempDir root_{"kirei_seiri"};
  fs::path inbox_ = root_ / "inbox";
  fs::path archive_ = root_ / "archive";
  fs::file_time_type now_ = wholeSecondNow();
};

TEST_F(AgeBasedMoveStrategyTest, MovesOnlyFilesStrictlyOlderThanThreshold) {
  writeFile(inbox_ / "old.pdf", "old");
  writeFile(inbox_ / "boundary.pdf", "boundary");
  writeFile(inbox_ / "fresh.pdf", "fresh");
  fs::last_write_time(inbox_ / "old.pdf", now_ - 24h * 30 - 1s);
  fs::last_write_time(inbox_ / "boundary.pdf", now_ - 24h * 30);
  fs::last_write_time(inbox_ / "fresh.pdf", now_ - 1h);

  AgeBasedMoveStrategy strategy(seiriRule(30, archive_));
  strategy.execute(contextFor(inbox_, now_));

  EXPECT_TRUE(fs::exists(archive_ / "PDF/old.pdf"));
  EXPECT_TRUE(fs::exists(inbox_ / "boundary.pdf"));
  EXPECT_TRUE(fs::exists(inbox_ / "fresh.pdf"));
  EXPECT_FALSE(fs::exists(inbox_ / "old.pdf"));
}

TEST_F(AgeBasedMoveStrategyTest, StaleComparisonIsStrict) {
  AgeBasedMoveStrategy strategy(seiriRule(1, archive_));
  EXPECT_FALSE(strategy.isStale(now_ - 24h, now_));
  EXPECT_TRUE(strategy.isStale(now_ - 24h - 1s, now_));
}

TEST_F(AgeBasedMoveStrategyTest, FilesWithoutExtensionGoToDestinationRoot) {
  writeFile(inbox_ / "sub/LICENSE", "text");
  fs::last_write_time(inbox_ / "sub/LICENSE", now_ - 24h * 10);

  AgeBasedMoveStrategy strategy(seiriRule(5, archive_));
  strategy.execute(contextFor(inbox_, now_));

  EXPECT_TRUE(fs::exists(archive_ / "LICENSE"));
}

TEST_F(AgeBasedMoveStrategyTest, DestinationInsideMonitoredFolderIsLeftAlone) {
  const auto nestedArchive = inbox_ / "archive";
  writeFile(nestedArchive / "PDF/already.pdf", "archived");
  fs::last_write_time(nestedArchive / "PDF/already.pdf", now_ - 24h * 100);

  AgeBasedMoveStrategy strategy(seiriRule(1, nestedArchive));
  strategy.execute(contextFor(inbox_, now_));

  EXPECT_TRUE(fs::exists(nestedArchive / "PDF/already.pdf"));
  EXPECT_FALSE(fs::exists(nestedArchive / "PDF/already_1.pdf"));
}

TEST_F(AgeBasedMoveStrategyTest, DisabledRuleDoesNothing) {
  writeFile(inbox_ / "old.txt", "old");
  fs::last_write_time(inbox_ / "old.txt", now_ - 24h * 400);

  auto rule = seiriRule(1, archive_);
  rule.enabled = false;
  AgeBasedMoveStrategy strategy(rule);
  strategy.execute(contextFor(inbox_, now_));

  EXPECT_TRUE(fs::exists(inbox_ / "old.txt"));
  EXPECT_FALSE(fs::exists(archive_));
}

TEST_F(AgeBasedMoveStrategyTest, CancelledScanMovesNothing) {
  writeFile(inbox_ / "old.txt", "old");
  fs::last_write_time(inbox_ / "old.txt", now_ - 24h * 400);

  std::atomic<bool> cancelled{true};
  auto context = contextFor(inbox_, now_);
  context.cancelled = &cancelled;

  AgeBasedMoveStrategy strategy(seiriRule(1, archive_));
  strategy.execute(context);

  EXPECT_TRUE(fs::exists(inbox_ / "old.txt"));
}

TEST(TempFolderCleanupStrategyTest, DeletesDeepestFirstAndKeepsRoot) {
  TempDir root("kirei_seiso");
  const auto temp = root / "tmp";
  writeFile(temp / "a/b/file.tmp", "x");
  writeFile(temp / "a/other.tmp", "y");
  writeFile(temp / "top.tmp", "z");

  SeisoRule rule;
  rule.enabled = true;
  rule.folders = {temp};
  RecordingCleanup strategy(rule);
  strategy.execute(ScanContext{});

  EXPECT_TRUE(fs::is_directory(temp));
  EXPECT_TRUE(fs::is_empty(temp));

  const auto &order = strategy.removed;
  ASSERT_EQ(order.size(), 5u);
  EXPECT_LT(positionOf(order, temp / "a/b/file.tmp"), positionOf(order, temp / "a/b"));
  EXPECT_LT(positionOf(order, temp / "a/b"), positionOf(order, temp / "a"));
  EXPECT_LT(positionOf(order, temp / "a/other.tmp"), positionOf(order, temp / "a"));
  EXPECT_EQ(positionOf(order, temp), static_cast<std::ptrdiff_t>(order.size()));
}

TEST(TempFolderCleanupStrategyTest, MissingFolderIsSkipped) {
  TempDir root("kirei_seiso");
  const auto present = root / "present";
  writeFile(present / "junk.tmp", "x");

  SeisoRule rule;
  rule.enabled = true;
  rule.folders = {root / "absent", present};
  TempFolderCleanupStrategy strategy(rule);
  EXPECT_NO_THROW(strategy.execute(ScanContext{}));

  EXPECT_FALSE(fs::exists(present / "junk.tmp"));
  EXPECT_FALSE(fs::exists(root / "absent"));
}

TEST(TempFolderCleanupStrategyTest, DisabledRuleKeepsFiles) {
  TempDir root("kirei_seiso");
  writeFile(root / "tmp/keep.tmp", "x");

  SeisoRule rule;
  rule.enabled = false;
  rule.folders = {root / "tmp"};
  TempFolderCleanupStrategy strategy(rule);
  strategy.execute(ScanContext{});

  EXPECT_TRUE(fs::exists(root / "tmp/keep.tmp"));
}
