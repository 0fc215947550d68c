#include <gtest/gtest.h>

#include "../include/filetransferresolver.hpp"
#include "testsupport.hpp"
#include "kirei/MetricsCollector.hpp"
#include "../include/enginemetrics.hpp"

namespace fs = std::filesystem;
using kirei::FileTransferResolver;
using namespace kirei::testing_support;

class FileTransferResolverTest : public ::testing::Test {
 protected:
  void SetUp() override { kirei::metrics::registerEngineMetrics(); }

  TempDir root_{"kirei_resolver"};
  FileTransferResolver resolver_;
};

TEST_F(FileTransferResolverTest, MovesIntoCreatedDestination) {
  const auto source = root_ / "in/report.pdf";
  writeFile(source, "report");
  const auto destination = root_ / "archive/nested/PDF";

  auto target = resolver_.move(source, destination);

  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(*target, destination / "report.pdf");
  EXPECT_FALSE(fs::exists(source));
  EXPECT_EQ(readFile(*target), "report");
}

TEST_F(FileTransferResolverTest, CollisionsGetSequentialSuffixes) {
  const auto destination = root_ / "archive";
  writeFile(destination / "report.pdf", "original");

  writeFile(root_ / "a/report.pdf", "second");
  writeFile(root_ / "b/report.pdf", "third");

  auto second = resolver_.move(root_ / "a/report.pdf", destination);
  auto third = resolver_.move(root_ / "b/report.pdf", destination);

  ASSERT_TRUE(second && third);
  EXPECT_EQ(second->filename(), "report_1.pdf");
  EXPECT_EQ(third->filename(), "report_2.pdf");
  EXPECT_EQ(readFile(destination / "report.pdf"), "original");
  EXPECT_EQ(readFile(destination / "report_2.pdf"), "third");
}

TEST_F(FileTransferResolverTest, SuffixWithoutExtensionAndForHiddenFiles) {
  writeFile(root_ / "Makefile", "");
  writeFile(root_ / ".profile", "");

  EXPECT_EQ(FileTransferResolver::uniqueTarget(root_ / "Makefile")->filename(),
            "Makefile_1");
  EXPECT_EQ(FileTransferResolver::uniqueTarget(root_ / ".profile")->filename(),
            ".profile_1");
  EXPECT_EQ(FileTransferResolver::uniqueTarget(root_ / "free.txt"),
            root_ / "free.txt");
}

TEST_F(FileTransferResolverTest, SuffixGoesBeforeLastExtension) {
  writeFile(root_ / "archive.tar.gz", "");
  EXPECT_EQ(
      FileTransferResolver::uniqueTarget(root_ / "archive.tar.gz")->filename(),
      "archive.tar_1.gz");
}

TEST_F(FileTransferResolverTest, GivesUpWhenAllNamesAreTaken) {
  writeFile(root_ / "x.txt", "");
  for (int i = 1; i <= 3; ++i) {
    writeFile(root_ / ("x_" + std::to_string(i) + ".txt"), "");
  }

  EXPECT_FALSE(FileTransferResolver::uniqueTarget(root_ / "x.txt", 3));
  EXPECT_EQ(FileTransferResolver::uniqueTarget(root_ / "x.txt", 4)->filename(),
            "x_4.txt");
}

TEST_F(FileTransferResolverTest, MissingSourceLeavesNoTrace) {
  const auto failuresBefore =
      kirei::MetricsCollector::instance().counterValue(kirei::metrics::kMoveFailures);

  auto target = resolver_.move(root_ / "missing.txt", root_ / "dest");

  EXPECT_FALSE(target.has_value());
  EXPECT_FALSE(fs::exists(root_ / "dest/missing.txt"));
  EXPECT_EQ(*kirei::MetricsCollector::instance().counterValue(
                kirei::metrics::kMoveFailures),
            failuresBefore.value_or(0) + 1);
}

TEST_F(FileTransferResolverTest, UncreatableDestinationKeepsSource) {
  const auto source = root_ / "keep.txt";
  writeFile(source, "data");
  // Обычный файл на месте промежуточного каталога
  writeFile(root_ / "blocker", "");

  auto target = resolver_.move(source, root_ / "blocker/dest");

  EXPECT_FALSE(target.has_value());
  EXPECT_TRUE(fs::exists(source));
  EXPECT_EQ(readFile(source), "data");
}

TEST_F(FileTransferResolverTest, DirectoriesAreNotMoved) {
  fs::create_directories(root_ / "folder.d");
  EXPECT_FALSE(resolver_.move(root_ / "folder.d", root_ / "dest"));
  EXPECT_TRUE(fs::is_directory(root_ / "folder.d"));
}
