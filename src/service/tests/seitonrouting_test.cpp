#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "../include/directorywatcher.hpp"
#include "../include/extensionmovestrategy.hpp"
#include "../include/pathutils.hpp"
#include "testsupport.hpp"

namespace fs = std::filesystem;
using namespace kirei;
using namespace kirei::testing_support;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace {

SeitonRule makeRule(const std::string &name, std::vector<std::string> extensions,
                    const fs::path &destination) {
  nlohmann::json src = {{"name", name},
                        {"extensions", extensions},
                        {"destination", destination.string()}};
  return SeitonRule::fromJson(src);
}

class MockRule : public RuleStrategy {
 public:
  MOCK_METHOD(bool, apply, (const fs::path &file), (override));
  MOCK_METHOD(std::string, name, (), (const, override));
};

}  // namespace

TEST(PathUtilsTest, ExtensionIsLowerCasedSuffixAfterLastDot) {
  EXPECT_EQ(extensionOf("/in/Report.PDF"), "pdf");
  EXPECT_EQ(extensionOf("/in/archive.tar.GZ"), "gz");
  EXPECT_FALSE(extensionOf("/in/Makefile"));
  EXPECT_FALSE(extensionOf("/in/trailing."));
}

TEST(PathUtilsTest, NormalizeAndWithin) {
  EXPECT_EQ(normalizeExtension(" .Pdf"), "pdf");
  EXPECT_EQ(toUpper("docx"), "DOCX");
  EXPECT_TRUE(isWithin("/data/archive/PDF/a.pdf", "/data/archive"));
  EXPECT_TRUE(isWithin("/data/archive", "/data/archive"));
  EXPECT_FALSE(isWithin("/data/archive2/a.pdf", "/data/archive"));
  EXPECT_FALSE(isWithin("/data/a.pdf", ""));
}

TEST(ExtensionMoveStrategyTest, MovesIntoUpperCasedExtensionFolder) {
  TempDir root("kirei_seiton");
  const auto file = root / "inbox/Report.Pdf";
  writeFile(file, "pdf");

  ExtensionMoveStrategy strategy(makeRule("Documents", {"PDF", ".docx"},
                                          root / "Documents"));

  EXPECT_TRUE(strategy.apply(file));
  EXPECT_TRUE(fs::exists(root / "Documents/PDF/Report.Pdf"));
  EXPECT_FALSE(fs::exists(file));
  EXPECT_EQ(strategy.name(), "Seiton[Documents]");
}

TEST(ExtensionMoveStrategyTest, IgnoresOtherExtensions) {
  TempDir root("kirei_seiton");
  const auto file = root / "inbox/photo.jpg";
  writeFile(file, "jpg");

  ExtensionMoveStrategy strategy(makeRule("Documents", {"pdf"}, root / "Documents"));

  EXPECT_FALSE(strategy.apply(file));
  EXPECT_TRUE(fs::exists(file));
}

TEST(ExtensionMoveStrategyTest, IgnoresFilesWithoutExtension) {
  TempDir root("kirei_seiton");
  writeFile(root / "inbox/Makefile", "all:");
  writeFile(root / "inbox/trailing.", "dot");

  ExtensionMoveStrategy strategy(makeRule("Documents", {"pdf"}, root / "Documents"));

  EXPECT_FALSE(strategy.apply(root / "inbox/Makefile"));
  EXPECT_FALSE(strategy.apply(root / "inbox/trailing."));
  EXPECT_TRUE(fs::exists(root / "inbox/Makefile"));
  EXPECT_FALSE(fs::exists(root / "Documents"));
}

TEST(ExtensionMoveStrategyTest, CollisionKeepsBothFiles) {
  TempDir root("kirei_seiton");
  writeFile(root / "Documents/PDF/report.pdf", "old");
  writeFile(root / "inbox/report.pdf", "new");

  ExtensionMoveStrategy strategy(makeRule("Documents", {"pdf"}, root / "Documents"));
  EXPECT_TRUE(strategy.apply(root / "inbox/report.pdf"));

  EXPECT_EQ(readFile(root / "Documents/PDF/report.pdf"), "old");
  EXPECT_EQ(readFile(root / "Documents/PDF/report_1.pdf"), "new");
}

TEST(SeitonDispatchTest, FirstMatchingRuleWins) {
  TempDir root("kirei_dispatch");
  const auto file = root / "inbox/notes.txt";
  writeFile(file, "txt");

  DirectoryWatcher::RuleList rules = {
      std::make_shared<ExtensionMoveStrategy>(
          makeRule("Images", {"png"}, root / "Images")),
      std::make_shared<ExtensionMoveStrategy>(
          makeRule("Text", {"txt", "md"}, root / "Text")),
      std::make_shared<ExtensionMoveStrategy>(
          makeRule("Everything", {"txt"}, root / "Everything")),
  };

  auto applied = DirectoryWatcher::dispatch(file, rules);

  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(*applied, "Seiton[Text]");
  EXPECT_TRUE(fs::exists(root / "Text/TXT/notes.txt"));
  EXPECT_FALSE(fs::exists(root / "Everything"));
}

TEST(SeitonDispatchTest, FileWithoutExtensionIsNotOfferedToRules) {
  auto rule = std::make_shared<MockRule>();
  EXPECT_CALL(*rule, apply(_)).Times(0);

  DirectoryWatcher::RuleList rules = {rule};
  EXPECT_FALSE(DirectoryWatcher::dispatch("/tmp/README", rules));
}

TEST(SeitonDispatchTest, LaterRulesAreNotConsultedAfterMatch) {
  auto first = std::make_shared<MockRule>();
  auto second = std::make_shared<MockRule>();
  EXPECT_CALL(*first, apply(_)).WillOnce(Return(true));
  EXPECT_CALL(*first, name()).WillRepeatedly(Return("first"));
  EXPECT_CALL(*second, apply(_)).Times(0);

  DirectoryWatcher::RuleList rules = {first, second};
  EXPECT_EQ(DirectoryWatcher::dispatch("/tmp/a.txt", rules), "first");
}

TEST(SeitonDispatchTest, ThrowingRuleStopsDispatchWithoutPropagating) {
  auto failing = std::make_shared<MockRule>();
  auto next = std::make_shared<MockRule>();
  EXPECT_CALL(*failing, apply(_))
      .WillOnce(Throw(std::runtime_error("disk on fire")));
  EXPECT_CALL(*failing, name()).WillRepeatedly(Return("failing"));
  EXPECT_CALL(*next, apply(_)).Times(0);

  DirectoryWatcher::RuleList rules = {failing, next};
  std::optional<std::string> applied;
  EXPECT_NO_THROW(applied = DirectoryWatcher::dispatch("/tmp/a.txt", rules));
  EXPECT_FALSE(applied.has_value());
}
