#include <gtest/gtest.h>

#include <thread>

#include "../include/agebasedmovestrategy.hpp"
#include "../include/duplicatedetectionstrategy.hpp"
#include "../include/extensionmovestrategy.hpp"
#include "../include/kireiengine.hpp"
#include "../include/tempfoldercleanupstrategy.hpp"
#include "testsupport.hpp"

namespace fs = std::filesystem;
using namespace kirei;
using namespace kirei::testing_support;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<const EngineConfig> makeConfig(const TempDir &root) {
  using nlohmann::json;
  json documents = {{"name", "Documents"},
                    {"extensions", json::array({"pdf"})},
                    {"destination", (root / "docs").string()}};
  json text = {{"name", "Text"},
               {"extensions", json::array({"txt"})},
               {"destination", (root / "text").string()}};
  json cleanRule = {{"enabled", true},
                    {"folders", json::array({(root / "tmp").string()})}};

  json src = {
      {"monitorFolders", json::array({(root / "inbox").string()})},
      {"seitonRules", json::array({documents, text})},
      {"seisoConfig",
       {{"enabled", true},
        {"initialDelay", 0},
        {"period", 50},
        {"timeUnit", "MILLISECONDS"},
        {"rules", {{"cleanTemporaryFolders", cleanRule}}}}},
      {"seiriConfig", {{"enabled", false}}},
  };
  return std::make_shared<EngineConfig>(EngineConfig::fromJson(src));
}

}  // namespace

TEST(KireiEngineTest, SeitonRulesKeepConfiguredOrder) {
  TempDir root("kirei_engine");
  auto config = makeConfig(root);

  auto rules = KireiEngine::buildSeitonRules(*config);

  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0]->name(), "Seiton[Documents]");
  EXPECT_EQ(rules[1]->name(), "Seiton[Text]");
}

TEST(KireiEngineTest, OneJobPerTaskFamily) {
  TempDir root("kirei_engine");
  auto config = makeConfig(root);

  auto jobs = KireiEngine::buildJobs(*config);

  ASSERT_EQ(jobs.size(), 3u);
  EXPECT_EQ(jobs[0].family, TaskFamily::Seiri);
  EXPECT_FALSE(jobs[0].enabled);
  EXPECT_NE(dynamic_cast<AgeBasedMoveStrategy *>(jobs[0].strategies.at(0).get()),
            nullptr);

  EXPECT_EQ(jobs[1].family, TaskFamily::Seiso);
  EXPECT_TRUE(jobs[1].enabled);
  EXPECT_EQ(jobs[1].period, 50ms);
  EXPECT_NE(dynamic_cast<TempFolderCleanupStrategy *>(jobs[1].strategies.at(0).get()),
            nullptr);

  EXPECT_EQ(jobs[2].family, TaskFamily::DuplicateDetection);
  EXPECT_FALSE(jobs[2].enabled);
  EXPECT_NE(dynamic_cast<DuplicateDetectionStrategy *>(jobs[2].strategies.at(0).get()),
            nullptr);
}

TEST(KireiEngineTest, NullConfigurationIsRejected) {
  EXPECT_THROW(KireiEngine(nullptr), std::invalid_argument);
}

TEST(KireiEngineTest, RunsWatcherAndSchedulerUntilStopped) {
  TempDir root("kirei_engine");
  fs::create_directories(root / "inbox");
  writeFile(root / "tmp/junk/old.tmp", "junk");

  EngineOptions options;
  options.settleDelay = 50ms;
  options.gracePeriod = 1s;
  KireiEngine engine(makeConfig(root), options);

  std::thread runner([&engine] { engine.start(); });
  ASSERT_TRUE(waitFor([&engine] { return engine.isRunning(); }));

  EXPECT_TRUE(waitFor([&root] { return fs::is_empty(root / "tmp"); }));

  // Наблюдение запускается после планировщика
  std::this_thread::sleep_for(200ms);
  writeFile(root / "inbox/book.pdf", "pdf");
  EXPECT_TRUE(waitFor([&root] { return fs::exists(root / "docs/PDF/book.pdf"); }));

  engine.stop();
  runner.join();
  EXPECT_FALSE(engine.isRunning());
  EXPECT_TRUE(fs::is_directory(root / "tmp"));
}

TEST(KireiEngineTest, StopBeforeStartMakesStartReturn) {
  TempDir root("kirei_engine");
  fs::create_directories(root / "inbox");

  KireiEngine engine(makeConfig(root));
  engine.stop();
  engine.stop();

  const auto begin = std::chrono::steady_clock::now();
  engine.start();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
  EXPECT_FALSE(engine.isRunning());
}

TEST(KireiEngineTest, ConcurrentStopCallsAreSafe) {
  TempDir root("kirei_engine");
  fs::create_directories(root / "inbox");

  EngineOptions options;
  options.settleDelay = 20ms;
  KireiEngine engine(makeConfig(root), options);
  std::thread runner([&engine] { engine.start(); });
  ASSERT_TRUE(waitFor([&engine] { return engine.isRunning(); }));

  std::thread a([&engine] { engine.stop(); });
  std::thread b([&engine] { engine.stop(); });
  a.join();
  b.join();
  runner.join();
  EXPECT_FALSE(engine.isRunning());
}
