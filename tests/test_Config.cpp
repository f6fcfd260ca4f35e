#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "core/tasks/TaskSettings.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace collector::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        Config::instance().setDefaults();
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("collector-config-" + std::to_string(stamp));
        fs::create_directories(dir);
    }

    void TearDown() override {
        Config::instance().setDefaults();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TEST_F(ConfigTest, DefaultsMatchTaskSettings) {
    tasks::TaskSettings settings = tasks::TaskSettings::fromConfig(Config::instance());
    tasks::TaskSettings builtIn;

    EXPECT_EQ(settings.retryLimit, builtIn.retryLimit);
    EXPECT_EQ(settings.backoffBase, builtIn.backoffBase);
    EXPECT_EQ(settings.backoffMax, builtIn.backoffMax);
    EXPECT_EQ(settings.orphanThreshold, 1h);
    EXPECT_EQ(settings.sweepInterval, 1min);
    EXPECT_TRUE(settings.exemptActiveTransfers);
}

TEST_F(ConfigTest, DotNotationAccess) {
    auto& config = Config::instance();
    EXPECT_EQ(config.get<int>("downloads.retryLimit"), 3);
    EXPECT_EQ(config.get<int>("downloads.missing", 42), 42);

    config.set("reaper.orphanThresholdMs", 90000);
    EXPECT_EQ(config.get<int>("reaper.orphanThresholdMs"), 90000);
    EXPECT_TRUE(config.has("reaper.graceMs"));

    config.remove("reaper.graceMs");
    EXPECT_FALSE(config.has("reaper.graceMs"));
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    auto& config = Config::instance();
    config.set("downloads.retryLimit", std::string("many"));
    EXPECT_EQ(config.get<int>("downloads.retryLimit", 7), 7);
}

TEST_F(ConfigTest, SettingsAreClamped) {
    auto& config = Config::instance();
    config.set("downloads.retryLimit", -4);
    config.set("reaper.orphanThresholdMs", -5);

    tasks::TaskSettings settings = tasks::TaskSettings::fromConfig(config);
    EXPECT_EQ(settings.retryLimit, 0);
    EXPECT_EQ(settings.orphanThreshold, 0ms);
}

TEST_F(ConfigTest, BackoffDoublesUpToCap) {
    tasks::TaskSettings settings;
    settings.backoffBase = 100ms;
    settings.backoffMax = 1000ms;

    EXPECT_EQ(settings.backoffFor(0), 0ms);
    EXPECT_EQ(settings.backoffFor(1), 100ms);
    EXPECT_EQ(settings.backoffFor(2), 200ms);
    EXPECT_EQ(settings.backoffFor(3), 400ms);
    EXPECT_EQ(settings.backoffFor(4), 800ms);
    EXPECT_EQ(settings.backoffFor(5), 1000ms);
    EXPECT_EQ(settings.backoffFor(30), 1000ms);
}

TEST_F(ConfigTest, PartialFileMergesOverDefaults) {
    fs::path file = dir / "collector.json";
    {
        std::ofstream out(file);
        out << R"({"downloads": {"retryLimit": 9}, "reaper": {"exemptActiveTransfers": false}})";
    }

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(file.string()));

    tasks::TaskSettings settings = tasks::TaskSettings::fromConfig(config);
    EXPECT_EQ(settings.retryLimit, 9);
    EXPECT_FALSE(settings.exemptActiveTransfers);
    EXPECT_EQ(settings.backoffBase, 1000ms);
    EXPECT_EQ(config.get<std::string>("s3.endpoint"), "https://s3.amazonaws.com");
}

TEST_F(ConfigTest, LoadRejectsMissingAndMalformedFiles) {
    auto& config = Config::instance();
    EXPECT_FALSE(config.load((dir / "absent.json").string()));

    fs::path broken = dir / "broken.json";
    {
        std::ofstream out(broken);
        out << "{ \"downloads\": ";
    }
    EXPECT_FALSE(config.load(broken.string()));
    EXPECT_EQ(config.get<int>("downloads.retryLimit"), 3);
}

TEST_F(ConfigTest, SaveRoundTrip) {
    auto& config = Config::instance();
    config.set("downloads.progressIntervalMs", 2);

    fs::path file = dir / "nested" / "collector.json";
    ASSERT_TRUE(config.save(file.string()));

    config.setDefaults();
    ASSERT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.get<int>("downloads.progressIntervalMs"), 2);
}
