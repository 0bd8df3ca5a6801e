#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include "Config.h"

using namespace SettleFS;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "settlefs_config_test";
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    fs::path dir_;
};

TEST_F(ConfigTest, TypedAccessors) {
    Config config;

    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");

    config.setInt("debounce_timeout_ms", 750);
    EXPECT_EQ(config.getInt("debounce_timeout_ms"), 750);

    config.set("partial", "12abc");
    EXPECT_EQ(config.getInt("partial", -1), -1);

    config.setBool("watch_recursive", false);
    EXPECT_FALSE(config.getBool("watch_recursive", true));
    config.set("watch_recursive", "Yes");
    EXPECT_TRUE(config.getBool("watch_recursive"));
    config.set("watch_recursive", "maybe");
    EXPECT_TRUE(config.getBool("watch_recursive", true));
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    auto path = writeFile("settle.conf",
        "# debounce settings\n"
        "\n"
        "debounce_timeout_ms = 300\n"
        "  tick_interval_ms=75  \n"
        "not a setting\n"
        "log_level = debug\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.getInt("debounce_timeout_ms"), 300);
    EXPECT_EQ(config.getInt("tick_interval_ms"), 75);
    EXPECT_EQ(config.get("log_level"), "debug");
    EXPECT_FALSE(config.hasKey("not a setting"));
    EXPECT_FALSE(config.loadFromFile((dir_ / "missing.conf").string()));
}

TEST_F(ConfigTest, LayeredLoadingRespectsOverride) {
    auto base = writeFile("base.conf", "debounce_timeout_ms=1000\nlog_level=info\n");
    auto local = writeFile("local.conf", "debounce_timeout_ms=250\n");

    Config overriding;
    ASSERT_TRUE(overriding.loadLayered({base, local}));
    EXPECT_EQ(overriding.getInt("debounce_timeout_ms"), 250);
    EXPECT_EQ(overriding.get("log_level"), "info");

    Config keepFirst;
    ASSERT_TRUE(keepFirst.loadLayered({base, local}, false));
    EXPECT_EQ(keepFirst.getInt("debounce_timeout_ms"), 1000);
}

TEST_F(ConfigTest, ValidationReportsFailingKey) {
    Config config;
    config.set("tick_interval_ms", "50");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["tick_interval_ms"] = [](const std::string&, const std::string& v) {
        return !v.empty() && v.find_first_not_of("0123456789") == std::string::npos;
    };

    EXPECT_TRUE(config.validate(schema));

    config.set("tick_interval_ms", "soon");
    std::string failedKey;
    EXPECT_FALSE(config.validate(schema, &failedKey));
    EXPECT_EQ(failedKey, "tick_interval_ms");
}
