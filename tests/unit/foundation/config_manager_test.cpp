#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "evolve/foundation/config_manager.hpp"

using namespace evolve::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("evolve_config_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename, const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNested) {
    auto path = writeYaml("engine.yaml", R"(
combat:
  defense_constant: 120
  block_reduction: 0.4
logging:
  level: debug
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto defense = config.get<float>("combat.defense_constant");
    ASSERT_TRUE(defense.hasValue());
    EXPECT_FLOAT_EQ(defense.value(), 120.0f);

    auto level = config.get<std::string>("logging.level");
    ASSERT_TRUE(level.hasValue());
    EXPECT_EQ(level.value(), "debug");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("ai.discount");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ai:\n  discount: high\n").hasValue());

    auto result = config.get<double>("ai.discount");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrUsesFallbackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("skills:\n  combo_window: soon\n").hasValue());

    auto absent = config.getOr<float>("skills.combo_bonus", 0.2f);
    ASSERT_TRUE(absent.hasValue());
    EXPECT_FLOAT_EQ(absent.value(), 0.2f);

    auto wrong = config.getOr<float>("skills.combo_window", 3.0f);
    EXPECT_TRUE(wrong.hasError());
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("combat: [unterminated");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeysWithPrefix) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
stats:
  max_mana:
    base: 50
  max_health:
    level: 5
    constitution: 10
statsx: 1
)").hasValue());

    auto keys = config.keysWithPrefix("stats");
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "stats.max_health.constitution");
    EXPECT_EQ(keys[1], "stats.max_health.level");
    EXPECT_EQ(keys[2], "stats.max_mana.base");
}

TEST_F(ConfigManagerTest, SetNotifiesWatchers) {
    ConfigManager config;
    std::string notifiedKey;
    config.watch("ai.exploration_rate",
                 [&](std::string_view key) { notifiedKey = std::string(key); });

    config.set<double>("ai.exploration_rate", 0.05);

    EXPECT_EQ(notifiedKey, "ai.exploration_rate");
    EXPECT_DOUBLE_EQ(config.get<double>("ai.exploration_rate").value(), 0.05);
    EXPECT_TRUE(config.hasKey("ai.exploration_rate"));
}
