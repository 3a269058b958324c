#include <gtest/gtest.h>
#include "app/BuildConfig.hpp"
#include <fstream>

using namespace hframe;
namespace fs = std::filesystem;

TEST(BuildConfigTest, Defaults) {
    BuildConfig config;

    EXPECT_FALSE(config.root.has_value());
    EXPECT_FALSE(config.keep_log);
    EXPECT_TRUE(config.write_log_file);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.log_file_name, "handeeframer_log.txt");
}

TEST(BuildConfigTest, FromJson) {
    json input = {
        {"root", "/srv/projects"},
        {"keep_log", true},
        {"log_level", "debug"},
        {"log_file_name", "build.log"}
    };

    BuildConfig config = BuildConfig::from_json(input);

    ASSERT_TRUE(config.root.has_value());
    EXPECT_EQ(*config.root, fs::path("/srv/projects"));
    EXPECT_TRUE(config.keep_log);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.log_file_name, "build.log");
    EXPECT_TRUE(config.write_log_file);
}

TEST(BuildConfigTest, MissingKeysKeepDefaults) {
    BuildConfig config = BuildConfig::from_json(json::object());

    EXPECT_FALSE(config.root.has_value());
    EXPECT_EQ(config.log_level, "info");
}

TEST(BuildConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(BuildConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(BuildConfig::from_json({{"keep_log", "yes"}}), ConfigError);
    EXPECT_THROW(BuildConfig::from_json({{"root", 42}}), ConfigError);
    EXPECT_THROW(BuildConfig::from_json({{"log_level", "verbose"}}), ConfigError);
    EXPECT_THROW(BuildConfig::from_json({{"log_file_name", ""}}), ConfigError);
}

TEST(BuildConfigTest, ParseLogLevel) {
    EXPECT_EQ(BuildConfig::parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(BuildConfig::parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(BuildConfig::parse_log_level("error"), spdlog::level::err);
    EXPECT_THROW(BuildConfig::parse_log_level("WARN"), ConfigError);
}

TEST(BuildConfigTest, ToJson) {
    BuildConfig config;
    config.keep_log = true;

    json output = config.to_json();

    EXPECT_TRUE(output["root"].is_null());
    EXPECT_EQ(output["keep_log"], true);
    EXPECT_EQ(output["log_file_name"], "handeeframer_log.txt");
}

class BuildConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "hframe_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(BuildConfigFileTest, LoadsFile) {
    auto path = write("hframe.json", R"({"keep_log": true, "log_level": "warn"})");

    BuildConfig config = BuildConfig::load(path);

    EXPECT_TRUE(config.keep_log);
    EXPECT_EQ(config.log_level, "warn");
}

TEST_F(BuildConfigFileTest, MissingFile) {
    EXPECT_THROW(BuildConfig::load(test_dir_ / "absent.json"), ConfigError);
}

TEST_F(BuildConfigFileTest, MalformedFile) {
    auto path = write("broken.json", "{\"keep_log\": ");
    EXPECT_THROW(BuildConfig::load(path), ConfigError);
}
