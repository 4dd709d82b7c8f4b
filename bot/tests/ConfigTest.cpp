#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include "utils/Config.hpp"

namespace {

const char* ENV_VARS[] = {
    "TELEGRAM_BOT_TOKEN", "BFL_API_KEY", "LOG_LEVEL", "ENVIRONMENT", "BFL_TIMEOUT",
    "BFL_MAX_POLLS", "BFL_POLL_INTERVAL", "MAX_IMAGE_SIZE_MB", "DEFAULT_ASPECT_RATIO",
    "OUTPUT_FORMAT", "SAFETY_TOLERANCE",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* v : ENV_VARS) unsetenv(v);
        path = ::testing::TempDir() + "bot_config_test.json";
    }

    void TearDown() override {
        for (const char* v : ENV_VARS) unsetenv(v);
        std::remove(path.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream f(path);
        f << content;
    }

    std::string path;
};

TEST_F(ConfigTest, MissingFileUsesDefaults) {
    Config cfg(path + ".does-not-exist");

    EXPECT_EQ(cfg.bfl_api_url, "https://api.bfl.ai/v1/flux-kontext-pro");
    EXPECT_EQ(cfg.bfl_max_polls, 60);
    EXPECT_EQ(cfg.bfl_poll_interval, 2);
    EXPECT_EQ(cfg.bfl_timeout, 120);
    EXPECT_EQ(cfg.max_image_size_mb, 20);
    EXPECT_EQ(cfg.default_aspect_ratio, "1:1");
    EXPECT_EQ(cfg.output_format, "jpeg");
    EXPECT_EQ(cfg.safety_tolerance, 2);
    EXPECT_EQ(cfg.environment, "production");
    EXPECT_FALSE(cfg.validate());
}

TEST_F(ConfigTest, ReadsJsonFile) {
    writeFile(R"({
        "telegram_bot_token": "tg",
        "bfl_api_key": "key",
        "bfl_max_polls": 10,
        "bfl_poll_interval": 1,
        "output_format": "PNG",
        "default_aspect_ratio": "16:9",
        "workers": 2
    })");

    Config cfg(path);

    EXPECT_EQ(cfg.telegram_bot_token, "tg");
    EXPECT_EQ(cfg.bfl_api_key, "key");
    EXPECT_EQ(cfg.bfl_max_polls, 10);
    EXPECT_EQ(cfg.bfl_poll_interval, 1);
    EXPECT_EQ(cfg.output_format, "png");
    EXPECT_EQ(cfg.default_aspect_ratio, "16:9");
    EXPECT_EQ(cfg.workers, 2);
    EXPECT_EQ(cfg.request_timeout, 30);
    EXPECT_TRUE(cfg.validate());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    writeFile(R"({"bfl_api_key": "from-file", "bfl_max_polls": 10})");
    setenv("BFL_API_KEY", "from-env", 1);
    setenv("TELEGRAM_BOT_TOKEN", "tg-env", 1);
    setenv("BFL_MAX_POLLS", "30", 1);
    setenv("LOG_LEVEL", "debug", 1);

    Config cfg(path);

    EXPECT_EQ(cfg.bfl_api_key, "from-env");
    EXPECT_EQ(cfg.telegram_bot_token, "tg-env");
    EXPECT_EQ(cfg.bfl_max_polls, 30);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.validate());
}

TEST_F(ConfigTest, InvalidValuesFallBack) {
    writeFile(R"({
        "output_format": "gif",
        "default_aspect_ratio": "5:4",
        "safety_tolerance": 9,
        "bfl_max_polls": 0,
        "bfl_poll_interval": -3,
        "workers": 0
    })");
    setenv("MAX_IMAGE_SIZE_MB", "lots", 1);

    Config cfg(path);

    EXPECT_EQ(cfg.output_format, "jpeg");
    EXPECT_EQ(cfg.default_aspect_ratio, "1:1");
    EXPECT_EQ(cfg.safety_tolerance, 2);
    EXPECT_EQ(cfg.bfl_max_polls, 60);
    EXPECT_EQ(cfg.bfl_poll_interval, 2);
    EXPECT_EQ(cfg.workers, 4);
    EXPECT_EQ(cfg.max_image_size_mb, 20);
}

TEST_F(ConfigTest, MalformedJsonUsesDefaults) {
    writeFile("{ not json");
    setenv("BFL_API_KEY", "k", 1);

    Config cfg(path);

    EXPECT_EQ(cfg.bfl_max_polls, 60);
    EXPECT_EQ(cfg.bfl_api_key, "k");
    EXPECT_FALSE(cfg.validate());
}

TEST_F(ConfigTest, ValidateNeedsBothSecrets) {
    Config cfg;
    cfg.telegram_bot_token = "tg";
    EXPECT_FALSE(cfg.validate());
    cfg.bfl_api_key = "key";
    EXPECT_TRUE(cfg.validate());
    cfg.telegram_bot_token.clear();
    EXPECT_FALSE(cfg.validate());
}

}  // namespace
