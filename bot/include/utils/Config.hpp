#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "ai/AspectRatio.hpp"

class Config {
public:
    std::string telegram_bot_token;
    std::string bfl_api_key;

    std::string log_level   = "INFO";
    std::string environment = "production";

    std::string bfl_api_url = "https://api.bfl.ai/v1/flux-kontext-pro";
    int bfl_timeout         = 120;  // giây
    int bfl_max_polls       = 60;
    int bfl_poll_interval   = 2;    // giây
    int request_timeout     = 30;   // giây, cho từng HTTP call

    int max_image_size_mb            = 20;
    std::string default_aspect_ratio = "1:1";
    std::string output_format        = "jpeg";
    int safety_tolerance             = 2;

    int workers = 4;

    Config() = default;

    explicit Config(const std::string& path) {
        load(path);
        applyEnv();
        normalize();

        std::cout << "[Config] Loaded: env=" << environment
                  << ", max_polls=" << bfl_max_polls
                  << ", poll_interval=" << bfl_poll_interval << "s"
                  << ", workers=" << workers
                  << ", format=" << output_format
                  << "\n";
    }

    // File JSON: key nào thiếu thì giữ default
    void load(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open config file: " + path);
            }

            nlohmann::json j;
            file >> j;

            telegram_bot_token   = j.value("telegram_bot_token", telegram_bot_token);
            bfl_api_key          = j.value("bfl_api_key", bfl_api_key);
            log_level            = j.value("log_level", log_level);
            environment          = j.value("environment", environment);
            bfl_api_url          = j.value("bfl_api_url", bfl_api_url);
            bfl_timeout          = j.value("bfl_timeout", bfl_timeout);
            bfl_max_polls        = j.value("bfl_max_polls", bfl_max_polls);
            bfl_poll_interval    = j.value("bfl_poll_interval", bfl_poll_interval);
            request_timeout      = j.value("request_timeout", request_timeout);
            max_image_size_mb    = j.value("max_image_size_mb", max_image_size_mb);
            default_aspect_ratio = j.value("default_aspect_ratio", default_aspect_ratio);
            output_format        = j.value("output_format", output_format);
            safety_tolerance     = j.value("safety_tolerance", safety_tolerance);
            workers              = j.value("workers", workers);

        } catch (const std::exception& e) {
            std::cerr << "[Config] Error: " << e.what()
                      << " — using defaults + environment\n";
            *this = Config();
        }
    }

    // Biến môi trường ghi đè giá trị trong file
    void applyEnv() {
        envString("TELEGRAM_BOT_TOKEN", telegram_bot_token);
        envString("BFL_API_KEY", bfl_api_key);
        envString("LOG_LEVEL", log_level);
        envString("ENVIRONMENT", environment);
        envInt("BFL_TIMEOUT", bfl_timeout);
        envInt("BFL_MAX_POLLS", bfl_max_polls);
        envInt("BFL_POLL_INTERVAL", bfl_poll_interval);
        envInt("MAX_IMAGE_SIZE_MB", max_image_size_mb);
        envString("DEFAULT_ASPECT_RATIO", default_aspect_ratio);
        envString("OUTPUT_FORMAT", output_format);
        envInt("SAFETY_TOLERANCE", safety_tolerance);
    }

    void normalize() {
        Config defaults;

        std::transform(output_format.begin(), output_format.end(), output_format.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (output_format != "jpeg" && output_format != "png") {
            std::cerr << "[Config] Invalid output_format: " << output_format
                      << " — fallback to 'jpeg'\n";
            output_format = "jpeg";
        }

        if (!AspectRatioClassifier::isSupported(default_aspect_ratio)) {
            std::cerr << "[Config] Invalid default_aspect_ratio: " << default_aspect_ratio
                      << " — fallback to '1:1'\n";
            default_aspect_ratio = "1:1";
        }

        if (safety_tolerance < 0 || safety_tolerance > 6) safety_tolerance = defaults.safety_tolerance;
        if (bfl_timeout <= 0)       bfl_timeout = defaults.bfl_timeout;
        if (bfl_max_polls <= 0)     bfl_max_polls = defaults.bfl_max_polls;
        if (bfl_poll_interval <= 0) bfl_poll_interval = defaults.bfl_poll_interval;
        if (request_timeout <= 0)   request_timeout = defaults.request_timeout;
        if (max_image_size_mb <= 0) max_image_size_mb = defaults.max_image_size_mb;
        if (workers <= 0)           workers = defaults.workers;
    }

    bool validate() const {
        if (telegram_bot_token.empty()) {
            std::cerr << "[Config] TELEGRAM_BOT_TOKEN environment variable is required\n";
            return false;
        }
        if (bfl_api_key.empty()) {
            std::cerr << "[Config] BFL_API_KEY environment variable is required\n";
            return false;
        }
        return true;
    }

private:
    static void envString(const char* name, std::string& out) {
        const char* v = std::getenv(name);
        if (v && *v) out = v;
    }

    static void envInt(const char* name, int& out) {
        const char* v = std::getenv(name);
        if (!v || !*v) return;
        try {
            out = std::stoi(v);
        } catch (const std::exception&) {
            std::cerr << "[Config] Ignoring non-numeric " << name << "=" << v << "\n";
        }
    }
};
