#include "ai/EditJobClient.hpp"
#include "bot/BotController.hpp"
#include "chat/TelegramTransport.hpp"
#include "monitor/Logger.hpp"
#include "net/CurlHttpClient.hpp"
#include "threadpool/ThreadPool.hpp"
#include "utils/Config.hpp"

#include <signal.h>
#include <atomic>
#include <iostream>

// handler chỉ load pointer rồi set atomic<bool> running_
static std::atomic<BotController*> g_bot{nullptr};
static_assert(std::atomic<BotController*>::is_always_lock_free, "signal handler needs lock-free atomics");

static void onSignal(int) {
    if (BotController* bot = g_bot.load()) bot->stop();
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    std::string configPath = "config/bot.json";

    // Read CLI args: --config=X
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            configPath = arg.substr(9);
        }
    }

    Config cfg(configPath);
    Logger::setLevel(cfg.log_level);

    if (!cfg.validate()) {
        return 1;
    }

    CurlHttpClient::globalInit();

    // API BFL: timeout theo từng request; Telegram: phải dài hơn long-poll
    CurlHttpClient apiHttp(cfg.request_timeout * 1000L);
    CurlHttpClient chatHttp((TelegramTransport::LONG_POLL_TIMEOUT_S + cfg.request_timeout) * 1000L);

    EditJobOptions opts;
    opts.apiUrl = cfg.bfl_api_url;
    opts.apiKey = cfg.bfl_api_key;
    opts.maxPolls = cfg.bfl_max_polls;
    opts.pollInterval = std::chrono::seconds(cfg.bfl_poll_interval);
    opts.outputFormat = cfg.output_format;
    opts.safetyTolerance = cfg.safety_tolerance;

    EditJobClient editor(apiHttp, opts);
    TelegramTransport telegram(chatHttp, cfg.telegram_bot_token);

    {
        ThreadPool pool(cfg.workers);
        BotController bot(telegram, editor, cfg, &pool);

        g_bot = &bot;
        signal(SIGINT, onSignal);
        signal(SIGTERM, onSignal);

        LOGX("MAIN", "Starting Telegram BFL image editor bot (" << cfg.environment << ")...");
        bot.run();

        LOGX("MAIN", "Waiting for " << pool.getPendingTaskCount() << " edit job(s) to finish...");
        pool.waitIdle();
        g_bot = nullptr;
    }

    CurlHttpClient::globalCleanup();
    return 0;
}
