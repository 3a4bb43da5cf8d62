#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "app/AppContext.hpp"
#include "common/Config.hpp"
#include "logging/Log.h"

namespace {

constexpr int kExitTerminalFailure = 2;
constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

volatile std::sig_atomic_t gSignalStatus = 0;
std::atomic<bool> gTerminalFailure{false};

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    mse::common::Config config;
    try {
        config = mse::common::Config::fromArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "configuration error: %s\n%s", ex.what(), mse::common::Config::usage());
        return EXIT_FAILURE;
    }
    if (config.showHelp) {
        std::fputs(mse::common::Config::usage(), stdout);
        return EXIT_SUCCESS;
    }

    logging::Log::set_log_level(config.logLevel);
    LOG_INFO(kLogCategory, "configuration loaded");
    LOG_INFO(kLogCategory, "  symbols: %s", joinList(config.symbols).c_str());
    LOG_INFO(kLogCategory, "  timeframes: %s", joinList(config.timeframes).c_str());
    LOG_INFO(kLogCategory, "  cache capacity: %zu", config.cacheCapacity);
    LOG_INFO(kLogCategory, "  stream: wss://%s:%s%s", config.wsHost.c_str(), config.wsPort.c_str(), config.wsPath.c_str());
    LOG_INFO(kLogCategory, "  log level: %s", logging::Log::level_to_string(logging::Log::get_log_level()));

    int exitCode = EXIT_SUCCESS;
    try {
        app::AppContext context(config);

        const auto report = context.bootstrap();
        LOG_INFO(logging::LogCategory::DATA,
                 "history bootstrap: pairs_loaded=%zu pairs_failed=%zu klines=%zu",
                 report.pairsLoaded,
                 report.pairsFailed,
                 report.klinesAccepted);

        context.ingestor().set_on_terminal_failure([](const domain::ConnectionStatus& status) {
            LOG_ERROR(kLogCategory,
                      "stream ingestion terminally failed after %u reconnect attempts: %s",
                      status.reconnectCount,
                      status.lastError.c_str());
            gTerminalFailure.store(true);
        });

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        try {
            context.start_streaming();
        } catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "initial stream connection failed: %s", ex.what());
            context.shutdown();
            logging::Log::flush();
            return EXIT_FAILURE;
        }

        context.start_http();
        LOG_INFO(kLogCategory, "service running");

        while (gSignalStatus == 0 && !gTerminalFailure.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (gTerminalFailure.load()) {
            exitCode = kExitTerminalFailure;
        } else {
            LOG_INFO(kLogCategory, "signal %d received, shutting down", static_cast<int>(gSignalStatus));
        }

        context.shutdown();
        LOG_INFO(kLogCategory, "shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "fatal error: %s", ex.what());
        exitCode = EXIT_FAILURE;
    }

    logging::Log::flush();
    return exitCode;
}
