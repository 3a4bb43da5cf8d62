#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

#include "logging/Log.h"

int main() {
    // One message per interval; the next admitted one reports how many were held back.
    {
        logging::Throttle throttle(std::chrono::milliseconds(200));
        std::uint64_t suppressed = 99;
        if (!throttle.admit(suppressed) || suppressed != 0) {
            std::cerr << "Expected the first message to pass with nothing suppressed\n";
            return 1;
        }
        std::uint64_t ignored = 0;
        if (throttle.admit(ignored) || throttle.admit(ignored) || throttle.admit(ignored)) {
            std::cerr << "Expected messages inside the interval to be held back\n";
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        if (!throttle.admit(suppressed) || suppressed != 3) {
            std::cerr << "Expected three suppressed messages after the interval, got " << suppressed << "\n";
            return 1;
        }
    }

    // Level names parse case-insensitively and "warning" aliases warn.
    {
        config::LogLevel level = config::LogLevel::Info;
        if (!logging::Log::try_parse_log_level("DEBUG", level) || level != config::LogLevel::Debug ||
            !logging::Log::try_parse_log_level("warning", level) || level != config::LogLevel::Warn) {
            std::cerr << "Expected level names to parse\n";
            return 1;
        }
        if (logging::Log::try_parse_log_level("verbose", level) || level != config::LogLevel::Warn) {
            std::cerr << "Expected unknown level to be rejected without touching the output\n";
            return 1;
        }
    }

    // Messages below the active level are dropped; flush returns once the writer is idle.
    {
        logging::Log::set_log_level(config::LogLevel::Error);
        logging::Throttle throttle(std::chrono::seconds(60));
        LOG_WARN_THROTTLED(throttle, logging::LogCategory::DATA, "dropped %d", 1);
        std::uint64_t suppressed = 0;
        if (!throttle.admit(suppressed)) {
            std::cerr << "Expected a disabled level not to consume the throttle\n";
            return 1;
        }
        logging::Log::set_log_level(config::LogLevel::Info);
        LOG_INFO(logging::LogCategory::API, "test_logging %s", "writer alive");
        logging::Log::flush();
    }

    std::cout << "test_logging passed\n";
    return 0;
}
