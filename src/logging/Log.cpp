#include "logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace logging {
namespace {

constexpr std::size_t kLineBufferSize = 1024;
constexpr std::size_t kQueueCapacity = 4096;
constexpr std::uintmax_t kDebugFileMaxBytes = 8U * 1024U * 1024U;
constexpr auto kFlushTimeout = std::chrono::seconds(2);

struct Record {
    config::LogLevel level{config::LogLevel::Info};
    LogCategory category{LogCategory::NET};
    std::chrono::system_clock::time_point when{};
    std::string text;
};

bool isDebugLevel(config::LogLevel level) {
    return level == config::LogLevel::Debug || level == config::LogLevel::Trace;
}

// Debug/trace sink. Rolls over to "<path>.1" once the file would exceed its budget.
class RotatingFile {
public:
    explicit RotatingFile(std::filesystem::path path)
        : path_(std::move(path)) {}

    void set_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = enabled;
        if (!enabled_) {
            close_unlocked();
        }
    }

    bool write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return false;
        }
        const std::uintmax_t lineBytes = line.size() + 1;
        if (out_.is_open() && written_ + lineBytes > kDebugFileMaxBytes) {
            roll_unlocked();
        }
        if (!out_.is_open() && !open_unlocked()) {
            return false;
        }
        out_ << line << '\n';
        out_.flush();
        written_ += lineBytes;
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_unlocked();
    }

private:
    bool open_unlocked() {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
        }
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            return false;
        }
        const auto existing = std::filesystem::file_size(path_, ec);
        written_ = ec ? 0 : existing;
        if (written_ >= kDebugFileMaxBytes) {
            roll_unlocked();
            out_.open(path_, std::ios::out | std::ios::app);
        }
        return static_cast<bool>(out_);
    }

    void roll_unlocked() {
        close_unlocked();
        auto backup = path_;
        backup += ".1";
        std::error_code ec;
        std::filesystem::remove(backup, ec);
        std::filesystem::rename(path_, backup, ec);
    }

    void close_unlocked() {
        if (out_.is_open()) {
            out_.flush();
            out_.close();
        }
        written_ = 0;
    }

    const std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
    std::uintmax_t written_{0};
    bool enabled_{false};
};

std::string render(const Record& record) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(record.when.time_since_epoch()).count();
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    char stamp[40];
    std::snprintf(stamp,
                  sizeof(stamp),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900,
                  utc.tm_mon + 1,
                  utc.tm_mday,
                  utc.tm_hour,
                  utc.tm_min,
                  utc.tm_sec,
                  static_cast<int>(ms % 1000));

    std::string line(stamp);
    line += " [";
    line += Log::level_to_string(record.level);
    line += "] [";
    line += Log::category_to_string(record.category);
    line += "] ";
    line += record.text;
    return line;
}

void emit(FILE* stream, const std::string& line) {
    std::fprintf(stream, "%s\n", line.c_str());
    std::fflush(stream);
}

// Bounded queue drained by one writer thread. Started on first use and
// stopped from an atexit hook so late records still reach their sink.
class AsyncWriter {
public:
    static AsyncWriter& instance() {
        static AsyncWriter writer;
        return writer;
    }

    void set_debug_file(bool enabled) { debugFile_.set_enabled(enabled); }

    bool submit(Record&& record) {
        start_once();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || queue_.size() >= kQueueCapacity) {
                return false;
            }
            queue_.push_back(std::move(record));
        }
        wake_.notify_one();
        return true;
    }

    void write(const Record& record) {
        const std::string line = render(record);
        if (isDebugLevel(record.level)) {
            if (!debugFile_.write(line)) {
                emit(stdout, line);
            }
            return;
        }
        emit(record.level == config::LogLevel::Info ? stdout : stderr, line);
    }

    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        idle_.wait_for(lock, kFlushTimeout, [this] { return stopping_ || (queue_.empty() && !writing_); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        debugFile_.close();
    }

private:
    AsyncWriter()
        : debugFile_("./logs/mse-debug.log") {}

    void start_once() {
        std::call_once(started_, [this] {
            thread_ = std::thread([this] { run(); });
            std::atexit([] { AsyncWriter::instance().stop(); });
        });
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            Record record = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
            lock.unlock();
            write(record);
            lock.lock();
            writing_ = false;
            if (queue_.empty()) {
                idle_.notify_all();
            }
        }
        idle_.notify_all();
    }

    RotatingFile debugFile_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<Record> queue_;
    std::once_flag started_;
    std::thread thread_;
    bool stopping_{false};
    bool writing_{false};
};

}  // namespace

Throttle::Throttle(std::chrono::milliseconds interval)
    : interval_(interval) {}

bool Throttle::admit(std::uint64_t& suppressedOut) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (admittedOnce_ && now - lastAdmitted_ < interval_) {
        ++suppressed_;
        return false;
    }
    admittedOnce_ = true;
    lastAdmitted_ = now;
    suppressedOut = suppressed_;
    suppressed_ = 0;
    return true;
}

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
    AsyncWriter::instance().set_debug_file(isDebugLevel(level));
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

bool Log::try_parse_log_level(std::string_view value, config::LogLevel& levelOut) {
    std::string name(value);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    static constexpr std::array<std::pair<std::string_view, config::LogLevel>, 6> kNames{{
        {"trace", config::LogLevel::Trace},
        {"debug", config::LogLevel::Debug},
        {"info", config::LogLevel::Info},
        {"warn", config::LogLevel::Warn},
        {"warning", config::LogLevel::Warn},
        {"error", config::LogLevel::Error},
    }};
    for (const auto& entry : kNames) {
        if (entry.first == name) {
            levelOut = entry.second;
            return true;
        }
    }
    return false;
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::CACHE:
        return "CACHE";
    case LogCategory::INDICATOR:
        return "INDICATOR";
    case LogCategory::API:
        return "API";
    }
    return "UNKNOWN";
}

bool Log::enabled(config::LogLevel level) {
    return config::logLevelSeverity(level) >= config::logLevelSeverity(currentLevel.load(std::memory_order_relaxed));
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, nullptr, fmt, args);
    va_end(args);
}

void Log::throttled(Throttle& throttle, config::LogLevel level, LogCategory category, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }
    std::uint64_t suppressed = 0;
    if (!throttle.admit(suppressed)) {
        return;
    }

    char suffix[64] = {0};
    if (suppressed > 0) {
        std::snprintf(suffix,
                      sizeof(suffix),
                      " (%llu similar suppressed)",
                      static_cast<unsigned long long>(suppressed));
    }
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, suffix, fmt, args);
    va_end(args);
}

void Log::flush() {
    AsyncWriter::instance().drain();
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* suffix, const char* fmt, std::va_list args) {
    std::array<char, kLineBufferSize> buffer{};
    const int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);

    Record record;
    record.level = level;
    record.category = category;
    record.when = std::chrono::system_clock::now();
    if (written < 0) {
        record.text = "<format-error>";
    } else if (static_cast<std::size_t>(written) >= buffer.size()) {
        record.text.assign(buffer.data(), buffer.size() - 4);
        record.text += "...";
    } else {
        record.text.assign(buffer.data(), static_cast<std::size_t>(written));
    }
    if (suffix != nullptr) {
        record.text += suffix;
    }

    auto& writer = AsyncWriter::instance();
    const bool urgent = level == config::LogLevel::Error || level == config::LogLevel::Warn;
    Record fallback;
    if (urgent) {
        fallback = record;
    }
    // A saturated queue drops low-severity records; warnings and errors are written inline.
    if (!writer.submit(std::move(record)) && urgent) {
        writer.write(fallback);
    }
}

}  // namespace logging
