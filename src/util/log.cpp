#include "util/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "util/text.hpp"
#include "util/time.hpp"

namespace kbengine::log {
namespace {

struct LoggerState {
    std::mutex mutex;
    Sink sink;
    std::atomic<int> min_level{static_cast<int>(Level::Info)};
};

LoggerState& state() {
    static LoggerState logger;
    return logger;
}

void console_sink(Level level, std::string_view line) {
    auto& stream = (level == Level::Error) ? std::cerr : std::cout;
    stream << line << std::endl;
}

}  // namespace

Level parse_level(std::string_view value) {
    const std::string normalized = text::to_lower_ascii(text::trim(value));
    if (normalized == "info") {
        return Level::Info;
    }
    if (normalized == "warn" || normalized == "warning") {
        return Level::Warn;
    }
    if (normalized == "error") {
        return Level::Error;
    }
    throw ConfigurationError("unknown log level: " + std::string{value});
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

void set_min_level(Level level) { state().min_level.store(static_cast<int>(level)); }

Level min_level() { return static_cast<Level>(state().min_level.load()); }

void set_sink(Sink sink) {
    auto& logger = state();
    std::lock_guard<std::mutex> lock(logger.mutex);
    logger.sink = std::move(sink);
}

void write(Level level, std::string_view message) {
    auto& logger = state();
    if (static_cast<int>(level) < logger.min_level.load()) {
        return;
    }

    std::string line;
    line.append("[").append(time::current_time_iso8601()).append("][").append(to_string(level)).append("] ");
    line.append(message);

    Sink sink;
    {
        std::lock_guard<std::mutex> lock(logger.mutex);
        if (!logger.sink) {
            console_sink(level, line);
            return;
        }
        sink = logger.sink;
    }
    // Called unlocked so a sink may itself log.
    sink(level, line);
}

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace kbengine::log
