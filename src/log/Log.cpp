#include "castlink/log/Log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace castlink::log {

namespace {

void consoleSink(Level level, std::string_view message) {
    auto& stream = level == Level::Error ? std::cerr : std::cout;
    stream << message;
    stream.flush();
}

Level initialLevel() {
    const char* env = std::getenv("CASTLINK_LOG_LEVEL");
    if (!env) {
        return Level::Info;
    }
    const std::string_view value(env);
    if (value == "debug") return Level::Debug;
    if (value == "error") return Level::Error;
    return Level::Info;
}

std::atomic<std::uint8_t>& levelStorage() {
    static std::atomic<std::uint8_t> level{static_cast<std::uint8_t>(initialLevel())};
    return level;
}

std::mutex sinkMutex;
LogHandler handler = consoleSink;

} // namespace

const char* toString(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Error: return "error";
    }
    return "unknown";
}

void setLogHandler(LogHandler newHandler) {
    std::lock_guard lock(sinkMutex);
    handler = newHandler ? std::move(newHandler) : LogHandler(consoleSink);
}

void resetLogHandler() {
    setLogHandler({});
}

void setLogLevel(Level level) {
    levelStorage().store(static_cast<std::uint8_t>(level), std::memory_order_relaxed);
}

Level logLevel() {
    return static_cast<Level>(levelStorage().load(std::memory_order_relaxed));
}

bool enabled(Level level) {
    return static_cast<std::uint8_t>(level) >= levelStorage().load(std::memory_order_relaxed);
}

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    LogHandler current;
    {
        std::lock_guard lock(sinkMutex);
        current = handler;
    }
    if (current) {
        current(level, message);
    }
}

} // namespace castlink::log
