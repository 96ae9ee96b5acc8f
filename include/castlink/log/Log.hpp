#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace castlink::log {

enum class Level : std::uint8_t {
    Debug = 0,   // per-frame traffic, heartbeats
    Info = 1,
    Error = 2
};

const char* toString(Level level);

/**
 * @brief Receives every message at or above the current level.
 *
 * Messages carry their own trailing newline. The handler may be called from
 * the caller thread, the network thread or a dispatch worker.
 */
using LogHandler = std::function<void(Level, std::string_view)>;

/// Install @p handler; an empty handler restores the console sink
/// (Error to stderr, everything else to stdout).
void setLogHandler(LogHandler handler);
void resetLogHandler();

/**
 * @brief Drop messages below @p level before they are formatted.
 *
 * The initial level is Info, or the value of the CASTLINK_LOG_LEVEL
 * environment variable ("debug", "info" or "error") when it is set.
 */
void setLogLevel(Level level);
Level logLevel();

bool enabled(Level level);

void write(Level level, std::string_view message);

inline void logDebug(std::string_view message) { write(Level::Debug, message); }
inline void logInfo(std::string_view message) { write(Level::Info, message); }
inline void logError(std::string_view message) { write(Level::Error, message); }

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename... Args>
inline void writeFormatted(Level level, Args&&... args) {
    if (!enabled(level)) {
        return;
    }
    write(level, buildLogMessage(std::forward<Args>(args)...));
}

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logDebug(First&& first, Rest&&... rest) {
    detail::writeFormatted(Level::Debug, std::forward<First>(first), std::forward<Rest>(rest)...);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    detail::writeFormatted(Level::Info, std::forward<First>(first), std::forward<Rest>(rest)...);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    detail::writeFormatted(Level::Error, std::forward<First>(first), std::forward<Rest>(rest)...);
}

} // namespace castlink::log

namespace castlink {
using log::LogHandler;
using log::setLogHandler;
using log::resetLogHandler;
using log::setLogLevel;
using log::logDebug;
using log::logInfo;
using log::logError;
} // namespace castlink
