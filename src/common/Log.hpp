#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace mkt::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every emitted line after level filtering. An empty sink restores
// console output (Warn/Error to stderr, the rest to stdout).
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void setSink(Sink sink);
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace mkt::log

#define MKT_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::mkt::log::shouldLog(level)) {                                                \
            std::ostringstream mkt_log_stream__;                                           \
            mkt_log_stream__ << expr;                                                      \
            ::mkt::log::log(level, mkt_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) MKT_LOG_IMPL(::mkt::log::Level::Debug, expr)
#define LOG_INFO(expr) MKT_LOG_IMPL(::mkt::log::Level::Info, expr)
#define LOG_WARN(expr) MKT_LOG_IMPL(::mkt::log::Level::Warn, expr)
#define LOG_ERR(expr) MKT_LOG_IMPL(::mkt::log::Level::Error, expr)
