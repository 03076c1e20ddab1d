#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace vpb::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every line that passes the level threshold. The default sink writes
// Warn/Error to stderr and everything else to stdout.
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

void setSink(Sink sink);
void resetSink();

// Installs a sink for the lifetime of the object and restores the console sink afterwards.
class ScopedSink {
public:
    explicit ScopedSink(Sink sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;
};

}  // namespace vpb::log

#define VPB_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::vpb::log::shouldLog(level)) {                                                \
            std::ostringstream vpb_log_stream__;                                           \
            vpb_log_stream__ << expr;                                                      \
            ::vpb::log::log(level, vpb_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) VPB_LOG_IMPL(::vpb::log::Level::Debug, expr)
#define LOG_INFO(expr) VPB_LOG_IMPL(::vpb::log::Level::Info, expr)
#define LOG_WARN(expr) VPB_LOG_IMPL(::vpb::log::Level::Warn, expr)
#define LOG_ERR(expr) VPB_LOG_IMPL(::vpb::log::Level::Error, expr)
