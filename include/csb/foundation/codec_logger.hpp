#pragma once

/// @file codec_logger.hpp
/// @brief CodecLogger wrapping kcenon logger_system for structured codec logging.
///
/// Provides category-based filtering, structured logging with frame
/// context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "csb/foundation/codec_result.hpp"

namespace csb::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Facade and library-wide events
    Encode = 1, ///< Encoder backends
    Decode = 2, ///< Decoder backends
    Config = 3  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 4;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Encode", "Decode", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// The frame position is written before the message as backend@depth[index]
/// and the extra fields after it as {key=val, ...} in key order:
///   [Decode] binary@2[7] element decode failed {subsystem=Decode}
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.backend = "binary";
///   ctx.depth = 2;
///   ctx.index = 7;
///   logger.logWithContext(LogLevel::Debug, LogCategory::Decode,
///                         "element decode failed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> backend;
    std::optional<std::size_t> depth;
    std::optional<std::size_t> index;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Encode   | Warning       |
/// | Decode   | Warning       |
/// | Config   | Info          |
class CodecLogger {
public:
    CodecLogger();
    ~CodecLogger();

    // Non-copyable, movable.
    CodecLogger(const CodecLogger&) = delete;
    CodecLogger& operator=(const CodecLogger&) = delete;
    CodecLogger(CodecLogger&&) noexcept;
    CodecLogger& operator=(CodecLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    CodecResult<void> flush();

    /// Get the global CodecLogger singleton instance.
    static CodecLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csb::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace — macros are global)
// ---------------------------------------------------------------------------

/// @name CSB_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CSB_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CSB_MIN_LOG_LEVEL
    #define CSB_MIN_LOG_LEVEL 0
#endif

#define CSB_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CSB_MIN_LOG_LEVEL &&                        \
            ::csb::foundation::CodecLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::csb::foundation::CodecLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CSB_LOG_DEBUG(cat, msg) \
    CSB_LOG(::csb::foundation::LogLevel::Debug, (cat), (msg))

#define CSB_LOG_INFO(cat, msg) \
    CSB_LOG(::csb::foundation::LogLevel::Info, (cat), (msg))

#define CSB_LOG_WARN(cat, msg) \
    CSB_LOG(::csb::foundation::LogLevel::Warning, (cat), (msg))

#define CSB_LOG_ERROR(cat, msg) \
    CSB_LOG(::csb::foundation::LogLevel::Error, (cat), (msg))

/// @}
