/// @file codec_logger.cpp
/// @brief CodecLogger implementation wrapping kcenon logger_system.

#include "csb/foundation/codec_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace csb::foundation {

// ---------------------------------------------------------------------------
// Level mapping: CSB -> kcenon
// ---------------------------------------------------------------------------
static kcenon::common::interfaces::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kcenon::common::interfaces::log_level::trace;
        case LogLevel::Debug:    return kcenon::common::interfaces::log_level::debug;
        case LogLevel::Info:     return kcenon::common::interfaces::log_level::info;
        case LogLevel::Warning:  return kcenon::common::interfaces::log_level::warning;
        case LogLevel::Error:    return kcenon::common::interfaces::log_level::error;
        case LogLevel::Critical: return kcenon::common::interfaces::log_level::critical;
        case LogLevel::Off:      return kcenon::common::interfaces::log_level::off;
    }
    return kcenon::common::interfaces::log_level::info;
}

// ---------------------------------------------------------------------------
// Default log levels per category
// ---------------------------------------------------------------------------
static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Warning,  // Encode
    LogLevel::Warning,  // Decode
    LogLevel::Info      // Config
};

// ---------------------------------------------------------------------------
// Message layout
//
//   [Category] message
//   [Category] backend@depth[index] message {key=val, ...}
// ---------------------------------------------------------------------------

/// Frame position of a codec event, e.g. "json@2[7]". Empty when the
/// context names no backend, depth or index.
static std::string formatPosition(const LogContext& ctx) {
    std::string pos = ctx.backend.value_or("");
    if (ctx.depth) {
        pos += '@';
        pos += std::to_string(*ctx.depth);
    }
    if (ctx.index) {
        pos += '[';
        pos += std::to_string(*ctx.index);
        pos += ']';
    }
    return pos;
}

/// Free-form fields in key order, so equal contexts format identically.
static std::string formatExtra(const LogContext& ctx) {
    std::vector<std::pair<std::string_view, std::string_view>> fields(ctx.extra.begin(),
                                                                      ctx.extra.end());
    std::sort(fields.begin(), fields.end());

    std::string out;
    for (const auto& [key, val] : fields) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key;
        out += '=';
        out += val;
    }
    return out;
}

static std::string composeMessage(LogCategory cat, std::string_view msg,
                                  const LogContext* ctx) {
    std::string formatted;
    formatted.reserve(msg.size() + 32);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    if (ctx == nullptr) {
        formatted += msg;
        return formatted;
    }

    auto pos = formatPosition(*ctx);
    if (!pos.empty()) {
        formatted += pos;
        formatted += ' ';
    }
    formatted += msg;
    auto extra = formatExtra(*ctx);
    if (!extra.empty()) {
        formatted += " {";
        formatted += extra;
        formatted += '}';
    }
    return formatted;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct CodecLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("csb.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kcenon::common::interfaces::ILogger> getLogger(
        LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kcenon::common::interfaces::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first, default logger as fallback
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A NullLogger reports every level, even off, as disabled
        if (!logger->is_enabled(kcenon::common::interfaces::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger->is_enabled(kcenon::common::interfaces::log_level::off)
                || defaultLogger != kcenon::common::interfaces::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
CodecLogger::CodecLogger() : impl_(std::make_unique<Impl>()) {}

CodecLogger::~CodecLogger() = default;

CodecLogger::CodecLogger(CodecLogger&&) noexcept = default;
CodecLogger& CodecLogger::operator=(CodecLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void CodecLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->getLogger(cat)->log(mapLevel(level), composeMessage(cat, msg, nullptr));
}

void CodecLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->getLogger(cat)->log(mapLevel(level), composeMessage(cat, msg, &ctx));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void CodecLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel CodecLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool CodecLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
CodecResult<void> CodecLogger::flush() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return CodecResult<void>::err(
            CodecError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return CodecResult<void>::ok();
}

// ---------------------------------------------------------------------------
// instance()
// ---------------------------------------------------------------------------
CodecLogger& CodecLogger::instance() {
    static CodecLogger inst;
    return inst;
}

} // namespace csb::foundation
