#pragma once

/// @file game_logger.hpp
/// @brief Per-category simulation logging on top of kcenon's logger registry.
///
/// Every line is rendered as `[<Category>] <message> {k=v, ...}` and handed to
/// the kcenon logger registered as `tadv.<Category>`, or to the registry's
/// default logger when no such logger exists.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tadv/foundation/game_result.hpp"
#include "tadv/foundation/types.hpp"

namespace tadv::foundation {

class ConfigManager;

/// Severity, in increasing order. Off disables a category entirely.
enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Off
};

/// One category per part of the runtime.
enum class LogCategory : uint8_t {
    Core,     ///< Runner startup and shutdown
    Session,  ///< Tick protocol and terminal state
    Player,   ///< Player and waypoint navigation
    Enemy,    ///< Enemy motion and catches
    Spawn,    ///< Enemy generation
    Host,     ///< Event queue and frame loop
    Config    ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    switch (cat) {
        case LogCategory::Core:    return "Core";
        case LogCategory::Session: return "Session";
        case LogCategory::Player:  return "Player";
        case LogCategory::Enemy:   return "Enemy";
        case LogCategory::Spawn:   return "Spawn";
        case LogCategory::Host:    return "Host";
        case LogCategory::Config:  return "Config";
    }
    return "Unknown";
}

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

/// Parse a level name as written in YAML ("debug", "WARN", "off", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Simulation fields attached to a log line. Unset fields are omitted, as is
/// an invalid entity id.
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<uint64_t> tick;
    std::optional<uint32_t> level;
    std::unordered_map<std::string, std::string> extra;
};

/// Default minimum levels: Enemy and Spawn log at Debug, the rest at Info.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat, std::string_view msg,
                        const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Off for a category outside the enum.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Apply `logging.<category>` keys (lower-case category names, e.g.
    /// `logging.enemy: warning`). Categories without a key keep their level.
    /// @return ConfigTypeMismatch or LoggerLevelUnknown for a bad value; no
    ///         level is changed in that case.
    GameResult<void> configure(const ConfigManager& config);

    /// Flush the default logger and every registered category logger.
    GameResult<void> flush();

    /// Process-wide logger used by the TADV_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace detail {

#ifndef TADV_MIN_LOG_LEVEL
    #define TADV_MIN_LOG_LEVEL 0
#endif

/// False for levels below TADV_MIN_LOG_LEVEL, letting the compiler drop the
/// call (0=Trace ... 6=Off).
constexpr bool compiledIn(LogLevel level) {
    return static_cast<int>(level) >= TADV_MIN_LOG_LEVEL;
}

} // namespace detail

} // namespace tadv::foundation

#define TADV_LOG(level, cat, msg)                                              \
    do {                                                                       \
        if (::tadv::foundation::detail::compiledIn(level)) {                   \
            auto& tadvLogger_ = ::tadv::foundation::GameLogger::instance();    \
            if (tadvLogger_.isEnabled((level), (cat))) {                       \
                tadvLogger_.log((level), (cat), (msg));                        \
            }                                                                  \
        }                                                                      \
    } while (0)

#define TADV_LOG_DEBUG(cat, msg) TADV_LOG(::tadv::foundation::LogLevel::Debug, (cat), (msg))
#define TADV_LOG_INFO(cat, msg) TADV_LOG(::tadv::foundation::LogLevel::Info, (cat), (msg))
#define TADV_LOG_WARN(cat, msg) TADV_LOG(::tadv::foundation::LogLevel::Warning, (cat), (msg))
#define TADV_LOG_ERROR(cat, msg) TADV_LOG(::tadv::foundation::LogLevel::Error, (cat), (msg))
