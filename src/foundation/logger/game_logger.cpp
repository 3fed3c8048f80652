/// @file game_logger.cpp
/// @brief GameLogger routing to kcenon loggers, and YAML level overrides.

#include "tadv/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <cctype>
#include <string>
#include <utility>

#include "tadv/foundation/config_manager.hpp"

namespace tadv::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toKcenon(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

std::string lowerCase(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::size_t indexOf(LogCategory cat) {
    return static_cast<std::size_t>(cat);
}

/// `[Category] message {entity_id=4, tick=12, level=1, key=value}`
std::string render(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string line;
    line.reserve(msg.size() + 32);
    line.append("[").append(logCategoryName(cat)).append("] ").append(msg);
    if (ctx == nullptr) {
        return line;
    }

    std::string fields;
    auto field = [&fields](std::string_view key, const std::string& value) {
        fields.append(fields.empty() ? "" : ", ").append(key).append("=").append(value);
    };
    if (ctx->entityId && ctx->entityId->isValid()) {
        field("entity_id", std::to_string(ctx->entityId->value()));
    }
    if (ctx->tick) {
        field("tick", std::to_string(*ctx->tick));
    }
    if (ctx->level) {
        field("level", std::to_string(*ctx->level));
    }
    for (const auto& [key, value] : ctx->extra) {
        field(key, value);
    }
    if (!fields.empty()) {
        line.append(" {").append(fields).append("}");
    }
    return line;
}

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    const auto lowered = lowerCase(name);
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// -- Impl --------------------------------------------------------------------

struct GameLogger::Impl {
    std::array<LogLevel, kLogCategoryCount> minLevels{
        LogLevel::Info,   // Core
        LogLevel::Info,   // Session
        LogLevel::Info,   // Player
        LogLevel::Debug,  // Enemy
        LogLevel::Debug,  // Spawn
        LogLevel::Info,   // Host
        LogLevel::Info    // Config
    };

    /// The logger registered as `tadv.<Category>`, or nullptr.
    static std::shared_ptr<kci::ILogger> categoryLogger(LogCategory cat) {
        auto logger = kci::GlobalLoggerRegistry::instance().get_logger(
            "tadv." + std::string(logCategoryName(cat)));
        // The registry hands out a null logger for unknown names; it reports
        // every level, Off included, as disabled.
        if (!logger || !logger->is_enabled(kci::log_level::off)) {
            return nullptr;
        }
        return logger;
    }

    static void emit(LogLevel level, LogCategory cat, const std::string& line) {
        auto logger = categoryLogger(cat);
        if (!logger) {
            logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
        }
        if (logger) {
            // A failed write has nowhere to be reported.
            (void)logger->log(toKcenon(level), line);
        }
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        Impl::emit(level, cat, render(cat, msg, nullptr));
    }
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat, std::string_view msg,
                                const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        Impl::emit(level, cat, render(cat, msg, &ctx));
    }
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (indexOf(cat) < kLogCategoryCount) {
        impl_->minLevels[indexOf(cat)] = minLevel;
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    return indexOf(cat) < kLogCategoryCount ? impl_->minLevels[indexOf(cat)] : LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    const auto minLevel = getCategoryLevel(cat);
    return minLevel != LogLevel::Off && level >= minLevel;
}

GameResult<void> GameLogger::configure(const ConfigManager& config) {
    auto levels = impl_->minLevels;

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        const auto key = "logging." + lowerCase(logCategoryName(cat));
        if (!config.hasKey(key)) {
            continue;
        }
        auto name = config.get<std::string>(key);
        if (!name) {
            return GameResult<void>::err(name.error());
        }
        auto parsed = parseLogLevel(name.value());
        if (!parsed) {
            return GameResult<void>::err(GameError(
                ErrorCode::LoggerLevelUnknown, key + ": unknown log level '" + name.value() + "'"));
        }
        levels[i] = *parsed;
    }

    impl_->minLevels = levels;
    return GameResult<void>::ok();
}

GameResult<void> GameLogger::flush() {
    std::string failed;
    auto flushOne = [&failed](const std::shared_ptr<kci::ILogger>& logger, std::string_view name) {
        if (logger && logger->flush().is_err()) {
            failed.append(failed.empty() ? "" : ", ").append(name);
        }
    };

    flushOne(kci::GlobalLoggerRegistry::instance().get_default_logger(), "default");
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        flushOne(Impl::categoryLogger(cat), logCategoryName(cat));
    }

    if (!failed.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush: " + failed));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger logger;
    return logger;
}

}  // namespace tadv::foundation
