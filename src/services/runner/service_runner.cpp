/// @file service_runner.cpp
/// @brief Signal latch, config path resolution and RunnerConfig loading.

#include "tadv/service/service_runner.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "tadv/foundation/config_manager.hpp"
#include "tadv/foundation/game_logger.hpp"

namespace tadv::service {

using tadv::foundation::ConfigManager;
using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameLogger;
using tadv::foundation::GameResult;
using tadv::foundation::LogCategory;
using tadv::foundation::LogContext;
using tadv::foundation::LogLevel;

// -- ShutdownSignal ----------------------------------------------------------

volatile std::sig_atomic_t ShutdownSignal::raised_ = 0;

void ShutdownSignal::onSignal(int /*signal*/) {
    raised_ = 1;
}

namespace {

void install(int signal, const struct sigaction& action, struct sigaction* previous) {
    if (sigaction(signal, &action, previous) != 0) {
        LogContext ctx;
        ctx.extra["signal"] = std::to_string(signal);
        GameLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Core,
                                              "signal handler not installed", ctx);
    }
}

}  // namespace

ShutdownSignal::ShutdownSignal() {
    raised_ = 0;

    struct sigaction action {};
    action.sa_handler = &ShutdownSignal::onSignal;
    sigemptyset(&action.sa_mask);
    install(SIGINT, action, &previousInt_);
    install(SIGTERM, action, &previousTerm_);
}

ShutdownSignal::~ShutdownSignal() {
    install(SIGINT, previousInt_, nullptr);
    install(SIGTERM, previousTerm_, nullptr);
}

bool ShutdownSignal::raised() const noexcept {
    return raised_ != 0;
}

// -- Config path -------------------------------------------------------------

std::filesystem::path resolveConfigPath(int argc, char* argv[],
                                        const std::filesystem::path& fallback) {
    constexpr std::string_view kFlag = "--config";

    std::filesystem::path chosen;
    const char* origin = "default";

    for (int i = 1; i < argc && chosen.empty(); ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kFlag && i + 1 < argc) {
            chosen = argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg.size() > kFlag.size() + 1 && arg.substr(0, kFlag.size()) == kFlag &&
                   arg[kFlag.size()] == '=') {
            chosen = std::string(arg.substr(kFlag.size() + 1));
        }
    }
    if (!chosen.empty()) {
        origin = "command line";
    } else if (const char* env = std::getenv("TADV_CONFIG_PATH"); env != nullptr && *env != '\0') {
        chosen = env;
        origin = "TADV_CONFIG_PATH";
    } else {
        chosen = fallback;
    }

    LogContext ctx;
    ctx.extra["path"] = chosen.string();
    ctx.extra["from"] = origin;
    GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Config,
                                          "config path resolved", ctx);
    return chosen;
}

// -- RunnerConfig ------------------------------------------------------------

namespace {

GameResult<RunnerConfig> invalidRunner(std::string message) {
    return GameResult<RunnerConfig>::err(
        GameError(ErrorCode::InvalidConfiguration, std::move(message)));
}

}  // namespace

GameResult<RunnerConfig> loadRunnerConfig(const std::filesystem::path& path) {
    ConfigManager config;
    auto loaded = config.load(path);
    if (!loaded) {
        return GameResult<RunnerConfig>::err(loaded.error());
    }

    auto logging = GameLogger::instance().configure(config);
    if (!logging) {
        return GameResult<RunnerConfig>::err(logging.error());
    }

    auto host = readHostConfig(config);
    if (!host) {
        return GameResult<RunnerConfig>::err(host.error());
    }

    RunnerConfig runner;
    runner.host = std::move(host).value();

    auto frameRate = config.readInto("host.frame_rate", runner.frameRate);
    if (!frameRate) {
        return GameResult<RunnerConfig>::err(frameRate.error());
    }
    if (runner.frameRate == 0) {
        return invalidRunner("host.frame_rate must be positive");
    }

    std::vector<std::vector<double>> clicks;
    auto clicksRead = config.readInto("demo.clicks", clicks);
    if (!clicksRead) {
        return GameResult<RunnerConfig>::err(clicksRead.error());
    }
    for (std::size_t i = 0; i < clicks.size(); ++i) {
        if (clicks[i].size() != 2) {
            return invalidRunner("demo.clicks[" + std::to_string(i) + "] must be an [x, y] pair");
        }
        runner.clicks.emplace_back(clicks[i][0], clicks[i][1]);
    }

    LogContext ctx;
    ctx.level = runner.host.session.level;
    ctx.extra["source"] = config.source();
    ctx.extra["clicks"] = std::to_string(runner.clicks.size());
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Config,
                                          "configuration loaded", ctx);
    return GameResult<RunnerConfig>::ok(std::move(runner));
}

}  // namespace tadv::service
