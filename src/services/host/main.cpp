/// @file main.cpp
/// @brief Headless Turtle Adventure entry point.
///
/// Loads the YAML configuration, replays the scripted clicks from
/// `demo.clicks`, and paces the GameHost with a GameLoop until the level
/// ends or a shutdown signal arrives. Exits 0 on a win and 2 on a loss.

#include <cstdlib>
#include <iostream>
#include <string>

#include "tadv/foundation/game_logger.hpp"
#include "tadv/service/game_host.hpp"
#include "tadv/service/game_loop.hpp"
#include "tadv/service/service_runner.hpp"

namespace {

constexpr int kExitLost = 2;

int exitCodeFor(tadv::game::GameOutcome outcome) {
    return outcome == tadv::game::GameOutcome::Won ? EXIT_SUCCESS : kExitLost;
}

} // namespace

int main(int argc, char* argv[]) {
    using tadv::foundation::LogCategory;

    tadv::service::ShutdownSignal shutdown;

    auto configPath =
        tadv::service::resolveConfigPath(argc, argv, "config/turtle_adventure.yaml");
    auto runnerCfg = tadv::service::loadRunnerConfig(configPath);
    if (!runnerCfg) {
        std::cerr << "Failed to load config: " << runnerCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = runnerCfg.value();

    tadv::service::GameHost host(cfg.host);
    host.onLevelStarted().connect([](uint32_t level) {
        std::cout << "Level " << level << "\n";
    });
    host.onGameOver().connect([](tadv::game::GameOutcome outcome, uint32_t level) {
        std::cout << tadv::game::outcomeName(outcome) << " (level " << level << ")\n";
    });

    auto startResult = host.start();
    if (!startResult) {
        std::cerr << "Failed to start game host: "
                  << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    for (const auto& click : cfg.clicks) {
        auto clickResult = host.click(click.x, click.y);
        if (!clickResult) {
            std::cerr << "Failed to queue click: "
                      << clickResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    tadv::service::GameLoop loop(cfg.frameRate);
    loop.setFrameCallback([&host](std::chrono::microseconds dt) { host.advance(dt); });
    auto frames = loop.run([&] { return host.isFinished() || shutdown.raised(); });

    auto* session = host.session();
    auto outcome = session->GetOutcome();
    if (!outcome) {
        TADV_LOG_INFO(LogCategory::Core,
                      "stopped before the level ended after " + std::to_string(frames) +
                          " frames");
        return EXIT_FAILURE;
    }

    TADV_LOG_INFO(LogCategory::Core,
                  std::string("finished: ") + std::string(tadv::game::outcomeName(*outcome)) +
                      " after " + std::to_string(session->GetTickCount()) + " ticks");
    return exitCodeFor(*outcome);
}
