// src/tools/DeepSeaSimMain.cpp
//
// deepsea_sim: runs N headless sessions with the haul-N decision rule and logs
// how often each seat wins. Useful for checking that a tier/oxygen setup is
// balanced before handing it to a front end.

#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Log.h"
#include "deepsea/Errors.hpp"
#include "deepsea/app/SimArgs.hpp"
#include "deepsea/config/SessionConfig.hpp"
#include "deepsea/core/Rng.hpp"
#include "deepsea/session/GameSession.hpp"
#include "deepsea/session/HaulDriver.hpp"

namespace {

constexpr int kDefaultSessions = 100;
constexpr int kDefaultHaul = 2;

[[nodiscard]] deepsea::config::SessionConfig DefaultConfig()
{
    deepsea::config::SessionConfig cfg;
    cfg.divers = { "Red", "Blue", "Green", "Yellow" };
    return cfg;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace deepsea;

    const app::SimArgs args = app::ParseSimArgs(argc, argv);
    if (args.showHelp)
    {
        std::fputs(app::BuildSimHelpText().c_str(), stdout);
        return 0;
    }

    logsys::Options logOpts;
    if (args.logFile)
        logOpts.logFile = *args.logFile;
    if (args.logLevel)
        logOpts.level = spdlog::level::from_str(*args.logLevel);
    logsys::init(logOpts);

    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            DEEPSEA_LOG_ERROR("Unknown or malformed option: %s", u.c_str());
        std::fputs(app::BuildSimHelpText().c_str(), stderr);
        return 2;
    }

    try
    {
        config::SessionConfig cfg = args.config ? config::LoadSessionConfig(*args.config) : DefaultConfig();
        if (args.seed)
            cfg.seed = static_cast<std::uint64_t>(*args.seed);

        const int sessions = args.sessions.value_or(kDefaultSessions);
        const session::HaulDriver driver(args.haul.value_or(kDefaultHaul));

        DEEPSEA_LOG_INFO("Running %d session(s), haul %d, config %s",
                         sessions, driver.haul(),
                         config::SessionConfigToJson(cfg).dump().c_str());

        std::vector<int> wins(cfg.divers.size(), 0);
        std::vector<long long> points(cfg.divers.size(), 0);
        int draws = 0;

        for (int i = 0; i < sessions; ++i)
        {
            config::SessionConfig run = cfg;
            run.seed = rng::derive(cfg.seed, static_cast<std::uint64_t>(i));

            session::GameSession game(run);
            const session::SessionStandings standings = driver.play(game);

            if (standings.winner)
                ++wins[static_cast<std::size_t>(*standings.winner)];
            else
                ++draws;

            for (const auto& s : standings.divers)
                points[static_cast<std::size_t>(s.id)] += s.totalScore;

            if (args.dumpSnapshots)
                DEEPSEA_LOG_INFO("Session %d final dive: %s", i, nlohmann::json(game.snapshot()).dump().c_str());
        }

        for (std::size_t d = 0; d < cfg.divers.size(); ++d)
        {
            const double avg = sessions > 0 ? static_cast<double>(points[d]) / sessions : 0.0;
            DEEPSEA_LOG_INFO("%-10s wins %5d  avg score %6.2f", cfg.divers[d].c_str(), wins[d], avg);
        }
        DEEPSEA_LOG_INFO("Draws: %d", draws);
    }
    catch (const ConfigurationError& e)
    {
        DEEPSEA_LOG_CRITICAL("Configuration error: %s", e.what());
        return 1;
    }
    catch (const InvalidActionError& e)
    {
        DEEPSEA_LOG_CRITICAL("Driver made an illegal decision (%s): %s", ActionErrorName(e.code()), e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
