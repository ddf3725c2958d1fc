#include "deepsea/session/GameSession.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include "core/Log.h"
#include "deepsea/Errors.hpp"

namespace deepsea::session {

namespace {

// true if a ranks strictly above b.
[[nodiscard]] bool Outranks(const Standing& a, const Standing& b) noexcept
{
    if (a.totalScore != b.totalScore)
        return a.totalScore > b.totalScore;

    const std::size_t tiers = std::max(a.tierCounts.size(), b.tierCounts.size());
    for (std::size_t i = tiers; i-- > 0;)
    {
        const int ca = i < a.tierCounts.size() ? a.tierCounts[i] : 0;
        const int cb = i < b.tierCounts.size() ? b.tierCounts[i] : 0;
        if (ca != cb)
            return ca > cb;
    }
    return false;
}

} // namespace

SessionStandings DecideWinner(std::vector<Standing> standings)
{
    SessionStandings out;

    // Best first; equal entries keep seating order.
    std::stable_sort(standings.begin(), standings.end(), Outranks);
    out.divers = std::move(standings);

    if (out.divers.empty())
        return out;

    const Standing& best = out.divers.front();
    for (const Standing& s : out.divers)
    {
        if (!Outranks(best, s))
            out.leaders.push_back(s.id);
    }

    if (out.leaders.size() == 1)
        out.winner = out.leaders.front();
    return out;
}

GameSession::GameSession(config::SessionConfig cfg)
    : GameSession(cfg, std::make_unique<rng::Pcg32Source>(cfg.seed))
{
}

GameSession::GameSession(config::SessionConfig cfg, std::unique_ptr<rng::RandomSource> dice)
    : m_cfg(std::move(cfg))
    , m_dice(std::move(dice))
{
    config::ValidateSessionConfig(m_cfg);
    if (!m_dice)
        throw ConfigurationError("GameSession: no dice source");

    m_divers.reserve(m_cfg.divers.size());
    for (std::size_t i = 0; i < m_cfg.divers.size(); ++i)
        m_divers.emplace_back(static_cast<DiverId>(i), m_cfg.divers[i]);

    m_tierCounts.assign(m_divers.size(), std::vector<int>(m_cfg.tiers.size(), 0));

    DEEPSEA_LOG_INFO("Session created: %zu diver(s), oxygen %d, %dd%d, seed %llu",
                     m_divers.size(), m_cfg.oxygenMax, m_cfg.diceCount, m_cfg.diceFaces,
                     static_cast<unsigned long long>(m_cfg.seed));
}

GameSession::~GameSession() = default;

dive::DiveStateSnapshot GameSession::startDive(int roundNumber)
{
    if (isDiving())
        throw InvalidActionError(ActionError::DiveInProgress, "dive " + std::to_string(m_round) + " is still running");
    if (isOver())
        throw InvalidActionError(ActionError::SessionOver, "all " + std::to_string(kDiveCount) + " dives are done");
    if (roundNumber != completedDives() + 1)
    {
        throw InvalidActionError(ActionError::WrongRound,
                                 "expected dive " + std::to_string(completedDives() + 1)
                                 + ", got " + std::to_string(roundNumber));
    }

    dive::DiveSetup setup;
    setup.round = roundNumber;
    setup.oxygenMax = m_cfg.oxygenMax;
    setup.diceCount = m_cfg.diceCount;
    setup.diceFaces = m_cfg.diceFaces;
    setup.tiers = m_cfg.tiers;
    setup.deckSeed = rng::derive(m_cfg.seed, static_cast<std::uint64_t>(roundNumber));
    setup.treasureSlowsMovement = m_cfg.treasureSlowsMovement;
    setup.firstDiver = static_cast<std::size_t>(roundNumber - 1) % m_divers.size();

    m_dive = std::make_unique<dive::DiveEngine>(setup, m_divers, *m_dice);
    m_round = roundNumber;
    return m_dive->snapshot();
}

dive::DiveStateSnapshot GameSession::submitDecision(DiverId diver,
                                                    dive::DiveAction action,
                                                    std::optional<dive::PickupChoice> pickup)
{
    if (!isDiving())
        throw InvalidActionError(ActionError::NoDive, "no dive is running");

    dive::DiveStateSnapshot s = m_dive->submitDecision(diver, action, pickup);
    if (m_dive->isOver())
        recordDive(m_dive->result());
    return s;
}

void GameSession::recordDive(const dive::DiveResult& result)
{
    m_history.push_back(result);

    for (const dive::DiverDiveResult& r : result.divers)
    {
        auto& counts = m_tierCounts.at(static_cast<std::size_t>(r.id));
        for (const dive::TreasureTile& t : r.banked)
        {
            if (t.tier >= 1 && static_cast<std::size_t>(t.tier) <= counts.size())
                ++counts[static_cast<std::size_t>(t.tier - 1)];
        }
    }

    if (!isOver())
        return;

    const SessionStandings standings = getSessionStandings();
    if (standings.winner)
    {
        const Standing& w = standings.divers.front();
        DEEPSEA_LOG_INFO("Session over: %s wins with %d", w.name.c_str(), w.totalScore);
    }
    else
    {
        DEEPSEA_LOG_INFO("Session over: draw between %zu diver(s) on %d",
                         standings.leaders.size(), standings.divers.front().totalScore);
    }
}

const dive::DiveResult& GameSession::getDiveResult() const
{
    if (!m_dive)
        throw InvalidActionError(ActionError::NoDive, "no dive has been started");
    return m_dive->result();
}

SessionStandings GameSession::getSessionStandings() const
{
    if (!isOver())
    {
        throw InvalidActionError(ActionError::SessionInProgress,
                                 std::to_string(completedDives()) + " of "
                                 + std::to_string(kDiveCount) + " dives done");
    }

    std::vector<Standing> standings;
    standings.reserve(m_divers.size());
    for (std::size_t i = 0; i < m_divers.size(); ++i)
        standings.push_back(Standing{ m_divers[i].id(), m_divers[i].name(), m_divers[i].totalScore(), m_tierCounts[i] });

    return DecideWinner(std::move(standings));
}

dive::DiveStateSnapshot GameSession::snapshot() const
{
    if (!m_dive)
        throw InvalidActionError(ActionError::NoDive, "no dive has been started");
    return m_dive->snapshot();
}

const std::vector<int>& GameSession::tierCounts(DiverId diver) const
{
    if (diver < 0 || static_cast<std::size_t>(diver) >= m_tierCounts.size())
        throw InvalidActionError(ActionError::UnknownDiver, "diver " + std::to_string(diver));
    return m_tierCounts[static_cast<std::size_t>(diver)];
}

} // namespace deepsea::session
