#pragma once
// include/deepsea/session/GameSession.hpp
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "deepsea/config/SessionConfig.hpp"
#include "deepsea/core/Rng.hpp"
#include "deepsea/dive/DiveEngine.hpp"
#include "deepsea/dive/Diver.hpp"

namespace deepsea::session {

using dive::DiverId;

struct Standing {
    DiverId id = 0;
    std::string name;
    int totalScore = 0;

    // tierCounts[t - 1] = tiles of tier t banked over the whole game.
    std::vector<int> tierCounts;
};

struct SessionStandings {
    std::vector<Standing> divers;

    // Set when exactly one diver wins after the tie-break.
    std::optional<DiverId> winner;

    // Every diver sharing the best score and tier profile (one entry when there is a winner).
    std::vector<DiverId> leaders;

    [[nodiscard]] bool isDraw() const noexcept { return !winner.has_value(); }
};

// Highest total score wins; ties are broken by comparing banked tile counts
// tier by tier from the deepest tier down. Anything still level is a draw.
[[nodiscard]] SessionStandings DecideWinner(std::vector<Standing> standings);

// Three dives in sequence over one set of divers.
//
//   GameSession s(cfg);
//   s.startDive(1);
//   while (s.isDiving()) s.submitDecision(*s.snapshot().currentDiver, ...);
//   ... dives 2 and 3 ...
//   s.getSessionStandings();
class GameSession {
public:
    static constexpr int kDiveCount = 3;

    // Validates the configuration up front (ConfigurationError) and seeds the dice
    // from cfg.seed.
    explicit GameSession(config::SessionConfig cfg);

    // Same, with an explicit dice source (tests use a scripted one).
    GameSession(config::SessionConfig cfg, std::unique_ptr<rng::RandomSource> dice);

    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // roundNumber must be the next dive (1, 2, 3) and no dive may be running.
    dive::DiveStateSnapshot startDive(int roundNumber);

    // Forwards to the running dive. When the decision ends the dive, its banked
    // tiles are tallied into the session before returning.
    dive::DiveStateSnapshot submitDecision(DiverId diver,
                                           dive::DiveAction action,
                                           std::optional<dive::PickupChoice> pickup = std::nullopt);

    // Result of the most recent finished dive.
    [[nodiscard]] const dive::DiveResult& getDiveResult() const;

    // Valid once the third dive has ended.
    [[nodiscard]] SessionStandings getSessionStandings() const;

    // Snapshot of the running (or last) dive.
    [[nodiscard]] dive::DiveStateSnapshot snapshot() const;

    [[nodiscard]] int roundNumber() const noexcept { return m_round; }
    [[nodiscard]] int completedDives() const noexcept { return static_cast<int>(m_history.size()); }
    [[nodiscard]] bool isDiving() const noexcept { return m_dive && !m_dive->isOver(); }
    [[nodiscard]] bool isOver() const noexcept { return completedDives() >= kDiveCount; }

    [[nodiscard]] const std::vector<dive::Diver>& divers() const noexcept { return m_divers; }
    [[nodiscard]] const std::vector<dive::DiveResult>& history() const noexcept { return m_history; }
    [[nodiscard]] const dive::DiveEngine* currentDive() const noexcept { return m_dive.get(); }
    [[nodiscard]] const config::SessionConfig& config() const noexcept { return m_cfg; }

    // Banked tile counts per tier for one diver (index tier - 1).
    [[nodiscard]] const std::vector<int>& tierCounts(DiverId diver) const;

private:
    void recordDive(const dive::DiveResult& result);

    config::SessionConfig m_cfg;
    std::unique_ptr<rng::RandomSource> m_dice;

    std::vector<dive::Diver> m_divers;

    // Parallel to m_divers.
    std::vector<std::vector<int>> m_tierCounts;

    int m_round = 0;
    std::unique_ptr<dive::DiveEngine> m_dive;
    std::vector<dive::DiveResult> m_history;
};

} // namespace deepsea::session
