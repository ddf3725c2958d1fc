#pragma once
// include/deepsea/dive/DiveEngine.hpp
#include <cstddef>
#include <optional>
#include <vector>

#include "deepsea/core/Rng.hpp"
#include "deepsea/dive/Die.hpp"
#include "deepsea/dive/DiveSnapshot.hpp"
#include "deepsea/dive/Diver.hpp"
#include "deepsea/dive/OxygenTrack.hpp"
#include "deepsea/dive/TreasureDeck.hpp"

namespace deepsea::dive {

// Everything one dive needs besides the divers themselves.
struct DiveSetup {
    int round = 1;
    int oxygenMax = 25;

    int diceCount = 2;
    int diceFaces = Die::kDefaultFaces;

    std::vector<TierSpec> tiers = DefaultTiers();

    // Seeds the per-dive tile shuffle. Kept apart from the dice source so a
    // scripted dice sequence is not consumed by the shuffle.
    rng::Seed deckSeed = 1;

    // Optional rule: movement is reduced by the number of carried tiles.
    bool treasureSlowsMovement = false;

    // Index (into the diver list) of the diver who opens the dive.
    std::size_t firstDiver = 0;
};

// One dive: Diving -> Ended.
//
// Turn protocol for the diver at the cursor:
//  1. the decision is validated; a rejected decision throws InvalidActionError and
//     leaves every piece of state untouched
//  2. oxygen drops by max(1, tiles carried by the acting diver)
//  3. the diver moves by the dice total (down while descending, up while returning,
//     clamped to the track)
//  4. a descending diver landing on an untaken position whose tier still has tiles
//     may take one tile (at most one per turn, none once oxygen is gone)
//  5. a returning diver reaching the submarine banks automatically
//  6. the dive ends when oxygen is exhausted or nobody is left underwater;
//     otherwise the cursor moves to the next active diver
//
// On exhaustion every diver that has not banked is stranded and loses the tiles it carries.
class DiveEngine {
public:
    // Resets every diver for the dive. The random source and the divers must
    // outlive the engine. Throws ConfigurationError on an unusable setup.
    DiveEngine(const DiveSetup& setup, std::vector<Diver>& divers, rng::RandomSource& dice);

    DiveEngine(const DiveEngine&) = delete;
    DiveEngine& operator=(const DiveEngine&) = delete;

    DiveStateSnapshot submitDecision(DiverId diver,
                                     DiveAction action,
                                     std::optional<PickupChoice> pickup = std::nullopt);

    [[nodiscard]] DiveStateSnapshot snapshot() const;

    // Throws InvalidActionError(DiveInProgress) until the dive has ended.
    [[nodiscard]] const DiveResult& result() const;

    [[nodiscard]] DiveState state() const noexcept { return m_state; }
    [[nodiscard]] bool isOver() const noexcept { return m_state == DiveState::Ended; }
    [[nodiscard]] int round() const noexcept { return m_round; }

    [[nodiscard]] std::optional<DiverId> currentDiver() const noexcept;
    [[nodiscard]] const std::vector<DiverId>& turnOrder() const noexcept { return m_turnOrder; }

    [[nodiscard]] const OxygenTrack& oxygen() const noexcept { return m_oxygen; }
    [[nodiscard]] const TreasureDeck& deck() const noexcept { return m_deck; }

    // Tier a descending diver would be offered on `position` right now (0 = no offer).
    [[nodiscard]] int pickupTierAt(int position) const noexcept;

    [[nodiscard]] const std::optional<TurnReport>& lastTurn() const noexcept { return m_lastTurn; }

private:
    [[nodiscard]] Diver* findDiver(DiverId id) noexcept;
    [[nodiscard]] ActionError validate(DiverId id, DiveAction action) const noexcept;

    void resolveTurn(Diver& d, DiveAction action, PickupChoice pickup);
    void advanceCursor();
    void endDive();

    int m_round = 1;
    int m_diceCount = 2;
    bool m_treasureSlowsMovement = false;

    std::vector<Diver>* m_divers = nullptr;

    OxygenTrack m_oxygen;
    TreasureDeck m_deck;
    Die m_die;

    // Position -> tile already taken this dive (index 0 is the submarine).
    std::vector<bool> m_taken;

    // Diver ids in acting order; the cursor indexes into it.
    std::vector<DiverId> m_turnOrder;
    std::size_t m_cursor = 0;

    DiveState m_state = DiveState::Diving;
    std::optional<TurnReport> m_lastTurn;
    DiveResult m_result;
};

} // namespace deepsea::dive
