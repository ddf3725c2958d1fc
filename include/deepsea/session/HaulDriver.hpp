#pragma once
// include/deepsea/session/HaulDriver.hpp
//
// Fixed decision rule used by deepsea_sim: descend taking every offered tile
// until carrying `haul` tiles (or the bottom is reached), then turn back and
// ascend. Deterministic for a given seed; not an opponent AI.

#include "deepsea/dive/DiveSnapshot.hpp"
#include "deepsea/session/GameSession.hpp"

namespace deepsea::session {

struct Decision {
    dive::DiveAction action = dive::DiveAction::Descend;
    dive::PickupChoice pickup = dive::PickupChoice::Take;
};

class HaulDriver {
public:
    // haul values below 1 are treated as 1.
    explicit HaulDriver(int haul) noexcept : m_haul(haul < 1 ? 1 : haul) {}

    [[nodiscard]] int haul() const noexcept { return m_haul; }

    // Decision for the diver at the cursor of `s`. Requires s.currentDiver.
    [[nodiscard]] Decision decide(const dive::DiveStateSnapshot& s) const;

    // Plays all three dives of a freshly constructed session.
    SessionStandings play(GameSession& session) const;

private:
    int m_haul = 1;
};

} // namespace deepsea::session
