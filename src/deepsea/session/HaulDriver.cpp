#include "deepsea/session/HaulDriver.hpp"

#include <algorithm>
#include <string>

#include "deepsea/Errors.hpp"

namespace deepsea::session {

Decision HaulDriver::decide(const dive::DiveStateSnapshot& s) const
{
    if (!s.currentDiver)
        throw InvalidActionError(ActionError::DiveOver, "no diver to act");

    auto it = std::find_if(s.divers.begin(), s.divers.end(),
                           [&](const dive::DiverView& v) { return v.id == *s.currentDiver; });
    if (it == s.divers.end())
        throw InvalidActionError(ActionError::UnknownDiver, "diver " + std::to_string(*s.currentDiver));

    const dive::DiverView& d = *it;
    const int carried = static_cast<int>(d.carried.size());

    if (d.returning)
        return Decision{ dive::DiveAction::Ascend, dive::PickupChoice::Leave };

    if (carried >= m_haul || (carried > 0 && d.position >= s.trackLength))
        return Decision{ dive::DiveAction::BeginReturn, dive::PickupChoice::Leave };

    // Empty-handed at the bottom: nothing left to gain by moving.
    if (d.position >= s.trackLength)
        return Decision{ dive::DiveAction::Pass, dive::PickupChoice::Leave };

    return Decision{ dive::DiveAction::Descend, dive::PickupChoice::Take };
}

SessionStandings HaulDriver::play(GameSession& session) const
{
    for (int round = session.completedDives() + 1; round <= GameSession::kDiveCount; ++round)
    {
        dive::DiveStateSnapshot s = session.startDive(round);
        while (s.state == dive::DiveState::Diving)
        {
            const Decision d = decide(s);
            s = session.submitDecision(*s.currentDiver, d.action, d.pickup);
        }
    }
    return session.getSessionStandings();
}

} // namespace deepsea::session
