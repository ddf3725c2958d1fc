#include "deepsea/dive/DiveEngine.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "core/Log.h"
#include "deepsea/Errors.hpp"

namespace deepsea::dive {

namespace {

[[nodiscard]] const Diver* FindIn(const std::vector<Diver>& divers, DiverId id) noexcept
{
    auto it = std::find_if(divers.begin(), divers.end(),
                           [id](const Diver& d) { return d.id() == id; });
    return it == divers.end() ? nullptr : &*it;
}

} // namespace

DiveEngine::DiveEngine(const DiveSetup& setup, std::vector<Diver>& divers, rng::RandomSource& dice)
    : m_round(setup.round)
    , m_diceCount(setup.diceCount)
    , m_treasureSlowsMovement(setup.treasureSlowsMovement)
    , m_divers(&divers)
    , m_oxygen(setup.oxygenMax)
    , m_deck(setup.tiers)
    , m_die(dice, setup.diceFaces)
{
    if (divers.empty())
        throw ConfigurationError("DiveEngine: a dive needs at least one diver");
    if (setup.diceCount < 1)
        throw ConfigurationError("DiveEngine: dice count must be >= 1, got " + std::to_string(setup.diceCount));

    rng::Pcg32Source shuffle(setup.deckSeed);
    m_deck.restock(shuffle);

    m_taken.assign(static_cast<std::size_t>(m_deck.trackLength()) + 1u, false);

    const std::size_t n = divers.size();
    const std::size_t first = setup.firstDiver % n;
    m_turnOrder.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        m_turnOrder.push_back(divers[(first + i) % n].id());

    for (Diver& d : divers)
        d.resetForDive();

    m_result.round = m_round;

    DEEPSEA_LOG_INFO("Dive %d begins: oxygen %d, track %d, %zu diver(s), %s opens",
                     m_round, m_oxygen.remaining(), m_deck.trackLength(), n,
                     divers[first].name().c_str());
}

Diver* DiveEngine::findDiver(DiverId id) noexcept
{
    auto it = std::find_if(m_divers->begin(), m_divers->end(),
                           [id](const Diver& d) { return d.id() == id; });
    return it == m_divers->end() ? nullptr : &*it;
}

std::optional<DiverId> DiveEngine::currentDiver() const noexcept
{
    if (m_state == DiveState::Ended || m_turnOrder.empty())
        return std::nullopt;
    return m_turnOrder[m_cursor];
}

int DiveEngine::pickupTierAt(int position) const noexcept
{
    if (m_oxygen.exhausted())
        return 0;
    if (position < 1 || position > m_deck.trackLength())
        return 0;
    if (m_taken[static_cast<std::size_t>(position)])
        return 0;

    const int tier = m_deck.peekNextTier(position);
    return m_deck.remaining(tier) > 0 ? tier : 0;
}

ActionError DiveEngine::validate(DiverId id, DiveAction action) const noexcept
{
    if (m_state == DiveState::Ended)
        return ActionError::DiveOver;

    const Diver* d = FindIn(*m_divers, id);
    if (!d)
        return ActionError::UnknownDiver;
    if (!d->isActive())
        return ActionError::DiverInactive;
    if (currentDiver() != id)
        return ActionError::NotYourTurn;

    switch (action)
    {
    case DiveAction::Descend:
        if (d->isReturning())
            return ActionError::DescendWhileReturning;
        break;
    case DiveAction::Ascend:
        if (!d->isReturning())
            return ActionError::AscendWhileDescending;
        break;
    case DiveAction::BeginReturn:
        return d->canBeginReturn();
    case DiveAction::Pass:
        break;
    }

    return ActionError::None;
}

DiveStateSnapshot DiveEngine::submitDecision(DiverId diver,
                                             DiveAction action,
                                             std::optional<PickupChoice> pickup)
{
    const ActionError err = validate(diver, action);
    if (err != ActionError::None)
    {
        DEEPSEA_LOG_WARN("Dive %d: rejected %s from diver %d: %s",
                         m_round, DiveActionName(action), diver, ActionErrorName(err));
        throw InvalidActionError(err, std::string(DiveActionName(action)) + " by diver " + std::to_string(diver));
    }

    resolveTurn(*findDiver(diver), action, pickup.value_or(PickupChoice::Leave));
    return snapshot();
}

void DiveEngine::resolveTurn(Diver& d, DiveAction action, PickupChoice pickup)
{
    TurnReport report;
    report.diver = d.id();
    report.action = action;
    report.oxygenBefore = m_oxygen.remaining();
    report.positionBefore = d.position();

    // Nothing has changed yet, so a refusal here still leaves the dive untouched.
    if (action == DiveAction::BeginReturn)
    {
        if (const ActionError err = d.beginReturn(); err != ActionError::None)
            throw InvalidActionError(err, "BeginReturn by diver " + std::to_string(d.id()));
    }

    // Air is breathed before moving, weighted by what the diver hauls.
    m_oxygen.consume(std::max(1, d.carriedCount()));
    report.oxygenAfter = m_oxygen.remaining();

    if (action != DiveAction::Pass)
    {
        report.roll = m_die.rollSum(m_diceCount);

        int distance = report.roll;
        if (m_treasureSlowsMovement)
            distance = std::max(0, distance - d.carriedCount());

        const int from = d.position();
        const int to = d.isReturning()
            ? std::max(0, from - distance)
            : std::min(m_deck.trackLength(), from + distance);

        d.moveTo(to);
        report.distance = std::abs(to - from);

        if (d.isReturning() && d.isOnSubmarine())
        {
            const int carried = d.carriedCount();
            d.bankTreasures();
            report.banked = true;

            DEEPSEA_LOG_INFO("Dive %d: %s banks %d tile(s), total score %d",
                             m_round, d.name().c_str(), carried, d.totalScore());
        }
        else if (!d.isReturning())
        {
            report.offeredTier = pickupTierAt(to);
            if (report.offeredTier > 0 && pickup == PickupChoice::Take)
            {
                if (auto tile = m_deck.drawTile(report.offeredTier); tile && d.pickUp(*tile))
                {
                    m_taken[static_cast<std::size_t>(to)] = true;
                    report.taken = tile;

                    DEEPSEA_LOG_DEBUG("Dive %d: %s takes %s at %d",
                                      m_round, d.name().c_str(), TileLabel(*tile).c_str(), to);
                }
            }
        }
    }

    report.positionAfter = d.position();

    DEEPSEA_LOG_TRACE("Dive %d: %s %s roll=%d moved=%d pos %d->%d oxygen %d->%d",
                      m_round, d.name().c_str(), DiveActionName(action),
                      report.roll, report.distance,
                      report.positionBefore, report.positionAfter,
                      report.oxygenBefore, report.oxygenAfter);

    m_lastTurn = report;

    if (m_oxygen.exhausted())
        endDive();
    else
        advanceCursor();
}

void DiveEngine::advanceCursor()
{
    const std::size_t n = m_turnOrder.size();
    for (std::size_t k = 1; k <= n; ++k)
    {
        const std::size_t idx = (m_cursor + k) % n;
        const Diver* d = FindIn(*m_divers, m_turnOrder[idx]);
        if (d && d->isActive())
        {
            m_cursor = idx;
            return;
        }
    }

    endDive();
}

void DiveEngine::endDive()
{
    m_state = DiveState::Ended;
    m_result.oxygenExhausted = m_oxygen.exhausted();
    m_result.oxygenRemaining = m_oxygen.remaining();
    m_result.divers.clear();

    for (Diver& d : *m_divers)
    {
        if (d.isActive())
        {
            if (d.carriedCount() > 0)
            {
                DEEPSEA_LOG_INFO("Dive %d: %s runs out of air and loses %d tile(s)",
                                 m_round, d.name().c_str(), d.carriedCount());
            }
            d.strand();
        }

        m_result.divers.push_back(DiverDiveResult{ d.id(), d.banked(), d.lostCount() });
    }

    DEEPSEA_LOG_INFO("Dive %d over (%s), oxygen left %d",
                     m_round, m_result.oxygenExhausted ? "out of air" : "everyone back",
                     m_result.oxygenRemaining);
}

DiveStateSnapshot DiveEngine::snapshot() const
{
    DiveStateSnapshot s;
    s.round = m_round;
    s.state = m_state;
    s.oxygenRemaining = m_oxygen.remaining();
    s.oxygenMax = m_oxygen.maximum();
    s.trackLength = m_deck.trackLength();
    s.currentDiver = currentDiver();

    s.divers.reserve(m_divers->size());
    for (const Diver& d : *m_divers)
    {
        DiverView v;
        v.id = d.id();
        v.name = d.name();
        v.position = d.position();
        v.returning = d.isReturning();
        v.active = d.isActive();
        v.banked = d.hasReturned();
        v.totalScore = d.totalScore();
        v.carried = d.carried();
        s.divers.push_back(std::move(v));
    }
    return s;
}

const DiveResult& DiveEngine::result() const
{
    if (m_state != DiveState::Ended)
        throw InvalidActionError(ActionError::DiveInProgress, "dive result requested before the dive ended");
    return m_result;
}

} // namespace deepsea::dive
