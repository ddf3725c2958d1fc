#include "deepsea/dive/Diver.hpp"

#include <utility>

namespace deepsea::dive {

Diver::Diver(DiverId id, std::string name)
    : m_id(id)
    , m_name(std::move(name))
{
}

void Diver::resetForDive() noexcept
{
    m_position  = 0;
    m_returning = false;
    m_returned  = false;
    m_active    = true;
    m_carried.clear();
    m_banked.clear();
    m_lost = 0;
}

void Diver::moveTo(int newPosition) noexcept
{
    m_position = newPosition < 0 ? 0 : newPosition;
}

bool Diver::pickUp(const TreasureTile& tile)
{
    if (!m_active || m_returned || m_position <= 0)
        return false;

    m_carried.push_back(tile);
    return true;
}

std::vector<TreasureTile> Diver::dropAll() noexcept
{
    std::vector<TreasureTile> dropped;
    dropped.swap(m_carried);
    return dropped;
}

ActionError Diver::canBeginReturn() const noexcept
{
    if (!m_active)
        return ActionError::DiverInactive;
    if (m_returning)
        return ActionError::AlreadyReturning;
    if (m_carried.empty())
        return ActionError::ReturnWithoutTreasure;
    return ActionError::None;
}

ActionError Diver::beginReturn() noexcept
{
    const ActionError err = canBeginReturn();
    if (err == ActionError::None)
        m_returning = true;
    return err;
}

void Diver::bankTreasures()
{
    for (const TreasureTile& t : m_carried)
        m_totalScore += t.value;

    m_banked.insert(m_banked.end(), m_carried.begin(), m_carried.end());
    m_carried.clear();

    m_position = 0;
    m_returned = true;
    m_active   = false;
}

void Diver::strand() noexcept
{
    m_lost += static_cast<int>(dropAll().size());
    m_active = false;
}

} // namespace deepsea::dive
