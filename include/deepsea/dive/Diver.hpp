#pragma once
// include/deepsea/dive/Diver.hpp
#include <string>
#include <vector>

#include "deepsea/Errors.hpp"
#include "deepsea/dive/TreasureTile.hpp"

namespace deepsea::dive {

using DiverId = int;

// Per-player state. Dive-scoped fields are reset by resetForDive(); the score
// accumulates over the whole session.
class Diver {
public:
    Diver(DiverId id, std::string name);

    [[nodiscard]] DiverId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    // -----------------------------------------------------------------
    // Dive state
    // -----------------------------------------------------------------
    [[nodiscard]] int position() const noexcept { return m_position; }
    [[nodiscard]] bool isReturning() const noexcept { return m_returning; }
    [[nodiscard]] bool hasReturned() const noexcept { return m_returned; }
    [[nodiscard]] bool isActive() const noexcept { return m_active; }
    [[nodiscard]] bool isOnSubmarine() const noexcept { return m_position == 0; }

    // Pickup order is preserved.
    [[nodiscard]] const std::vector<TreasureTile>& carried() const noexcept { return m_carried; }
    [[nodiscard]] int carriedCount() const noexcept { return static_cast<int>(m_carried.size()); }

    // Tiles banked during the current dive.
    [[nodiscard]] const std::vector<TreasureTile>& banked() const noexcept { return m_banked; }

    // Tiles lost to oxygen exhaustion during the current dive.
    [[nodiscard]] int lostCount() const noexcept { return m_lost; }

    // -----------------------------------------------------------------
    // Session state
    // -----------------------------------------------------------------
    [[nodiscard]] int totalScore() const noexcept { return m_totalScore; }

    void resetForDive() noexcept;

    void moveTo(int newPosition) noexcept;

    // Appends `tile` if the diver is active, away from the submarine and has not
    // returned. Returns false (and changes nothing) otherwise.
    bool pickUp(const TreasureTile& tile);

    // Clears the carried tiles and returns them. Idempotent.
    std::vector<TreasureTile> dropAll() noexcept;

    // One-shot per dive. Fails with AlreadyReturning on a second call and with
    // ReturnWithoutTreasure when nothing is carried; no state changes on failure.
    ActionError beginReturn() noexcept;
    [[nodiscard]] ActionError canBeginReturn() const noexcept;

    // Converts carried tiles into score and retires the diver for this dive.
    // Only meaningful on the submarine while returning.
    void bankTreasures();

    // Oxygen ran out while submerged: carried tiles are lost, the diver is retired.
    void strand() noexcept;

private:
    DiverId m_id = 0;
    std::string m_name;

    int  m_position  = 0;
    bool m_returning = false;
    bool m_returned  = false;
    bool m_active    = true;

    std::vector<TreasureTile> m_carried;
    std::vector<TreasureTile> m_banked;
    int m_lost = 0;

    int m_totalScore = 0;
};

} // namespace deepsea::dive
