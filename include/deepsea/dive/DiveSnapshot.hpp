#pragma once
// include/deepsea/dive/DiveSnapshot.hpp
//
// Read-only projections handed to the presentation layer, plus the decision
// vocabulary it sends back. JSON conversions use nlohmann::json (ADL to_json).

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "deepsea/dive/Diver.hpp"
#include "deepsea/dive/TreasureTile.hpp"

namespace deepsea::dive {

enum class DiveState : std::uint8_t {
    Diving = 0,
    Ended,
};

enum class DiveAction : std::uint8_t {
    Descend = 0,
    // Only while returning.
    Ascend,
    // Declare the one-way return, then move toward the submarine this turn.
    BeginReturn,
    // Breathe but hold position: no roll, no pickup.
    Pass,
};

// Whether to take the tile on the landing position, if one is offered.
enum class PickupChoice : std::uint8_t {
    Leave = 0,
    Take,
};

[[nodiscard]] const char* DiveStateName(DiveState s) noexcept;
[[nodiscard]] const char* DiveActionName(DiveAction a) noexcept;

struct DiverView {
    DiverId id = 0;
    std::string name;
    int  position   = 0;
    bool returning  = false;
    bool active     = true;
    bool banked     = false;
    int  totalScore = 0;
    std::vector<TreasureTile> carried;
};

struct DiveStateSnapshot {
    int round = 1;
    DiveState state = DiveState::Diving;
    int oxygenRemaining = 0;
    int oxygenMax = 0;
    int trackLength = 0;

    // Diver expected to submit the next decision; empty once the dive has ended.
    std::optional<DiverId> currentDiver;

    std::vector<DiverView> divers;
};

// What happened during the most recently resolved turn.
struct TurnReport {
    DiverId diver = 0;
    DiveAction action = DiveAction::Descend;

    int roll     = 0;   // dice total (0 on Pass)
    int distance = 0;   // squares actually moved

    int oxygenBefore = 0;
    int oxygenAfter  = 0;

    int positionBefore = 0;
    int positionAfter  = 0;

    // Tier offered on the landing position (0 = none).
    int offeredTier = 0;
    std::optional<TreasureTile> taken;

    bool banked = false;
};

struct DiverDiveResult {
    DiverId id = 0;
    std::vector<TreasureTile> banked;
    int lostTiles = 0;

    [[nodiscard]] int value() const noexcept
    {
        int total = 0;
        for (const auto& t : banked)
            total += t.value;
        return total;
    }
};

struct DiveResult {
    int round = 1;
    bool oxygenExhausted = false;
    int oxygenRemaining = 0;
    std::vector<DiverDiveResult> divers;
};

void to_json(nlohmann::json& j, const TreasureTile& t);
void to_json(nlohmann::json& j, const DiverView& d);
void to_json(nlohmann::json& j, const DiveStateSnapshot& s);
void to_json(nlohmann::json& j, const TurnReport& r);
void to_json(nlohmann::json& j, const DiveResult& r);

} // namespace deepsea::dive
