#include "deepsea/dive/DiveSnapshot.hpp"

#include <utility>

#include <nlohmann/json.hpp>

namespace deepsea::dive {

using json = nlohmann::json;

const char* DiveStateName(DiveState s) noexcept
{
    switch (s)
    {
    case DiveState::Diving: return "Diving";
    case DiveState::Ended:  return "Ended";
    }
    return "Unknown";
}

const char* DiveActionName(DiveAction a) noexcept
{
    switch (a)
    {
    case DiveAction::Descend:     return "Descend";
    case DiveAction::Ascend:      return "Ascend";
    case DiveAction::BeginReturn: return "BeginReturn";
    case DiveAction::Pass:        return "Pass";
    }
    return "Unknown";
}

void to_json(json& j, const TreasureTile& t)
{
    j = json{ { "id", t.id }, { "tier", t.tier }, { "value", t.value } };
}

void to_json(json& j, const DiverView& d)
{
    j = json{
        { "id", d.id },
        { "name", d.name },
        { "position", d.position },
        { "returning", d.returning },
        { "active", d.active },
        { "banked", d.banked },
        { "totalScore", d.totalScore },
        { "carried", d.carried },
    };
}

void to_json(json& j, const DiveStateSnapshot& s)
{
    j = json{
        { "round", s.round },
        { "state", DiveStateName(s.state) },
        { "oxygen", s.oxygenRemaining },
        { "oxygenMax", s.oxygenMax },
        { "trackLength", s.trackLength },
        { "divers", s.divers },
    };

    if (s.currentDiver)
        j["currentDiver"] = *s.currentDiver;
    else
        j["currentDiver"] = nullptr;
}

void to_json(json& j, const TurnReport& r)
{
    j = json{
        { "diver", r.diver },
        { "action", DiveActionName(r.action) },
        { "roll", r.roll },
        { "distance", r.distance },
        { "oxygenBefore", r.oxygenBefore },
        { "oxygenAfter", r.oxygenAfter },
        { "positionBefore", r.positionBefore },
        { "positionAfter", r.positionAfter },
        { "offeredTier", r.offeredTier },
        { "banked", r.banked },
    };

    if (r.taken)
        j["taken"] = *r.taken;
    else
        j["taken"] = nullptr;
}

void to_json(json& j, const DiveResult& r)
{
    json divers = json::array();
    for (const auto& d : r.divers)
    {
        divers.push_back(json{
            { "id", d.id },
            { "banked", d.banked },
            { "value", d.value() },
            { "lostTiles", d.lostTiles },
        });
    }

    j = json{
        { "round", r.round },
        { "oxygenExhausted", r.oxygenExhausted },
        { "oxygenRemaining", r.oxygenRemaining },
        { "divers", std::move(divers) },
    };
}

} // namespace deepsea::dive
