#include "deepsea/config/SessionConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/Log.h"
#include "deepsea/Errors.hpp"

namespace deepsea::config {

namespace {

using json = nlohmann::json;

[[noreturn]] void Fail(const std::string& what)
{
    DEEPSEA_LOG_ERROR("Session config: %s", what.c_str());
    throw ConfigurationError("session config: " + what);
}

// Integers that do not fit an int are rejected rather than truncated.
[[nodiscard]] int ToInt(const json& v, const std::string& where)
{
    if (!v.is_number_integer())
        Fail(where + " must be an integer");

    if (v.is_number_unsigned())
    {
        if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            Fail(where + " is out of range");
        return static_cast<int>(v.get<std::uint64_t>());
    }

    const std::int64_t n = v.get<std::int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
        Fail(where + " is out of range");
    return static_cast<int>(n);
}

[[nodiscard]] int ObjInt(const json& obj, const char* key, int def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    return ToInt(*it, std::string("'") + key + "'");
}

[[nodiscard]] bool ObjBool(const json& obj, const char* key, bool def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (!it->is_boolean())
        Fail(std::string("'") + key + "' must be true or false");
    return it->get<bool>();
}

[[nodiscard]] std::uint64_t ObjSeed(const json& obj, const char* key, std::uint64_t def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    if (it->is_number_unsigned())
        return it->get<std::uint64_t>();
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    Fail(std::string("'") + key + "' must be a non-negative integer");
}

[[nodiscard]] dive::TierSpec TierFromJson(const json& t, std::size_t index)
{
    const std::string where = "tiers[" + std::to_string(index) + "]";
    if (!t.is_object())
        Fail(where + " must be an object");

    dive::TierSpec spec;
    spec.positions = ObjInt(t, "positions", spec.positions);

    auto it = t.find("values");
    if (it == t.end() || !it->is_array())
        Fail(where + ".values must be an array");

    for (const auto& v : *it)
        spec.values.push_back(ToInt(v, where + ".values"));
    return spec;
}

} // namespace

void ValidateSessionConfig(const SessionConfig& cfg)
{
    if (cfg.oxygenMax <= 0)
        Fail("oxygenMax must be > 0, got " + std::to_string(cfg.oxygenMax));
    if (cfg.diceCount < 1)
        Fail("dice.count must be >= 1, got " + std::to_string(cfg.diceCount));
    if (cfg.diceFaces < 1)
        Fail("dice.faces must be >= 1, got " + std::to_string(cfg.diceFaces));

    if (cfg.divers.empty() || static_cast<int>(cfg.divers.size()) > kMaxDivers)
        Fail("between 1 and " + std::to_string(kMaxDivers) + " divers are required, got "
             + std::to_string(cfg.divers.size()));
    for (const auto& name : cfg.divers)
    {
        if (name.empty())
            Fail("diver names must not be empty");
    }

    if (cfg.tiers.empty())
        Fail("at least one tier is required");

    long long trackLength = 0;
    int prevMin = 0;
    int prevMax = 0;
    for (std::size_t i = 0; i < cfg.tiers.size(); ++i)
    {
        const auto& tier = cfg.tiers[i];
        const std::string where = "tier " + std::to_string(i + 1);

        if (tier.positions < 1)
            Fail(where + " must span at least one position");
        trackLength += tier.positions;
        if (trackLength > dive::TreasureDeck::kMaxTrackLength)
            Fail("the track may not exceed " + std::to_string(dive::TreasureDeck::kMaxTrackLength) + " positions");
        if (tier.values.empty())
            Fail(where + " has no tiles");

        const auto [lo, hi] = std::minmax_element(tier.values.begin(), tier.values.end());
        if (*lo < 0)
            Fail(where + " has a negative tile value");

        // Deeper tiers are never worth less than shallower ones.
        if (i > 0 && (*lo < prevMin || *hi < prevMax))
            Fail(where + " is worth less than the tier above it");

        prevMin = *lo;
        prevMax = *hi;
    }
}

SessionConfig SessionConfigFromJson(const json& j)
{
    if (!j.is_object())
        Fail("document root must be an object");

    SessionConfig cfg;
    cfg.oxygenMax = ObjInt(j, "oxygenMax", cfg.oxygenMax);

    if (auto it = j.find("dice"); it != j.end())
    {
        if (!it->is_object())
            Fail("'dice' must be an object");
        cfg.diceCount = ObjInt(*it, "count", cfg.diceCount);
        cfg.diceFaces = ObjInt(*it, "faces", cfg.diceFaces);
    }

    if (auto it = j.find("tiers"); it != j.end())
    {
        if (!it->is_array())
            Fail("'tiers' must be an array");

        cfg.tiers.clear();
        for (std::size_t i = 0; i < it->size(); ++i)
            cfg.tiers.push_back(TierFromJson((*it)[i], i));
    }

    if (auto it = j.find("divers"); it != j.end())
    {
        if (!it->is_array())
            Fail("'divers' must be an array of names");

        for (const auto& name : *it)
        {
            if (!name.is_string())
                Fail("'divers' must be an array of names");
            cfg.divers.push_back(name.get<std::string>());
        }
    }

    cfg.seed = ObjSeed(j, "seed", cfg.seed);
    cfg.treasureSlowsMovement = ObjBool(j, "treasureSlowsMovement", cfg.treasureSlowsMovement);

    ValidateSessionConfig(cfg);
    return cfg;
}

SessionConfig LoadSessionConfig(const std::filesystem::path& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        Fail("could not open " + path.string());

    json j;
    try
    {
        f >> j;
    }
    catch (const json::parse_error& e)
    {
        Fail(path.string() + ": " + e.what());
    }

    DEEPSEA_LOG_INFO("Loaded session config from %s", path.string().c_str());
    return SessionConfigFromJson(j);
}

json SessionConfigToJson(const SessionConfig& cfg)
{
    json tiers = json::array();
    for (const auto& t : cfg.tiers)
        tiers.push_back(json{ { "positions", t.positions }, { "values", t.values } });

    return json{
        { "oxygenMax", cfg.oxygenMax },
        { "dice", json{ { "count", cfg.diceCount }, { "faces", cfg.diceFaces } } },
        { "tiers", std::move(tiers) },
        { "divers", cfg.divers },
        { "seed", cfg.seed },
        { "treasureSlowsMovement", cfg.treasureSlowsMovement },
    };
}

} // namespace deepsea::config
