#pragma once
// include/deepsea/config/SessionConfig.hpp
//
// Session tuning. Loaded from JSON (nlohmann::json); every key is optional and
// falls back to the defaults below.
//
//   {
//     "oxygenMax": 25,
//     "dice": { "count": 2, "faces": 3 },
//     "tiers": [ { "positions": 8, "values": [0,0,1,1,2,2,3,3] }, ... ],
//     "divers": [ "Ana", "Bo" ],
//     "seed": 1,
//     "treasureSlowsMovement": false
//   }

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "deepsea/dive/TreasureDeck.hpp"

namespace deepsea::config {

inline constexpr int kMaxDivers = 6;

struct SessionConfig {
    int oxygenMax = 25;

    int diceCount = 2;
    int diceFaces = 3;

    std::vector<dive::TierSpec> tiers = dive::DefaultTiers();

    std::vector<std::string> divers;

    std::uint64_t seed = 1;

    bool treasureSlowsMovement = false;
};

// Throws ConfigurationError describing the first problem found.
void ValidateSessionConfig(const SessionConfig& cfg);

// Throws ConfigurationError if the file cannot be read, is not valid JSON, holds a
// key of the wrong type, or fails validation.
[[nodiscard]] SessionConfig LoadSessionConfig(const std::filesystem::path& path);

// Same as LoadSessionConfig, from an already-parsed document.
[[nodiscard]] SessionConfig SessionConfigFromJson(const nlohmann::json& j);

[[nodiscard]] nlohmann::json SessionConfigToJson(const SessionConfig& cfg);

} // namespace deepsea::config
