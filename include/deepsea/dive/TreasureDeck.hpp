#pragma once
// include/deepsea/dive/TreasureDeck.hpp
#include <cstddef>
#include <optional>
#include <vector>

#include "deepsea/core/Rng.hpp"
#include "deepsea/dive/TreasureTile.hpp"

namespace deepsea::dive {

// One depth zone of the track: how many positions it spans and the values of
// the tiles that can be found there.
struct TierSpec {
    int positions = 8;
    std::vector<int> values;
};

// The standard four zones (0-3, 4-7, 8-11, 12-15, two tiles of each value).
[[nodiscard]] std::vector<TierSpec> DefaultTiers();

// Tiles partitioned by tier, drawn without replacement.
//
// The track is the concatenation of the tier zones: positions 1..positions(tier 1)
// belong to tier 1, the next block to tier 2, and so on. Position 0 is the submarine.
class TreasureDeck {
public:
    // Upper bound on the summed tier positions.
    static constexpr int kMaxTrackLength = 4096;

    // Throws ConfigurationError if there are no tiers, a tier spans no positions,
    // the zones add up to more than kMaxTrackLength, or a tier has no tiles.
    explicit TreasureDeck(std::vector<TierSpec> tiers);

    // Puts every tile back and shuffles each tier independently.
    void restock(rng::RandomSource& random);

    [[nodiscard]] int tierCount() const noexcept { return static_cast<int>(m_tiers.size()); }
    [[nodiscard]] int trackLength() const noexcept { return m_trackLength; }
    [[nodiscard]] int totalTiles() const noexcept { return static_cast<int>(m_consumed.size()); }

    // Tier of the zone containing `position`; 0 for the submarine or off-track positions.
    [[nodiscard]] int peekNextTier(int position) const noexcept;

    // Removes and returns the next undrawn tile of `tier`, or nullopt if the tier is
    // exhausted (or does not exist).
    std::optional<TreasureTile> drawTile(int tier);

    [[nodiscard]] int remaining(int tier) const noexcept;
    [[nodiscard]] int remainingTotal() const noexcept;
    [[nodiscard]] bool isConsumed(int tileId) const noexcept;

    [[nodiscard]] const std::vector<TierSpec>& tiers() const noexcept { return m_tiers; }

private:
    [[nodiscard]] bool validTier(int tier) const noexcept
    {
        return tier >= 1 && tier <= tierCount();
    }

    std::vector<TierSpec> m_tiers;
    int m_trackLength = 0;

    // Per tier: undrawn tiles; the back is drawn next.
    std::vector<std::vector<TreasureTile>> m_piles;

    // Indexed by tile id.
    std::vector<bool> m_consumed;
};

} // namespace deepsea::dive
