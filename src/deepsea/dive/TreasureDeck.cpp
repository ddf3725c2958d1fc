#include "deepsea/dive/TreasureDeck.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include "deepsea/Errors.hpp"

namespace deepsea::dive {

std::string TileLabel(const TreasureTile& t)
{
    return "[T" + std::to_string(t.tier) + ":" + std::to_string(t.value) + "]";
}

std::vector<TierSpec> DefaultTiers()
{
    return {
        TierSpec{ 8, { 0, 0, 1, 1, 2, 2, 3, 3 } },
        TierSpec{ 8, { 4, 4, 5, 5, 6, 6, 7, 7 } },
        TierSpec{ 8, { 8, 8, 9, 9, 10, 10, 11, 11 } },
        TierSpec{ 8, { 12, 12, 13, 13, 14, 14, 15, 15 } },
    };
}

TreasureDeck::TreasureDeck(std::vector<TierSpec> tiers)
    : m_tiers(std::move(tiers))
{
    if (m_tiers.empty())
        throw ConfigurationError("TreasureDeck: at least one tier is required");

    for (std::size_t i = 0; i < m_tiers.size(); ++i)
    {
        const TierSpec& spec = m_tiers[i];
        const std::string tierName = "tier " + std::to_string(i + 1);

        if (spec.positions < 1)
            throw ConfigurationError("TreasureDeck: " + tierName + " spans no track positions");
        if (spec.values.empty())
            throw ConfigurationError("TreasureDeck: " + tierName + " has no tiles");
        if (spec.positions > kMaxTrackLength - m_trackLength)
            throw ConfigurationError("TreasureDeck: the track may not exceed "
                                     + std::to_string(kMaxTrackLength) + " positions");

        m_trackLength += spec.positions;
    }

    // Build the piles once in declaration order; restock() shuffles them.
    m_piles.resize(m_tiers.size());
    int nextId = 0;
    for (std::size_t i = 0; i < m_tiers.size(); ++i)
    {
        for (const int value : m_tiers[i].values)
            m_piles[i].push_back(TreasureTile{ nextId++, static_cast<int>(i) + 1, value });
    }
    m_consumed.assign(static_cast<std::size_t>(nextId), false);
}

void TreasureDeck::restock(rng::RandomSource& random)
{
    int nextId = 0;
    for (std::size_t i = 0; i < m_tiers.size(); ++i)
    {
        auto& pile = m_piles[i];
        pile.clear();
        for (const int value : m_tiers[i].values)
            pile.push_back(TreasureTile{ nextId++, static_cast<int>(i) + 1, value });

        // Fisher-Yates inside the tier; zones never mix.
        for (std::size_t k = pile.size(); k > 1; --k)
        {
            const std::size_t j = random.nextBounded(static_cast<std::uint32_t>(k));
            std::swap(pile[k - 1], pile[j]);
        }
    }
    m_consumed.assign(static_cast<std::size_t>(nextId), false);
}

int TreasureDeck::peekNextTier(int position) const noexcept
{
    if (position < 1 || position > m_trackLength)
        return 0;

    int zoneEnd = 0;
    for (std::size_t i = 0; i < m_tiers.size(); ++i)
    {
        zoneEnd += m_tiers[i].positions;
        if (position <= zoneEnd)
            return static_cast<int>(i) + 1;
    }
    return 0;
}

std::optional<TreasureTile> TreasureDeck::drawTile(int tier)
{
    if (!validTier(tier))
        return std::nullopt;

    auto& pile = m_piles[static_cast<std::size_t>(tier - 1)];
    if (pile.empty())
        return std::nullopt;

    TreasureTile tile = pile.back();
    pile.pop_back();
    m_consumed[static_cast<std::size_t>(tile.id)] = true;
    return tile;
}

int TreasureDeck::remaining(int tier) const noexcept
{
    if (!validTier(tier))
        return 0;
    return static_cast<int>(m_piles[static_cast<std::size_t>(tier - 1)].size());
}

int TreasureDeck::remainingTotal() const noexcept
{
    int total = 0;
    for (const auto& pile : m_piles)
        total += static_cast<int>(pile.size());
    return total;
}

bool TreasureDeck::isConsumed(int tileId) const noexcept
{
    if (tileId < 0 || tileId >= totalTiles())
        return false;
    return m_consumed[static_cast<std::size_t>(tileId)];
}

} // namespace deepsea::dive
