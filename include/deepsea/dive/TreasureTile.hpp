#pragma once
// include/deepsea/dive/TreasureTile.hpp
#include <string>

namespace deepsea::dive {

// A face-down treasure tile.
//  - tier: 1..N, deeper zones carry higher tiers
//  - value: points scored once the tile is banked
//  - id: unique within one restocked deck; used to prove a tile is never held twice
struct TreasureTile {
    int id    = -1;
    int tier  = 1;
    int value = 0;
};

[[nodiscard]] inline bool operator==(const TreasureTile& a, const TreasureTile& b) noexcept
{
    return a.id == b.id && a.tier == b.tier && a.value == b.value;
}

[[nodiscard]] inline bool operator!=(const TreasureTile& a, const TreasureTile& b) noexcept
{
    return !(a == b);
}

// Short display form, e.g. "[T2:7]".
[[nodiscard]] std::string TileLabel(const TreasureTile& t);

} // namespace deepsea::dive
