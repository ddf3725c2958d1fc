// tests/test_treasure_deck.cpp

#include <doctest/doctest.h>

#include <algorithm>
#include <limits>
#include <set>
#include <vector>

#include "deepsea/Errors.hpp"
#include "deepsea/core/Rng.hpp"
#include "deepsea/dive/TreasureDeck.hpp"

using deepsea::ConfigurationError;
using deepsea::dive::DefaultTiers;
using deepsea::dive::TierSpec;
using deepsea::dive::TileLabel;
using deepsea::dive::TreasureDeck;
using deepsea::dive::TreasureTile;

TEST_CASE("Default deck: four zones of eight positions, thirty-two tiles")
{
    TreasureDeck deck(DefaultTiers());

    CHECK(deck.tierCount() == 4);
    CHECK(deck.trackLength() == 32);
    CHECK(deck.totalTiles() == 32);
    CHECK(deck.remainingTotal() == 32);

    CHECK(deck.peekNextTier(0) == 0);
    CHECK(deck.peekNextTier(1) == 1);
    CHECK(deck.peekNextTier(8) == 1);
    CHECK(deck.peekNextTier(9) == 2);
    CHECK(deck.peekNextTier(24) == 3);
    CHECK(deck.peekNextTier(25) == 4);
    CHECK(deck.peekNextTier(32) == 4);
    CHECK(deck.peekNextTier(33) == 0);
    CHECK(deck.peekNextTier(-1) == 0);
}

TEST_CASE("Drawing an exhausted tier yields the empty outcome")
{
    TreasureDeck deck({ TierSpec{ 2, { 3 } }, TierSpec{ 2, { 6, 7 } } });

    const auto first = deck.drawTile(1);
    REQUIRE(first.has_value());
    CHECK(first->tier == 1);
    CHECK(first->value == 3);
    CHECK(deck.isConsumed(first->id));
    CHECK(deck.remaining(1) == 0);

    CHECK_FALSE(deck.drawTile(1).has_value());
    CHECK_FALSE(deck.drawTile(0).has_value());
    CHECK_FALSE(deck.drawTile(3).has_value());

    CHECK(deck.remaining(2) == 2);
    CHECK(deck.remainingTotal() == 2);
}

TEST_CASE("Every tile is drawn at most once")
{
    TreasureDeck deck(DefaultTiers());
    deepsea::rng::Pcg32Source random(7);
    deck.restock(random);

    std::set<int> ids;
    for (int tier = 1; tier <= deck.tierCount(); ++tier)
    {
        while (auto tile = deck.drawTile(tier))
        {
            CHECK(tile->tier == tier);
            CHECK(ids.insert(tile->id).second);
        }
    }
    CHECK(ids.size() == 32u);
    CHECK(deck.remainingTotal() == 0);
}

TEST_CASE("Restock puts every tile back and shuffles deterministically per seed")
{
    TreasureDeck a(DefaultTiers());
    TreasureDeck b(DefaultTiers());

    deepsea::rng::Pcg32Source ra(2024);
    deepsea::rng::Pcg32Source rb(2024);
    a.restock(ra);
    b.restock(rb);

    std::vector<int> seqA;
    std::vector<int> seqB;
    for (int i = 0; i < 8; ++i)
    {
        seqA.push_back(a.drawTile(4)->value);
        seqB.push_back(b.drawTile(4)->value);
    }
    CHECK(seqA == seqB);

    // The zone keeps its value multiset whatever the order.
    std::sort(seqA.begin(), seqA.end());
    CHECK(seqA == std::vector<int>{ 12, 12, 13, 13, 14, 14, 15, 15 });

    deepsea::rng::Pcg32Source again(1);
    a.restock(again);
    CHECK(a.remaining(4) == 8);
    CHECK(a.remainingTotal() == 32);
    for (int id = 0; id < a.totalTiles(); ++id)
        CHECK_FALSE(a.isConsumed(id));
}

TEST_CASE("Deck construction rejects unusable tiers")
{
    CHECK_THROWS_AS(TreasureDeck(std::vector<TierSpec>{}), ConfigurationError);
    CHECK_THROWS_AS(TreasureDeck(std::vector<TierSpec>{ TierSpec{ 0, { 1 } } }), ConfigurationError);
    CHECK_THROWS_AS(TreasureDeck(std::vector<TierSpec>{ TierSpec{ 4, {} } }), ConfigurationError);
}

TEST_CASE("Deck construction caps the track length")
{
    CHECK_THROWS_AS(TreasureDeck(std::vector<TierSpec>{ TierSpec{ std::numeric_limits<int>::max(), { 1 } },
                                                        TierSpec{ 2, { 2 } } }),
                    ConfigurationError);
    CHECK_THROWS_AS(TreasureDeck(std::vector<TierSpec>{ TierSpec{ TreasureDeck::kMaxTrackLength, { 1 } },
                                                        TierSpec{ 1, { 2 } } }),
                    ConfigurationError);

    TreasureDeck longest(std::vector<TierSpec>{ TierSpec{ TreasureDeck::kMaxTrackLength - 1, { 1 } },
                                                TierSpec{ 1, { 2 } } });
    CHECK(longest.trackLength() == TreasureDeck::kMaxTrackLength);
}

TEST_CASE("TileLabel shows tier and value")
{
    CHECK(TileLabel(TreasureTile{ 3, 2, 7 }) == "[T2:7]");
}
