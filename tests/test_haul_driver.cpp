// tests/test_haul_driver.cpp
//
// The fixed decision rule behind deepsea_sim, and whole seeded sessions.

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "deepsea/session/GameSession.hpp"
#include "deepsea/session/HaulDriver.hpp"

using deepsea::config::SessionConfig;
using deepsea::dive::DiveAction;
using deepsea::dive::DiverView;
using deepsea::dive::DiveStateSnapshot;
using deepsea::dive::PickupChoice;
using deepsea::session::GameSession;
using deepsea::session::HaulDriver;

namespace {

[[nodiscard]] DiveStateSnapshot OneDiver(int position, int carried, bool returning)
{
    DiveStateSnapshot s;
    s.trackLength = 10;
    s.currentDiver = 0;

    DiverView v;
    v.id = 0;
    v.position = position;
    v.returning = returning;
    v.carried.resize(static_cast<std::size_t>(carried));
    s.divers.push_back(v);
    return s;
}

[[nodiscard]] SessionConfig FourDivers(std::uint64_t seed)
{
    SessionConfig cfg;
    cfg.divers = { "Red", "Blue", "Green", "Yellow" };
    cfg.seed = seed;
    return cfg;
}

} // namespace

TEST_CASE("HaulDriver descends until the haul is reached, then heads back")
{
    const HaulDriver driver(2);

    auto d = driver.decide(OneDiver(0, 0, false));
    CHECK(d.action == DiveAction::Descend);
    CHECK(d.pickup == PickupChoice::Take);

    CHECK(driver.decide(OneDiver(4, 1, false)).action == DiveAction::Descend);
    CHECK(driver.decide(OneDiver(6, 2, false)).action == DiveAction::BeginReturn);
    CHECK(driver.decide(OneDiver(3, 2, true)).action == DiveAction::Ascend);

    // At the bottom: turn back with whatever is carried, or wait empty-handed.
    CHECK(driver.decide(OneDiver(10, 1, false)).action == DiveAction::BeginReturn);
    CHECK(driver.decide(OneDiver(10, 0, false)).action == DiveAction::Pass);

    CHECK(HaulDriver(0).haul() == 1);
}

TEST_CASE("Seeded sessions played by HaulDriver are reproducible")
{
    const HaulDriver driver(2);

    GameSession a(FourDivers(42));
    GameSession b(FourDivers(42));
    const auto ra = driver.play(a);
    const auto rb = driver.play(b);

    CHECK(a.isOver());
    CHECK(a.history().size() == 3u);
    REQUIRE(ra.divers.size() == 4u);
    REQUIRE(rb.divers.size() == 4u);
    for (std::size_t i = 0; i < ra.divers.size(); ++i)
    {
        CHECK(ra.divers[i].id == rb.divers[i].id);
        CHECK(ra.divers[i].totalScore == rb.divers[i].totalScore);
        CHECK(ra.divers[i].tierCounts == rb.divers[i].tierCounts);
    }
    CHECK(ra.winner == rb.winner);
    CHECK(ra.leaders == rb.leaders);
}

TEST_CASE("Banked score over a session equals the sum of dive results")
{
    const HaulDriver driver(3);

    for (std::uint64_t seed = 1; seed <= 20; ++seed)
    {
        GameSession s(FourDivers(seed));
        const auto standings = driver.play(s);

        std::vector<int> fromDives(4, 0);
        for (const auto& dive : s.history())
        {
            CHECK(dive.oxygenRemaining >= 0);
            for (const auto& r : dive.divers)
            {
                fromDives[static_cast<std::size_t>(r.id)] += r.value();
                if (r.lostTiles > 0)
                    CHECK(r.banked.empty());
            }
        }

        for (const auto& st : standings.divers)
            CHECK(st.totalScore == fromDives[static_cast<std::size_t>(st.id)]);
    }
}
