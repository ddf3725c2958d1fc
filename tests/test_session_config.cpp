// tests/test_session_config.cpp

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "deepsea/Errors.hpp"
#include "deepsea/config/SessionConfig.hpp"

using deepsea::ConfigurationError;
using deepsea::config::LoadSessionConfig;
using deepsea::config::SessionConfig;
using deepsea::config::SessionConfigFromJson;
using deepsea::config::SessionConfigToJson;
using deepsea::config::ValidateSessionConfig;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

// Temp file removed at scope exit.
struct TempJson {
    fs::path path;

    explicit TempJson(const std::string& text)
        : path(fs::temp_directory_path() / ("deepsea_cfg_" + std::to_string(std::hash<std::string>{}(text)) + ".json"))
    {
        std::ofstream(path) << text;
    }

    ~TempJson()
    {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

} // namespace

TEST_CASE("Missing keys keep their defaults")
{
    const SessionConfig cfg = SessionConfigFromJson(json{ { "divers", { "Ana", "Bo" } } });

    CHECK(cfg.oxygenMax == 25);
    CHECK(cfg.diceCount == 2);
    CHECK(cfg.diceFaces == 3);
    CHECK(cfg.tiers.size() == 4u);
    CHECK(cfg.seed == 1u);
    CHECK_FALSE(cfg.treasureSlowsMovement);
    CHECK(cfg.divers == std::vector<std::string>{ "Ana", "Bo" });
}

TEST_CASE("Every documented key is read")
{
    const json j = json::parse(R"({
        "oxygenMax": 18,
        "dice": { "count": 1, "faces": 6 },
        "tiers": [ { "positions": 3, "values": [1, 2] }, { "positions": 5, "values": [4] } ],
        "divers": [ "Ana" ],
        "seed": 77,
        "treasureSlowsMovement": true
    })");

    const SessionConfig cfg = SessionConfigFromJson(j);
    CHECK(cfg.oxygenMax == 18);
    CHECK(cfg.diceCount == 1);
    CHECK(cfg.diceFaces == 6);
    REQUIRE(cfg.tiers.size() == 2u);
    CHECK(cfg.tiers[0].positions == 3);
    CHECK(cfg.tiers[0].values == std::vector<int>{ 1, 2 });
    CHECK(cfg.tiers[1].positions == 5);
    CHECK(cfg.seed == 77u);
    CHECK(cfg.treasureSlowsMovement);

    // Written back in the same shape.
    CHECK(SessionConfigToJson(cfg) == j);
}

TEST_CASE("Wrong-typed keys are configuration errors")
{
    CHECK_THROWS_AS(SessionConfigFromJson(json{ { "divers", { "A" } }, { "oxygenMax", "lots" } }), ConfigurationError);
    CHECK_THROWS_AS(SessionConfigFromJson(json{ { "divers", "A" } }), ConfigurationError);
    CHECK_THROWS_AS(SessionConfigFromJson(json{ { "divers", { "A" } }, { "dice", 2 } }), ConfigurationError);
    CHECK_THROWS_AS(SessionConfigFromJson(json{ { "divers", { "A" } }, { "seed", -1 } }), ConfigurationError);
    CHECK_THROWS_AS(SessionConfigFromJson(json{ { "divers", { "A" } }, { "treasureSlowsMovement", 1 } }), ConfigurationError);
    CHECK_THROWS_AS(SessionConfigFromJson(json::array()), ConfigurationError);

    SUBCASE("integers wider than an int are not truncated")
    {
        CHECK_THROWS_AS(SessionConfigFromJson(json::parse(R"({"oxygenMax":4294967297,"divers":["A"]})")),
                        ConfigurationError);
        CHECK_THROWS_AS(SessionConfigFromJson(json::parse(R"({"dice":{"faces":-4294967293},"divers":["A"]})")),
                        ConfigurationError);
        CHECK_THROWS_AS(SessionConfigFromJson(json::parse(
                            R"({"divers":["A"],"tiers":[{"positions":2,"values":[1,4294967297]}]})")),
                        ConfigurationError);
    }
}

TEST_CASE("Validation rejects structural misconfiguration")
{
    SessionConfig cfg;
    cfg.divers = { "Ana" };
    CHECK_NOTHROW(ValidateSessionConfig(cfg));

    SUBCASE("oxygen must be positive")
    {
        cfg.oxygenMax = 0;
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
    SUBCASE("one to six divers")
    {
        cfg.divers.clear();
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
        cfg.divers.assign(7, "X");
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
    SUBCASE("a tier without tiles")
    {
        cfg.tiers[2].values.clear();
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
    SUBCASE("deeper tiers cannot be worth less")
    {
        cfg.tiers = { deepsea::dive::TierSpec{ 4, { 5, 6 } }, deepsea::dive::TierSpec{ 4, { 1, 2 } } };
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
    SUBCASE("the track has a maximum length")
    {
        cfg.tiers = { deepsea::dive::TierSpec{ std::numeric_limits<int>::max(), { 1 } },
                      deepsea::dive::TierSpec{ 2, { 2 } } };
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);

        cfg.tiers = { deepsea::dive::TierSpec{ deepsea::dive::TreasureDeck::kMaxTrackLength, { 1 } } };
        CHECK_NOTHROW(ValidateSessionConfig(cfg));
        cfg.tiers.push_back(deepsea::dive::TierSpec{ 1, { 2 } });
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
    SUBCASE("dice need faces")
    {
        cfg.diceFaces = 0;
        CHECK_THROWS_AS(ValidateSessionConfig(cfg), ConfigurationError);
    }
}

TEST_CASE("LoadSessionConfig reads a file and reports unreadable ones")
{
    {
        const TempJson file(R"({ "divers": ["Ana", "Bo", "Cy"], "oxygenMax": 30 })");
        const SessionConfig cfg = LoadSessionConfig(file.path);
        CHECK(cfg.divers.size() == 3u);
        CHECK(cfg.oxygenMax == 30);
    }

    {
        const TempJson broken(R"({ "divers": ["Ana", )");
        CHECK_THROWS_AS(LoadSessionConfig(broken.path), ConfigurationError);
    }

    CHECK_THROWS_AS(LoadSessionConfig(fs::temp_directory_path() / "deepsea_no_such_config.json"), ConfigurationError);
}
