#include <GameRelease.hpp>

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

using namespace formid::shared;

TEST_CASE("Every supported release maps to its own table", "[release]") {
    REQUIRE(SafeTableName(GameRelease::SkyrimSE) == "SkyrimSE");
    REQUIRE(SafeTableName(GameRelease::SkyrimSEGog) == "SkyrimSEGog");
    REQUIRE(SafeTableName(GameRelease::Fallout4VR) == "Fallout4VR");
    REQUIRE(SafeTableName(GameRelease::Starfield) == "Starfield");
    REQUIRE(SafeTableName(GameRelease::EnderalSE) == "EnderalSE");

    for (const auto release : kSupportedReleases) {
        REQUIRE(ParseGameRelease(SafeTableName(release)) == release);
    }
}

TEST_CASE("Unknown release values are rejected", "[release]") {
    REQUIRE_THROWS_AS(SafeTableName(static_cast<GameRelease>(99)), std::invalid_argument);
}

TEST_CASE("Release names parse case-insensitively", "[release]") {
    REQUIRE(ParseGameRelease("skyrimse") == GameRelease::SkyrimSE);
    REQUIRE(ParseGameRelease("  FALLOUT4 ") == GameRelease::Fallout4);
    REQUIRE_FALSE(ParseGameRelease("Morrowind").has_value());
    REQUIRE_FALSE(ParseGameRelease("SkyrimSE; DROP TABLE SkyrimSE").has_value());
}

TEST_CASE("Base game plugins are matched case-insensitively", "[release][base]") {
    REQUIRE(IsBaseGamePlugin(GameRelease::SkyrimSE, "Skyrim.esm"));
    REQUIRE(IsBaseGamePlugin(GameRelease::SkyrimVR, "DAWNGUARD.ESM"));
    REQUIRE(IsBaseGamePlugin(GameRelease::Fallout4, "DLCNukaWorld.esm"));
    REQUIRE(IsBaseGamePlugin(GameRelease::Starfield, "BlueprintShips-Starfield.esm"));
    REQUIRE_FALSE(IsBaseGamePlugin(GameRelease::SkyrimSE, "MyMod.esp"));
    REQUIRE_FALSE(IsBaseGamePlugin(GameRelease::Fallout4, "Skyrim.esm"));
    REQUIRE(BaseGamePlugins(GameRelease::Oblivion).empty());
}

TEST_CASE("Only Starfield separates master load orders", "[release]") {
    REQUIRE(UsesSeparatedMasterLoadOrders(GameRelease::Starfield));
    REQUIRE_FALSE(UsesSeparatedMasterLoadOrders(GameRelease::SkyrimSE));
    REQUIRE_FALSE(UsesSeparatedMasterLoadOrders(GameRelease::Fallout4));
}

TEST_CASE("Implicit masters come in load order", "[release]") {
    const auto& skyrim = ImplicitPlugins(GameRelease::SkyrimSE);
    REQUIRE(skyrim.size() == 5);
    REQUIRE(skyrim.front() == "Skyrim.esm");
    REQUIRE(skyrim[1] == "Update.esm");
    REQUIRE(ImplicitPlugins(GameRelease::Oblivion).front() == "Oblivion.esm");
}

TEST_CASE("Data path resolution", "[release][path]") {
    const std::filesystem::path game = std::filesystem::path("games") / "Skyrim";
    REQUIRE(ResolveDataPath(game) == game / "Data");
    REQUIRE(ResolveDataPath(game / "Data") == game / "Data");
    REQUIRE(ResolveDataPath(game / "data") == game / "data");
}
