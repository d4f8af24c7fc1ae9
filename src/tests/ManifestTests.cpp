// SPDX-License-Identifier: Apache-2.0
#include <podcast/Manifest.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace voxsrt;

TEST_CASE("segmentsFromManifest builds labelled segments", "[manifest]")
{
    auto const root = nlohmann::json::parse(R"({
        "turns": [
            { "speaker": "Alice", "text": "Welcome.", "duration": 2.5, "rate": 1.25 },
            { "text": "Narration.", "duration": 1.0, "volume": 0.5 }
        ]
    })");

    auto const segments = segmentsFromManifest(root, std::filesystem::path("."));
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 2);

    CHECK((*segments)[0].speakerLabel == "Alice");
    CHECK((*segments)[0].text == "Welcome.");
    CHECK((*segments)[0].totalDurationSeconds == 2.5);
    CHECK((*segments)[0].rate == 1.25f);
    CHECK(!(*segments)[1].speakerLabel.has_value());
    CHECK((*segments)[1].volume == 0.5f);
}

TEST_CASE("segmentsFromManifest rejects malformed manifests", "[manifest]")
{
    SECTION("missing turns array")
    {
        auto const segments = segmentsFromManifest(nlohmann::json::parse(R"({ "items": [] })"), ".");
        REQUIRE(!segments.has_value());
        CHECK(segments.error().code == ErrorCode::ParseError);
    }

    SECTION("turn without duration or audio")
    {
        auto const segments =
            segmentsFromManifest(nlohmann::json::parse(R"({ "turns": [ { "text": "Hi." } ] })"), ".");
        REQUIRE(!segments.has_value());
        CHECK(segments.error().code == ErrorCode::InvalidSegment);
        CHECK(segments.error().message.find("turn 0") != std::string::npos);
    }

    SECTION("volume out of range")
    {
        auto const segments = segmentsFromManifest(
            nlohmann::json::parse(R"({ "turns": [ { "text": "Hi.", "duration": 1.0, "volume": 1.5 } ] })"), ".");
        REQUIRE(!segments.has_value());
        CHECK(segments.error().code == ErrorCode::InvalidSegment);
    }

    SECTION("missing audio file")
    {
        auto const segments = segmentsFromManifest(
            nlohmann::json::parse(R"({ "turns": [ { "text": "Hi.", "audio": "missing.wav" } ] })"),
            "/nonexistent/voxsrt");
        REQUIRE(!segments.has_value());
        CHECK(segments.error().code == ErrorCode::InvalidSegment);
    }
}

TEST_CASE("loadManifest resolves subtitle files next to the manifest", "[manifest]")
{
    auto const dir = std::filesystem::temp_directory_path() / "voxsrt_test_manifest";
    std::filesystem::create_directories(dir);
    {
        auto file = std::ofstream(dir / "bob.srt");
        file << "1\n00:00:00,000 --> 00:00:01,000\nNative one.\n\n2\n00:00:01,000 --> 00:00:02,000\nNative two.\n";
    }
    {
        auto file = std::ofstream(dir / "manifest.json");
        file << R"({ "turns": [ { "speaker": "Bob", "srt": "bob.srt", "duration": 2.2 } ] })";
    }

    auto const segments = loadManifest((dir / "manifest.json").string());
    REQUIRE(segments.has_value());
    REQUIRE(segments->size() == 1);
    REQUIRE((*segments)[0].nativeCues.has_value());
    CHECK((*segments)[0].nativeCues->size() == 2);
    CHECK((*segments)[0].nativeCues->at(1).text == "Native two.");

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadManifest reports a missing file", "[manifest]")
{
    auto const segments = loadManifest("/nonexistent/voxsrt/manifest.json");
    REQUIRE(!segments.has_value());
    CHECK(segments.error().code == ErrorCode::IoError);
}
