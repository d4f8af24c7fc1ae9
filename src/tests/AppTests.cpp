// SPDX-License-Identifier: Apache-2.0
#include <core/FileIo.hpp>
#include <subtitle/SrtFormatter.hpp>
#include <voxsrt/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace voxsrt;

namespace
{

auto tempDir(std::string_view name) -> std::filesystem::path
{
    auto const dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("App::runCompose writes an SRT file", "[app]")
{
    auto const dir = tempDir("voxsrt_test_app_compose");
    auto const output = dir / "out.srt";

    auto app = App(AppConfig {});
    auto const result = app.runCompose(ComposeRequest {
        .text = "Hello world. This is the first sentence. How are you doing today?",
        .duration = 5.2,
        .outputPath = output.string(),
    });
    REQUIRE(result.has_value());

    auto const content = readTextFile(output);
    REQUIRE(content.has_value());
    CHECK(content->starts_with("1\n00:00:00,000 --> 00:00:00,990\nHello world.\n\n"));
    CHECK(content->ends_with("3\n00:00:03,219 --> 00:00:05,200\nHow are you doing today?\n\n"));
    CHECK(!std::filesystem::exists(dir / "out.srt.tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("App::runCompose writes nothing when composition fails", "[app]")
{
    auto const dir = tempDir("voxsrt_test_app_fail");
    auto const output = dir / "out.srt";

    auto app = App(AppConfig {});
    auto const result = app.runCompose(ComposeRequest {
        .text = "Hello.",
        .duration = 0.0,
        .outputPath = output.string(),
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidInput);
    CHECK(!std::filesystem::exists(output));

    std::filesystem::remove_all(dir);
}

TEST_CASE("App::runPodcast merges a script with durations", "[app]")
{
    auto const dir = tempDir("voxsrt_test_app_podcast");
    {
        auto file = std::ofstream(dir / "script.txt");
        file << "Alice: Hi there. Welcome back.\nBob: Glad to be here.\n";
    }

    auto config = AppConfig {};
    config.output.lineEnding = LineEnding::CrLf;
    auto app = App(std::move(config));

    auto const output = dir / "podcast.srt";
    auto const result = app.runPodcast(PodcastRequest {
        .scriptPath = (dir / "script.txt").string(),
        .durations = { 2.5, 2.6 },
        .outputPath = output.string(),
    });
    REQUIRE(result.has_value());

    auto const content = readTextFile(output);
    REQUIRE(content.has_value());
    CHECK(content->find("\r\n3\r\n00:00:02,500 --> 00:00:05,100\r\n[Bob]: Glad to be here.\r\n") != std::string::npos);

    auto const cues = parseSrt(*content);
    REQUIRE(cues.has_value());
    REQUIRE(cues->size() == 3);
    CHECK((*cues)[0].text == "[Alice]: Hi there.");

    std::filesystem::remove_all(dir);
}

TEST_CASE("App::runPodcast aborts without output on an invalid turn", "[app]")
{
    auto const dir = tempDir("voxsrt_test_app_podcast_fail");
    {
        auto file = std::ofstream(dir / "script.txt");
        file << "Alice: Hi.\nBob: Hello.\n";
    }

    auto app = App(AppConfig {});
    auto const output = dir / "podcast.srt";
    auto const result = app.runPodcast(PodcastRequest {
        .scriptPath = (dir / "script.txt").string(),
        .durations = { 1.0, -2.0 },
        .outputPath = output.string(),
    });

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidSegment);
    CHECK(!std::filesystem::exists(output));

    std::filesystem::remove_all(dir);
}

TEST_CASE("App::runCheck validates SRT files", "[app]")
{
    auto const dir = tempDir("voxsrt_test_app_check");
    auto app = App(AppConfig {});

    {
        auto file = std::ofstream(dir / "good.srt");
        file << "1\n00:00:00,000 --> 00:00:01,000\nA\n\n2\n00:00:01,000 --> 00:00:02,000\nB\n\n";
    }
    CHECK(app.runCheck((dir / "good.srt").string()).has_value());

    {
        auto file = std::ofstream(dir / "overlap.srt");
        file << "1\n00:00:00,000 --> 00:00:01,500\nA\n\n2\n00:00:01,000 --> 00:00:02,000\nB\n\n";
    }
    auto const overlap = app.runCheck((dir / "overlap.srt").string());
    REQUIRE(!overlap.has_value());
    CHECK(overlap.error().code == ErrorCode::FormatError);

    std::filesystem::remove_all(dir);
}

TEST_CASE("renderTimeline refuses an overlapping timeline", "[app]")
{
    auto const timeline = Timeline {
        .cues = {
            Cue { .index = 1, .start = 0.0, .end = 2.0, .text = "a" },
            Cue { .index = 2, .start = 1.0, .end = 3.0, .text = "b" },
        },
        .totalDuration = 3.0,
    };

    auto const srt = renderTimeline(timeline, AppConfig {});
    REQUIRE(!srt.has_value());
    CHECK(srt.error().code == ErrorCode::FormatError);
}
