// SPDX-License-Identifier: Apache-2.0
#include <subtitle/SentenceSegmenter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace voxsrt;

namespace
{

auto joinWithSpaces(const std::vector<std::string>& sentences) -> std::string
{
    auto joined = std::string {};
    for (auto const& sentence: sentences)
    {
        if (!joined.empty())
            joined += ' ';
        joined += sentence;
    }
    return joined;
}

} // namespace

TEST_CASE("segmentSentences splits on terminal punctuation", "[segmenter]")
{
    auto const sentences = segmentSentences("Hello world. This is the first sentence. How are you doing today?");

    REQUIRE(sentences.size() == 3);
    CHECK(sentences[0] == "Hello world.");
    CHECK(sentences[1] == "This is the first sentence.");
    CHECK(sentences[2] == "How are you doing today?");
}

TEST_CASE("segmentSentences returns nothing for blank input", "[segmenter]")
{
    CHECK(segmentSentences("").empty());
    CHECK(segmentSentences("   \n\t  ").empty());
}

TEST_CASE("segmentSentences keeps unpunctuated text as one trimmed sentence", "[segmenter]")
{
    auto const sentences = segmentSentences("   just some words without an ending  \n");

    REQUIRE(sentences.size() == 1);
    CHECK(sentences[0] == "just some words without an ending");
}

TEST_CASE("segmentSentences does not split after abbreviations", "[segmenter]")
{
    SECTION("title before a name")
    {
        auto const sentences = segmentSentences("Dr. Smith arrived.");
        REQUIRE(sentences.size() == 1);
        CHECK(sentences[0] == "Dr. Smith arrived.");
    }

    SECTION("comparison is case-insensitive")
    {
        auto const sentences = segmentSentences("We met MRS. Jones. She waved.");
        REQUIRE(sentences.size() == 2);
        CHECK(sentences[0] == "We met MRS. Jones.");
        CHECK(sentences[1] == "She waved.");
    }

    SECTION("single-letter initials")
    {
        auto const sentences = segmentSentences("The author is J. R. Tolkien. He wrote books.");
        REQUIRE(sentences.size() == 2);
        CHECK(sentences[0] == "The author is J. R. Tolkien.");
    }

    SECTION("dotted abbreviations")
    {
        auto const sentences = segmentSentences("Bring fruit, e.g. Apples and pears. Thanks.");
        REQUIRE(sentences.size() == 2);
        CHECK(sentences[0] == "Bring fruit, e.g. Apples and pears.");
    }
}

TEST_CASE("segmentSentences requires an uppercase letter, quote or bracket after a boundary", "[segmenter]")
{
    SECTION("decimal numbers")
    {
        auto const sentences = segmentSentences("Pi is about 3.14 in value. Nice.");
        REQUIRE(sentences.size() == 2);
        CHECK(sentences[0] == "Pi is about 3.14 in value.");
    }

    SECTION("lowercase continuation")
    {
        auto const sentences = segmentSentences("Wait... what happened? Nothing.");
        REQUIRE(sentences.size() == 2);
        CHECK(sentences[0] == "Wait... what happened?");
        CHECK(sentences[1] == "Nothing.");
    }

    SECTION("quote and bracket openers")
    {
        auto const sentences = segmentSentences("He left. \"Why?\" she asked. (Nobody knew.)");
        REQUIRE(sentences.size() == 3);
        CHECK(sentences[0] == "He left.");
        CHECK(sentences[1] == "\"Why?\" she asked.");
        CHECK(sentences[2] == "(Nobody knew.)");
    }
}

TEST_CASE("segmentSentences treats consecutive punctuation as one boundary", "[segmenter]")
{
    auto const sentences = segmentSentences("Really?! Yes... Absolutely.");

    REQUIRE(sentences.size() == 3);
    CHECK(sentences[0] == "Really?!");
    CHECK(sentences[1] == "Yes...");
    CHECK(sentences[2] == "Absolutely.");
}

TEST_CASE("segmentSentences keeps closing quotes with their sentence", "[segmenter]")
{
    auto const sentences = segmentSentences("She said \"Stop.\" Then she left.");

    REQUIRE(sentences.size() == 2);
    CHECK(sentences[0] == "She said \"Stop.\"");
    CHECK(sentences[1] == "Then she left.");
}

TEST_CASE("segmentSentences output rejoins to the normalized input", "[segmenter]")
{
    auto const text = std::string("First one.   Second one!\n\nThird one? Fourth");
    auto const sentences = segmentSentences(text);

    REQUIRE(sentences.size() == 4);
    CHECK(joinWithSpaces(sentences) == "First one. Second one! Third one? Fourth");
}

TEST_CASE("segmentSentences honours a custom abbreviation list", "[segmenter]")
{
    auto config = SegmenterConfig {};
    config.abbreviations = std::vector<std::string> { "Approx." };

    auto const custom = segmentSentences("It is approx. Ten metres. Dr. No.", config);
    REQUIRE(custom.size() == 3);
    CHECK(custom[0] == "It is approx. Ten metres.");
    CHECK(custom[1] == "Dr.");
    CHECK(custom[2] == "No.");
}

TEST_CASE("segmentSentences splits CJK text on full-width terminators", "[segmenter]")
{
    auto config = SegmenterConfig { .language = "ja" };
    auto const sentences = segmentSentences("こんにちは。元気ですか？「はい。」ありがとう！", config);

    REQUIRE(sentences.size() == 4);
    CHECK(sentences[0] == "こんにちは。");
    CHECK(sentences[1] == "元気ですか？");
    CHECK(sentences[2] == "「はい。」");
    CHECK(sentences[3] == "ありがとう！");
}

TEST_CASE("segmentSentences uses Vietnamese abbreviations and uppercase letters", "[segmenter]")
{
    auto config = SegmenterConfig { .language = "vi-VN" };
    auto const sentences = segmentSentences("Ông. Nam đến rồi. Đây là nhà.", config);

    REQUIRE(sentences.size() == 2);
    CHECK(sentences[0] == "Ông. Nam đến rồi.");
    CHECK(sentences[1] == "Đây là nhà.");
}

TEST_CASE("segmentSentences matches Vietnamese abbreviations in any case", "[segmenter]")
{
    auto config = SegmenterConfig { .language = "vi" };
    auto const sentences = segmentSentences("Bà ấy gặp ông. Nam cười. Ơn trời. Ưu tiên.", config);

    REQUIRE(sentences.size() == 3);
    CHECK(sentences[0] == "Bà ấy gặp ông. Nam cười.");
    CHECK(sentences[1] == "Ơn trời.");
    CHECK(sentences[2] == "Ưu tiên.");
}

TEST_CASE("segmentSentences breaks before Latin Extended-A capitals", "[segmenter]")
{
    auto const sentences = segmentSentences("Witamy. Łódź jest duża. Źródło.");

    REQUIRE(sentences.size() == 3);
    CHECK(sentences[1] == "Łódź jest duża.");
    CHECK(sentences[2] == "Źródło.");
}

TEST_CASE("defaultAbbreviations depends on the language", "[segmenter]")
{
    CHECK(!defaultAbbreviations("en").empty());
    CHECK(defaultAbbreviations("zh").empty());
    CHECK(defaultAbbreviations("xx") == defaultAbbreviations("en"));
}
