// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/FileIo.hpp>
#include <core/Utf8.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>

using namespace voxsrt;

TEST_CASE("Error formats with its code name", "[core]")
{
    auto const error = Error { ErrorCode::InvalidSegment, "Turn 2: bad duration" };
    CHECK(std::format("{}", error) == "[InvalidSegment] Turn 2: bad duration");
}

TEST_CASE("utf8::decodeAt decodes multi-byte sequences", "[core][utf8]")
{
    auto const text = std::string_view { "a\xC3\xA9\xE3\x80\x82" }; // "aé。"

    CHECK(utf8::decodeAt(text, 0).codePoint == U'a');
    CHECK(utf8::decodeAt(text, 1).codePoint == U'é');
    CHECK(utf8::decodeAt(text, 1).length == 2);
    CHECK(utf8::decodeAt(text, 3).codePoint == U'。');
    CHECK(utf8::decodeAt(text, 3).length == 3);
    CHECK(utf8::decodeAt(text, 6).length == 0);
    CHECK(utf8::previousOffset(text, 6) == 3);
}

TEST_CASE("utf8::decodeAt replaces malformed bytes", "[core][utf8]")
{
    auto const truncated = std::string_view { "\xE3\x80" };
    auto const decoded = utf8::decodeAt(truncated, 0);
    CHECK(decoded.codePoint == utf8::ReplacementCharacter);
    CHECK(decoded.length == 1);
}

TEST_CASE("utf8::codePointCount counts characters, not bytes", "[core][utf8]")
{
    CHECK(utf8::codePointCount("") == 0);
    CHECK(utf8::codePointCount("Hello") == 5);
    CHECK(utf8::codePointCount("Xin chào") == 8);
    CHECK(utf8::codePointCount("こんにちは") == 5);
}

TEST_CASE("utf8::trim removes Unicode spaces", "[core][utf8]")
{
    CHECK(utf8::trim("  hi \t\n") == "hi");
    CHECK(utf8::trim("\xE3\x80\x80text\xC2\xA0") == "text");
    CHECK(utf8::trim(" \n ").empty());
}

TEST_CASE("utf8::isUppercase covers accented capitals", "[core][utf8]")
{
    CHECK(utf8::isUppercase(U'A'));
    CHECK(utf8::isUppercase(U'É'));
    CHECK(utf8::isUppercase(U'Đ'));
    CHECK(utf8::isUppercase(U'Ж'));
    CHECK(!utf8::isUppercase(U'a'));
    CHECK(!utf8::isUppercase(U'×'));
    CHECK(!utf8::isUppercase(U'1'));

    CHECK(utf8::isUppercase(U'Ł'));
    CHECK(!utf8::isUppercase(U'ł'));
    CHECK(utf8::isUppercase(U'Ź'));
    CHECK(utf8::isUppercase(U'Ơ'));
    CHECK(utf8::isUppercase(U'Ư'));
    CHECK(utf8::isUppercase(U'Ỳ'));
    CHECK(!utf8::isUppercase(U'ư'));
}

TEST_CASE("utf8::foldCase lowercases non-ASCII capitals", "[core][utf8]")
{
    CHECK(utf8::foldCase("Ông") == "ông");
    CHECK(utf8::foldCase("CHỊ") == "chị");
    CHECK(utf8::foldCase("ƯU") == "ưu");
    CHECK(utf8::foldCase("Łódź") == "łódź");
    CHECK(utf8::foldCase("Ёж") == "ёж");
    CHECK(utf8::foldCase("e.g") == "e.g");
}

TEST_CASE("writeFileAtomically creates directories and replaces content", "[core][io]")
{
    auto const dir = std::filesystem::temp_directory_path() / "voxsrt_test_fileio";
    std::filesystem::remove_all(dir);
    auto const path = dir / "nested" / "out.txt";

    REQUIRE(writeFileAtomically(path, "first").has_value());
    REQUIRE(writeFileAtomically(path, "second\r\n").has_value());

    auto const content = readTextFile(path);
    REQUIRE(content.has_value());
    CHECK(*content == "second\r\n");
    CHECK(!std::filesystem::exists(dir / "nested" / "out.txt.tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("readTextFile reports missing files", "[core][io]")
{
    auto const content = readTextFile("/nonexistent/voxsrt/input.txt");
    REQUIRE(!content.has_value());
    CHECK(content.error().code == ErrorCode::IoError);
}
