// SPDX-License-Identifier: Apache-2.0
#include "Utf8.hpp"

namespace voxsrt::utf8
{

namespace
{

    [[nodiscard]] auto isContinuation(unsigned char byte) -> bool
    {
        return (byte & 0xC0) == 0x80;
    }

} // namespace

auto decodeAt(std::string_view text, std::size_t pos) -> DecodedCodePoint
{
    if (pos >= text.size())
        return {};

    auto const byteAt = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    auto const lead = byteAt(pos);

    if (lead < 0x80)
        return { .codePoint = lead, .length = 1 };

    auto length = std::size_t { 0 };
    auto codePoint = char32_t { 0 };
    auto minimum = char32_t { 0 };

    if ((lead >> 5) == 0x6)
    {
        length = 2;
        codePoint = lead & 0x1F;
        minimum = 0x80;
    }
    else if ((lead >> 4) == 0xE)
    {
        length = 3;
        codePoint = lead & 0x0F;
        minimum = 0x800;
    }
    else if ((lead >> 3) == 0x1E)
    {
        length = 4;
        codePoint = lead & 0x07;
        minimum = 0x10000;
    }
    else
        return { .codePoint = ReplacementCharacter, .length = 1 };

    if (pos + length > text.size())
        return { .codePoint = ReplacementCharacter, .length = 1 };

    for (auto i = std::size_t { 1 }; i < length; ++i)
    {
        auto const byte = byteAt(pos + i);
        if (!isContinuation(byte))
            return { .codePoint = ReplacementCharacter, .length = 1 };
        codePoint = (codePoint << 6) | (byte & 0x3F);
    }

    if (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        return { .codePoint = ReplacementCharacter, .length = 1 };

    return { .codePoint = codePoint, .length = length };
}

auto previousOffset(std::string_view text, std::size_t pos) -> std::size_t
{
    if (pos == 0)
        return 0;

    auto start = pos - 1;
    // A code point is at most 4 bytes long.
    while (start > 0 && pos - start < 4 && isContinuation(static_cast<unsigned char>(text[start])))
        --start;

    if (decodeAt(text, start).length == pos - start)
        return start;
    return pos - 1;
}

auto codePointCount(std::string_view text) -> std::size_t
{
    auto count = std::size_t { 0 };
    for (auto pos = std::size_t { 0 }; pos < text.size(); pos += decodeAt(text, pos).length)
        ++count;
    return count;
}

auto isWhitespace(char32_t codePoint) -> bool
{
    switch (codePoint)
    {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\r':
        case U'\v':
        case U'\f':
        case 0x00A0:
        case 0x3000: return true;
        default: return false;
    }
}

auto toLower(char32_t codePoint) -> char32_t
{
    if (codePoint >= U'A' && codePoint <= U'Z')
        return codePoint + 0x20;
    // Latin-1 Supplement, excluding the multiplication sign.
    if (codePoint >= 0x00C0 && codePoint <= 0x00DE && codePoint != 0x00D7)
        return codePoint + 0x20;

    // Latin Extended-A pairs capitals with the next code point. The pairs start on
    // even code points except in 0x0139..0x0148 and 0x0179..0x017E.
    if ((codePoint >= 0x0100 && codePoint <= 0x0137) || (codePoint >= 0x014A && codePoint <= 0x0177))
        return codePoint % 2 == 0 ? codePoint + 1 : codePoint;
    if ((codePoint >= 0x0139 && codePoint <= 0x0148) || (codePoint >= 0x0179 && codePoint <= 0x017E))
        return codePoint % 2 == 1 ? codePoint + 1 : codePoint;
    if (codePoint == 0x0178) // Ÿ
        return 0x00FF;

    // Latin Extended-B: the horned vowels used by Vietnamese.
    if (codePoint == 0x01A0 || codePoint == 0x01AF) // Ơ Ư
        return codePoint + 1;

    // Latin Extended Additional, which holds the remaining Vietnamese capitals.
    if ((codePoint >= 0x1E00 && codePoint <= 0x1E95) || (codePoint >= 0x1EA0 && codePoint <= 0x1EFF))
        return codePoint % 2 == 0 ? codePoint + 1 : codePoint;

    if (codePoint >= 0x0391 && codePoint <= 0x03A9 && codePoint != 0x03A2)
        return codePoint + 0x20;
    if (codePoint >= 0x0400 && codePoint <= 0x040F)
        return codePoint + 0x50;
    if (codePoint >= 0x0410 && codePoint <= 0x042F)
        return codePoint + 0x20;
    return codePoint;
}

auto isUppercase(char32_t codePoint) -> bool
{
    return toLower(codePoint) != codePoint;
}

void append(std::string& out, char32_t codePoint)
{
    if (codePoint <= 0x7F)
        out.push_back(static_cast<char>(codePoint));
    else if (codePoint <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | ((codePoint >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else if (codePoint <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((codePoint >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

auto foldCase(std::string_view text) -> std::string
{
    auto folded = std::string {};
    folded.reserve(text.size());
    for (auto pos = std::size_t { 0 }; pos < text.size();)
    {
        auto const decoded = decodeAt(text, pos);
        append(folded, toLower(decoded.codePoint));
        pos += decoded.length;
    }
    return folded;
}

auto trim(std::string_view text) -> std::string_view
{
    auto begin = std::size_t { 0 };
    while (begin < text.size())
    {
        auto const decoded = decodeAt(text, begin);
        if (!isWhitespace(decoded.codePoint))
            break;
        begin += decoded.length;
    }

    auto end = text.size();
    while (end > begin)
    {
        auto const prev = previousOffset(text, end);
        if (!isWhitespace(decodeAt(text, prev).codePoint))
            break;
        end = prev;
    }

    return text.substr(begin, end - begin);
}

} // namespace voxsrt::utf8
