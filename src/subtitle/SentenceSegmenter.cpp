// SPDX-License-Identifier: Apache-2.0
#include "SentenceSegmenter.hpp"

#include <core/Utf8.hpp>

#include <algorithm>

namespace voxsrt
{

namespace
{

    /// @brief Punctuation behaviour of a language family.
    struct LanguageRules
    {
        bool fullWidthTerminators = false;
    };

    [[nodiscard]] auto languagePrefix(std::string_view language) -> std::string
    {
        auto prefix = std::string(language.substr(0, 2));
        std::ranges::transform(prefix, prefix.begin(), [](char ch) {
            return static_cast<char>((ch >= 'A' && ch <= 'Z') ? ch - 'A' + 'a' : ch);
        });
        return prefix;
    }

    [[nodiscard]] auto rulesFor(std::string_view language) -> LanguageRules
    {
        auto const prefix = languagePrefix(language);
        if (prefix == "ja" || prefix == "zh" || prefix == "ko")
            return LanguageRules { .fullWidthTerminators = true };
        return LanguageRules {};
    }

    [[nodiscard]] auto isAsciiTerminator(char32_t cp) -> bool
    {
        return cp == U'.' || cp == U'!' || cp == U'?';
    }

    [[nodiscard]] auto isFullWidthTerminator(char32_t cp) -> bool
    {
        // Ideographic full stop, fullwidth exclamation and question marks.
        return cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F;
    }

    [[nodiscard]] auto isEllipsis(char32_t cp) -> bool
    {
        return cp == 0x2026;
    }

    [[nodiscard]] auto isOpeningQuoteOrBracket(char32_t cp) -> bool
    {
        switch (cp)
        {
            case U'"':
            case U'\'':
            case U'(':
            case U'[':
            case U'{':
            case 0x00AB: // «
            case 0x2018: // ‘
            case 0x201C: // “
            case 0x201E: // „
            case 0x300C: // 「
            case 0x300E: // 『
            case 0xFF08: // （
                return true;
            default: return false;
        }
    }

    [[nodiscard]] auto isClosingQuoteOrBracket(char32_t cp) -> bool
    {
        switch (cp)
        {
            case U'"':
            case U'\'':
            case U')':
            case U']':
            case U'}':
            case 0x00BB: // »
            case 0x2019: // ’
            case 0x201D: // ”
            case 0x300D: // 」
            case 0x300F: // 』
            case 0xFF09: // ）
                return true;
            default: return false;
        }
    }

    [[nodiscard]] auto isAsciiLetter(char ch) -> bool
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    }

    /// @brief True for "J", "U.S" or "e.g": single letters, optionally joined by periods.
    [[nodiscard]] auto isInitials(std::string_view token) -> bool
    {
        if (token.empty() || token.size() % 2 == 0)
            return false;
        for (auto i = std::size_t { 0 }; i < token.size(); ++i)
        {
            if (i % 2 == 0 && !isAsciiLetter(token[i]))
                return false;
            if (i % 2 == 1 && token[i] != '.')
                return false;
        }
        return true;
    }

    class Segmenter
    {
      public:
        Segmenter(std::string_view text, const SegmenterConfig& config):
            _text(text), _rules(rulesFor(config.language))
        {
            auto const& source = config.abbreviations ? *config.abbreviations : defaultAbbreviations(config.language);
            for (auto const& abbreviation: source)
            {
                auto key = std::string_view(abbreviation);
                while (key.ends_with('.'))
                    key.remove_suffix(1);
                if (!key.empty())
                    _abbreviations.push_back(utf8::foldCase(key));
            }
        }

        [[nodiscard]] auto run() -> std::vector<std::string>
        {
            auto sentences = std::vector<std::string> {};
            auto sentenceStart = std::size_t { 0 };
            auto pos = std::size_t { 0 };

            while (pos < _text.size())
            {
                auto const decoded = utf8::decodeAt(_text, pos);
                auto const fullWidth = _rules.fullWidthTerminators && isFullWidthTerminator(decoded.codePoint);
                if (!isAsciiTerminator(decoded.codePoint) && !fullWidth)
                {
                    pos += decoded.length;
                    continue;
                }

                auto const runStart = pos;
                auto const runEnd = skipTerminatorRun(pos);
                auto const boundaryEnd = skipClosers(runEnd);

                if (endsSentence(runStart, runEnd, boundaryEnd))
                {
                    appendTrimmed(sentences, _text.substr(sentenceStart, boundaryEnd - sentenceStart));
                    sentenceStart = boundaryEnd;
                }
                pos = boundaryEnd;
            }

            appendTrimmed(sentences, _text.substr(sentenceStart));
            return sentences;
        }

      private:
        [[nodiscard]] auto codePointAt(std::size_t pos) const -> char32_t
        {
            return utf8::decodeAt(_text, pos).codePoint;
        }

        [[nodiscard]] auto isRunMember(char32_t cp) const -> bool
        {
            return isAsciiTerminator(cp) || isEllipsis(cp)
                   || (_rules.fullWidthTerminators && isFullWidthTerminator(cp));
        }

        [[nodiscard]] auto skipTerminatorRun(std::size_t pos) const -> std::size_t
        {
            while (pos < _text.size())
            {
                auto const decoded = utf8::decodeAt(_text, pos);
                if (!isRunMember(decoded.codePoint))
                    break;
                pos += decoded.length;
            }
            return pos;
        }

        /// @brief Closing quotes and brackets directly after the punctuation stay with the sentence.
        [[nodiscard]] auto skipClosers(std::size_t pos) const -> std::size_t
        {
            auto end = pos;
            while (end < _text.size())
            {
                auto const decoded = utf8::decodeAt(_text, end);
                if (!isClosingQuoteOrBracket(decoded.codePoint))
                    break;
                end += decoded.length;
            }

            // A quote that opens the next sentence is not a closer. CJK text has no spaces to tell.
            if (_rules.fullWidthTerminators || end == _text.size() || utf8::isWhitespace(codePointAt(end)))
                return end;
            return pos;
        }

        [[nodiscard]] auto nextNonWhitespace(std::size_t pos) const -> std::size_t
        {
            while (pos < _text.size())
            {
                auto const decoded = utf8::decodeAt(_text, pos);
                if (!utf8::isWhitespace(decoded.codePoint))
                    break;
                pos += decoded.length;
            }
            return pos;
        }

        [[nodiscard]] auto endsSentence(std::size_t runStart, std::size_t runEnd, std::size_t boundaryEnd) const
            -> bool
        {
            if (_rules.fullWidthTerminators)
            {
                for (auto pos = runStart; pos < runEnd; pos += utf8::decodeAt(_text, pos).length)
                {
                    if (isFullWidthTerminator(codePointAt(pos)))
                        return true;
                }
            }

            if (runEnd - runStart == 1 && _text[runStart] == '.' && isAbbreviation(precedingToken(runStart)))
                return false;

            auto const next = nextNonWhitespace(boundaryEnd);
            if (next == _text.size())
                return true;

            auto const cp = codePointAt(next);
            return utf8::isUppercase(cp) || isOpeningQuoteOrBracket(cp);
        }

        /// @brief The whitespace-delimited token ending at @p pos, without leading quotes or brackets.
        [[nodiscard]] auto precedingToken(std::size_t pos) const -> std::string_view
        {
            auto start = pos;
            while (start > 0)
            {
                auto const prev = utf8::previousOffset(_text, start);
                if (utf8::isWhitespace(codePointAt(prev)))
                    break;
                start = prev;
            }

            while (start < pos && isOpeningQuoteOrBracket(codePointAt(start)))
                start += utf8::decodeAt(_text, start).length;

            return _text.substr(start, pos - start);
        }

        [[nodiscard]] auto isAbbreviation(std::string_view token) const -> bool
        {
            if (token.empty())
                return false;
            if (isInitials(token))
                return true;
            return std::ranges::find(_abbreviations, utf8::foldCase(token)) != _abbreviations.end();
        }

        static void appendTrimmed(std::vector<std::string>& sentences, std::string_view piece)
        {
            auto const trimmed = utf8::trim(piece);
            if (!trimmed.empty())
                sentences.emplace_back(trimmed);
        }

        std::string_view _text;
        LanguageRules _rules;
        std::vector<std::string> _abbreviations;
    };

} // namespace

auto defaultAbbreviations(std::string_view language) -> std::vector<std::string>
{
    auto const prefix = languagePrefix(language);
    if (prefix == "ja" || prefix == "zh" || prefix == "ko")
        return {};
    if (prefix == "vi")
        return { "Ông", "Bà", "Cô", "Chị", "Anh", "Em" };
    return { "Mr", "Mrs", "Ms", "Dr", "Prof", "St", "Jr", "Sr", "etc", "vs", "e.g", "i.e" };
}

auto segmentSentences(std::string_view text, const SegmenterConfig& config) -> std::vector<std::string>
{
    return Segmenter(text, config).run();
}

} // namespace voxsrt
