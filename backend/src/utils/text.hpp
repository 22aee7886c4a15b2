#pragma once
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sstream>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace Text
{
    inline std::string trim(const std::string& s)
    {
        std::string t = s;
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        return t;
    }

    // Unicode lower-casing of UTF-8 text (root locale)
    inline std::string toLower(const std::string& s)
    {
        std::string out;
        icu::UnicodeString::fromUTF8(s).toLower(icu::Locale::getRoot()).toUTF8String(out);
        return out;
    }

    // UTF-8 decoded to code points; ill-formed bytes become U+FFFD
    inline std::u32string codePoints(const std::string& s)
    {
        std::u32string out;
        const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data());
        const int32_t length = static_cast<int32_t>(s.size());
        int32_t i = 0;
        while (i < length) {
            UChar32 c;
            U8_NEXT(p, i, length, c);
            out.push_back(static_cast<char32_t>(c < 0 ? 0xFFFD : c));
        }
        return out;
    }

    // First case-insensitive (simple case folding) occurrence of `needle`.
    // Returns the byte offset and byte length of the match inside `haystack`.
    inline std::optional<std::pair<std::size_t, std::size_t>> findIgnoreCase(
        const std::string& haystack, const std::string& needle)
    {
        std::u32string folded_needle;
        for (char32_t c : codePoints(needle))
            folded_needle.push_back(static_cast<char32_t>(u_foldCase(static_cast<UChar32>(c), U_FOLD_CASE_DEFAULT)));
        if (folded_needle.empty()) return std::nullopt;

        std::u32string folded;
        std::vector<std::size_t> offsets;
        const uint8_t* p = reinterpret_cast<const uint8_t*>(haystack.data());
        const int32_t length = static_cast<int32_t>(haystack.size());
        int32_t i = 0;
        while (i < length) {
            offsets.push_back(static_cast<std::size_t>(i));
            UChar32 c;
            U8_NEXT(p, i, length, c);
            folded.push_back(static_cast<char32_t>(c < 0 ? 0xFFFD : u_foldCase(c, U_FOLD_CASE_DEFAULT)));
        }
        offsets.push_back(haystack.size());

        const std::size_t pos = folded.find(folded_needle);
        if (pos == std::u32string::npos) return std::nullopt;
        const std::size_t begin = offsets[pos];
        return std::make_pair(begin, offsets[pos + folded_needle.size()] - begin);
    }

    // Whole-string integer parse, surrounding whitespace allowed. "2.5", "", "3x" -> nullopt
    inline std::optional<int> parseInt(const std::string& s)
    {
        std::string t = trim(s);
        if (t.empty()) return std::nullopt;

        errno = 0;
        char* end = nullptr;
        long v = std::strtol(t.c_str(), &end, 10);
        if (end != t.c_str() + t.size() || errno == ERANGE) return std::nullopt;
        if (v < INT_MIN || v > INT_MAX) return std::nullopt;
        return static_cast<int>(v);
    }

    inline std::vector<std::string> splitLines(const std::string& s)
    {
        std::vector<std::string> out;
        std::istringstream iss(s);
        std::string line;
        while (std::getline(iss, line)) out.push_back(line);
        return out;
    }
}
