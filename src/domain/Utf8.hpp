/**
 * @file Utf8.hpp
 * @brief Minimal UTF-8 decoding helpers used by identifier validation and text cleanup.
 */

#pragma once

#include <cstddef>
#include <string>

namespace adaharvest::domain {

class Utf8 {
public:
    /**
     * @brief Decodes one code point starting at @p pos.
     * @return Number of bytes consumed, or 0 when the sequence at @p pos is invalid
     *         (overlong, surrogate, out of range or truncated).
     */
    static size_t Decode(const std::string& s, size_t pos, char32_t& codepoint);

    static bool IsValid(const std::string& s);

    /** @brief Drops every invalid byte sequence, keeping the valid ones untouched. */
    static std::string Sanitize(const std::string& s);

    /** @brief Letters of the Latin and Greek scripts, ASCII digits excluded. */
    static bool IsLetter(char32_t cp);

    /** @brief Number of valid code points. */
    static size_t Length(const std::string& s);
};

} // namespace adaharvest::domain
