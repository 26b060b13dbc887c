/**
 * @file TextCleaner.hpp
 * @brief Post-processing applied to every extraction result before it is stored.
 */

#pragma once

#include <string>

namespace adaharvest::application {

class TextCleaner {
public:
    /**
     * @brief Produces valid, tidy UTF-8 text.
     *
     * Drops invalid UTF-8 and control characters, turns page form feeds into blank
     * lines, rejoins words hyphenated across a line break and collapses runs of
     * blank lines to a single one. Deterministic: same input, same output.
     */
    static std::string Clean(const std::string& raw);

    /** @brief "λέ-\nξη" -> "λέξη" when both sides of the break are letters or digits. */
    static std::string JoinHyphenation(const std::string& text);

    /** @brief Three or more consecutive newlines become two. */
    static std::string CollapseBlankLines(const std::string& text);
};

} // namespace adaharvest::application
