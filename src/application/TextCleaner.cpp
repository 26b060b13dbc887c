/**
 * @file TextCleaner.cpp
 * @brief Implementation of TextCleaner.
 */

#include "application/TextCleaner.hpp"
#include "domain/Utf8.hpp"

namespace adaharvest::application {

using domain::Utf8;

namespace {

bool IsWordChar(char32_t cp) {
    return Utf8::IsLetter(cp) || (cp >= '0' && cp <= '9');
}

/** Code point ending right before byte @p end, or 0 when there is none. */
char32_t CodepointBefore(const std::string& s, size_t end) {
    if (end == 0) return 0;
    size_t start = end - 1;
    while (start > 0 && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
        --start;
    }
    char32_t cp = 0;
    size_t n = Utf8::Decode(s, start, cp);
    return (n != 0 && start + n == end) ? cp : 0;
}

char32_t CodepointAt(const std::string& s, size_t pos) {
    if (pos >= s.size()) return 0;
    char32_t cp = 0;
    return Utf8::Decode(s, pos, cp) != 0 ? cp : 0;
}

std::string NormalizeBreaks(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else if (c == '\f') {
            out += "\n\n";
        } else if (c == '\n' || c == '\t' || c >= 0x20) {
            if (c != 0x7F) out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string TrimLineEnds(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::string pending;  // horizontal whitespace not yet known to be trailing
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            pending.push_back(c);
            continue;
        }
        if (c != '\n') {
            out += pending;
        }
        pending.clear();
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string TextCleaner::JoinHyphenation(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '-' && i + 1 < text.size() && text[i + 1] == '\n' &&
            IsWordChar(CodepointBefore(text, i)) && IsWordChar(CodepointAt(text, i + 2))) {
            i += 2;
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string TextCleaner::CollapseBlankLines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    int run = 0;
    for (char c : text) {
        if (c == '\n') {
            if (++run > 2) continue;
        } else {
            run = 0;
        }
        out.push_back(c);
    }
    return out;
}

std::string TextCleaner::Clean(const std::string& raw) {
    std::string text = Utf8::Sanitize(raw);
    text = NormalizeBreaks(text);
    text = TrimLineEnds(text);
    text = JoinHyphenation(text);
    text = CollapseBlankLines(text);

    size_t begin = text.find_first_not_of(" \t\n");
    if (begin == std::string::npos) return {};
    size_t end = text.find_last_not_of(" \t\n");
    return text.substr(begin, end - begin + 1) + "\n";
}

} // namespace adaharvest::application
