/**
 * @file Utf8.cpp
 * @brief Implementation of Utf8.
 */

#include "domain/Utf8.hpp"

namespace adaharvest::domain {

size_t Utf8::Decode(const std::string& s, size_t pos, char32_t& codepoint) {
    if (pos >= s.size()) return 0;
    const auto byteAt = [&s](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char lead = byteAt(pos);

    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    }

    size_t length = 0;
    char32_t cp = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; minimum = 0x10000;
    } else {
        return 0;
    }

    if (pos + length > s.size()) return 0;
    for (size_t i = 1; i < length; ++i) {
        unsigned char cont = byteAt(pos + i);
        if ((cont & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < minimum || cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;

    codepoint = cp;
    return length;
}

bool Utf8::IsValid(const std::string& s) {
    size_t pos = 0;
    char32_t cp = 0;
    while (pos < s.size()) {
        size_t n = Decode(s, pos, cp);
        if (n == 0) return false;
        pos += n;
    }
    return true;
}

std::string Utf8::Sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    char32_t cp = 0;
    while (pos < s.size()) {
        size_t n = Decode(s, pos, cp);
        if (n == 0) {
            ++pos;
            continue;
        }
        out.append(s, pos, n);
        pos += n;
    }
    return out;
}

bool Utf8::IsLetter(char32_t cp) {
    if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z')) return true;
    if (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7) return true; // Latin-1 / Extended
    if (cp >= 0x0370 && cp <= 0x03FF && cp != 0x037E && cp != 0x0387) return true; // Greek and Coptic
    if (cp >= 0x1F00 && cp <= 0x1FFF) return true;                                  // Greek Extended
    return false;
}

size_t Utf8::Length(const std::string& s) {
    size_t count = 0;
    size_t pos = 0;
    char32_t cp = 0;
    while (pos < s.size()) {
        size_t n = Decode(s, pos, cp);
        if (n == 0) {
            ++pos;
            continue;
        }
        ++count;
        pos += n;
    }
    return count;
}

} // namespace adaharvest::domain
