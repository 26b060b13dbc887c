/**
 * @file DecisionIdentifier.cpp
 * @brief Implementation of DecisionIdentifier.
 */

#include "domain/DecisionIdentifier.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/Utf8.hpp"

#include <cctype>
#include <cstdio>
#include <string>

namespace adaharvest::domain {

namespace {

// Keeps "<key>.json.<pid>.<n>.tmp" within NAME_MAX even when every byte is percent-encoded.
constexpr size_t kMaxIdentifierBytes = 64;

std::string Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

} // namespace

DecisionIdentifier::DecisionIdentifier(const std::string& raw)
    : m_value(Trim(raw)) {
    if (m_value.empty()) {
        throw ValidationError("decision identifier is empty");
    }
    if (m_value.size() > kMaxIdentifierBytes) {
        throw ValidationError("decision identifier is longer than " +
                              std::to_string(kMaxIdentifierBytes) + " bytes");
    }
    for (unsigned char c : m_value) {
        if (c < 0x20 || c == 0x7F) {
            throw ValidationError("decision identifier contains control characters");
        }
    }
    if (!Utf8::IsValid(m_value)) {
        throw ValidationError("decision identifier is not valid UTF-8");
    }
}

std::string DecisionIdentifier::storageKey() const {
    std::string key;
    key.reserve(m_value.size() + 8);
    for (unsigned char c : m_value) {
        if (c >= 0x80 || std::isalnum(c) || c == '-' || c == '_') {
            key.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            key += buf;
        }
    }
    return key;
}

} // namespace adaharvest::domain
