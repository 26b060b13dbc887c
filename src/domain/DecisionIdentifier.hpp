/**
 * @file DecisionIdentifier.hpp
 * @brief Value object for the portal's unique posting identifier (ADA).
 */

#pragma once

#include <functional>
#include <string>

namespace adaharvest::domain {

/**
 * @class DecisionIdentifier
 * @brief Immutable, validated ADA. Primary key of every derived artifact.
 *
 * Construction trims surrounding whitespace and throws ValidationError when the
 * result is empty, longer than 64 bytes, contains control characters or is not
 * valid UTF-8.
 */
class DecisionIdentifier {
public:
    explicit DecisionIdentifier(const std::string& raw);

    const std::string& value() const { return m_value; }

    /**
     * @brief File-system safe key derived from the ADA.
     *
     * ASCII letters, digits, '-' and '_' and all non-ASCII UTF-8 bytes are kept;
     * every other byte is percent-encoded ("123/Α" -> "123%2FΑ"). The mapping is injective.
     */
    std::string storageKey() const;

    bool operator==(const DecisionIdentifier& other) const { return m_value == other.m_value; }
    bool operator!=(const DecisionIdentifier& other) const { return m_value != other.m_value; }
    bool operator<(const DecisionIdentifier& other) const { return m_value < other.m_value; }

private:
    std::string m_value;
};

} // namespace adaharvest::domain

namespace std {
template <>
struct hash<adaharvest::domain::DecisionIdentifier> {
    size_t operator()(const adaharvest::domain::DecisionIdentifier& id) const {
        return std::hash<std::string>()(id.value());
    }
};
} // namespace std
