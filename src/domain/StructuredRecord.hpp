/**
 * @file StructuredRecord.hpp
 * @brief Canonical normalized decision record, the published unit of truth.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adaharvest::domain {

/**
 * @enum FieldState
 * @brief Distinguishes a field the envelope never carried from one it carried in an unusable shape.
 */
enum class FieldState {
    Present,
    Missing,
    Malformed
};

inline std::string FieldStateToString(FieldState state) {
    switch (state) {
        case FieldState::Present: return "present";
        case FieldState::Missing: return "missing";
        case FieldState::Malformed: return "malformed";
    }
    return "missing";
}

/**
 * @brief A canonical field with an explicit unknown state.
 *
 * A Present field always holds a value; Missing and Malformed never do.
 * An empty string or array that the envelope really carried is Present.
 */
template <typename T>
class Field {
public:
    Field() = default;

    static Field Of(T value) { return Field(FieldState::Present, std::move(value)); }
    static Field Missing() { return Field(FieldState::Missing, std::nullopt); }
    static Field Malformed() { return Field(FieldState::Malformed, std::nullopt); }

    FieldState state() const { return m_state; }
    bool isPresent() const { return m_state == FieldState::Present; }
    const T& value() const { return *m_value; }
    const std::optional<T>& optional() const { return m_value; }

    bool operator==(const Field& other) const {
        return m_state == other.m_state && m_value == other.m_value;
    }

private:
    Field(FieldState state, std::optional<T> value) : m_state(state), m_value(std::move(value)) {}

    FieldState m_state = FieldState::Missing;
    std::optional<T> m_value;
};

/**
 * @struct CalendarDate
 * @brief Timezone-naive calendar date.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief YYYY-MM-DD. */
    std::string toIso() const;

    static bool IsValid(int year, int month, int day);

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/**
 * @struct FinancialAmount
 * @brief Fixed-point monetary amount in hundredths of the currency unit.
 */
struct FinancialAmount {
    std::int64_t cents = 0;
    std::string currency;          ///< ISO 4217 code.

    /** @brief Decimal string with exactly two fraction digits ("-12.05"). */
    std::string toDecimalString() const;

    bool operator==(const FinancialAmount& other) const {
        return cents == other.cents && currency == other.currency;
    }
};

/**
 * @enum Completeness
 * @brief How much of the canonical schema could be populated.
 */
enum class Completeness {
    Complete,
    Partial,
    Minimal
};

inline std::string CompletenessToString(Completeness completeness) {
    switch (completeness) {
        case Completeness::Complete: return "complete";
        case Completeness::Partial: return "partial";
        case Completeness::Minimal: return "minimal";
    }
    return "minimal";
}

/** @brief Pointer from a record to the text artifact it was built with. */
struct ExtractedTextRef {
    std::string path;
    std::string method;
    std::string rawHash;
    std::string quality;

    bool operator==(const ExtractedTextRef& other) const {
        return path == other.path && method == other.method &&
               rawHash == other.rawHash && quality == other.quality;
    }
};

/** @brief Pointer from a record to the raw document version it describes. */
struct RawDocumentRef {
    std::string path;
    std::string hash;
    int version = 0;

    bool operator==(const RawDocumentRef& other) const {
        return path == other.path && hash == other.hash && version == other.version;
    }
};

/**
 * @class StructuredRecord
 * @brief Normalized metadata for one decision. Replaced as a whole, never edited in place.
 */
class StructuredRecord {
public:
    static constexpr int SchemaVersion = 1;

    std::string ada;
    Field<std::string> protocolNumber;
    Field<CalendarDate> issueDate;
    Field<std::string> subject;
    Field<std::string> organizationId;
    Field<std::vector<std::string>> unitIds;
    Field<std::vector<std::string>> signatories;
    Field<std::string> decisionType;
    Field<std::vector<FinancialAmount>> financialAmounts;
    Field<std::vector<std::string>> classificationTags;   ///< Deduplicated, sorted.
    std::optional<ExtractedTextRef> extractedTextRef;
    std::optional<RawDocumentRef> rawDocumentRef;
    Completeness completeness = Completeness::Minimal;
    std::vector<std::string> flags;                        ///< Sorted, e.g. "organizationId:nonconforming".

    bool operator==(const StructuredRecord& other) const {
        return ada == other.ada && protocolNumber == other.protocolNumber &&
               issueDate == other.issueDate && subject == other.subject &&
               organizationId == other.organizationId && unitIds == other.unitIds &&
               signatories == other.signatories && decisionType == other.decisionType &&
               financialAmounts == other.financialAmounts &&
               classificationTags == other.classificationTags &&
               extractedTextRef == other.extractedTextRef &&
               rawDocumentRef == other.rawDocumentRef &&
               completeness == other.completeness && flags == other.flags;
    }
};

} // namespace adaharvest::domain
