/**
 * @file NormalizationStage.hpp
 * @brief Maps a raw metadata envelope onto the canonical structured record.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ExtractedText.hpp"
#include "domain/MetadataEnvelope.hpp"
#include "domain/RawDocument.hpp"
#include "domain/StructuredRecord.hpp"

namespace adaharvest::application {

/**
 * @class NormalizationStage
 * @brief Pure function from (envelope, text, raw document) to StructuredRecord.
 *
 * Only an unusable decision identifier raises ValidationError. Every other field
 * that is absent or unreadable ends up Missing or Malformed, and the record's
 * completeness reflects how much of the core schema was populated.
 *
 * Core fields: protocolNumber, issueDate, subject, organizationId, decisionType,
 * signatories. complete = all core fields and a text reference; minimal = none.
 */
class NormalizationStage {
public:
    struct Options {
        std::string defaultCurrency = "EUR";
        std::string datasetRoot;   ///< Artifact paths in the record are made relative to it.
    };

    explicit NormalizationStage(Options options);

    /**
     * @param text Extracted text, or std::nullopt when extraction failed.
     * @param raw  Raw document version the text came from.
     */
    domain::StructuredRecord normalize(const domain::MetadataEnvelope& envelope,
                                       const std::optional<domain::ExtractedText>& text,
                                       const std::optional<domain::RawDocument>& raw) const;

    /**
     * @brief Accepts epoch milliseconds (number or digit string, read as Athens civil
     *        time), ISO dates and date-times (date part kept as written) and
     *        d/M/yyyy with '/', '-' or '.' separators.
     */
    static std::optional<domain::CalendarDate> ParseDate(const nlohmann::json& value);

    /** @brief Civil date in Europe/Athens (EET/EEST) of an epoch-millisecond instant. */
    static domain::CalendarDate AthensDateFromEpochMillis(std::int64_t millis);

    /**
     * @brief Parses an amount given as a number or as a string in either decimal
     *        convention ("1.234,50", "1,234.50", "1234.5", "€ 12,00").
     * @param currency Explicit currency value, or null.
     */
    static std::optional<domain::FinancialAmount> ParseAmount(const nlohmann::json& amount,
                                                              const nlohmann::json& currency,
                                                              const std::string& defaultCurrency);

    /** @brief Portal organization/unit ids are 1 to 10 ASCII digits. */
    static bool IsConformingId(const std::string& value);

    /** @brief Decision type codes: a letter or number head and up to four dotted numeric parts ("Β.1.3"). */
    static bool IsDecisionTypeCode(const std::string& value);

private:
    Options m_options;

    std::string relativePath(const std::string& path) const;
};

} // namespace adaharvest::application
