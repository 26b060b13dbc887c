/**
 * @file MetadataEnvelope.hpp
 * @brief Unparsed decision metadata exactly as the portal returned it.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace adaharvest::domain {

/**
 * @class MetadataEnvelope
 * @brief Read-only external input. Only the Normalization Stage interprets its fields.
 */
class MetadataEnvelope {
public:
    std::string ada;                 ///< Identifier the envelope was requested for.
    nlohmann::json fields;           ///< Detail endpoint response body.
    std::chrono::system_clock::time_point retrievedAt;

    /** @brief URL of the attached document, empty when the envelope names none. */
    std::string documentUrl() const {
        if (fields.is_object() && fields.contains("documentUrl") && fields["documentUrl"].is_string()) {
            return fields["documentUrl"].get<std::string>();
        }
        return {};
    }
};

} // namespace adaharvest::domain
