/**
 * @file DecisionSource.hpp
 * @brief Port to the remote transparency portal.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/CancellationToken.hpp"
#include "domain/DecisionIdentifier.hpp"
#include "domain/MetadataEnvelope.hpp"
#include "domain/RawDocument.hpp"

namespace adaharvest::domain {

/**
 * @struct ListingQuery
 * @brief Filter for the portal's search listing. Empty members are not sent.
 */
struct ListingQuery {
    std::string organizationId;
    std::string fromIssueDate;     ///< YYYY-MM-DD, inclusive.
    std::string toIssueDate;       ///< YYYY-MM-DD, inclusive.
    int pageSize = 100;
};

/**
 * @struct ListingPage
 * @brief One page of decision identifiers in the portal's stable listing order.
 */
struct ListingPage {
    std::vector<std::string> adas;
    bool hasMore = false;
};

/**
 * @class DecisionSource
 * @brief Abstract interface for the listing, detail and document endpoints.
 *
 * Implementations throw TransientFetchError for retryable conditions,
 * PermanentFetchError otherwise, and CancelledError when @p token fires mid-call.
 */
class DecisionSource {
public:
    virtual ~DecisionSource() = default;

    /** @brief Fetches listing page @p page (0-based). */
    virtual ListingPage listDecisions(const ListingQuery& query, int page, const CancellationToken& token) = 0;

    /** @brief Fetches the metadata envelope of one decision. */
    virtual MetadataEnvelope fetchDecision(const DecisionIdentifier& id, const CancellationToken& token) = 0;

    /** @brief Downloads a document verbatim. */
    virtual DownloadedDocument downloadDocument(const std::string& url, const CancellationToken& token) = 0;
};

} // namespace adaharvest::domain
