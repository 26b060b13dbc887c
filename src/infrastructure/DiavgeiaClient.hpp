/**
 * @file DiavgeiaClient.hpp
 * @brief HTTP client for the Diavgeia open-data API.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "domain/DecisionSource.hpp"

namespace adaharvest::infrastructure {

/**
 * @class DiavgeiaClient
 * @brief DecisionSource over cpp-httplib.
 *
 * Maps HTTP outcomes onto the fetch error taxonomy: connection failures, 408, 429
 * and 5xx are transient (429/503 carry the Retry-After hint), 404/410 and other
 * 4xx are permanent, as is a body that is not the expected JSON.
 */
class DiavgeiaClient : public domain::DecisionSource {
public:
    struct Options {
        std::string baseUrl = "https://diavgeia.gov.gr";
        std::string userAgent = "AdaHarvest/1.0";
        int timeoutSeconds = 60;
    };

    explicit DiavgeiaClient(Options options);

    domain::ListingPage listDecisions(const domain::ListingQuery& query, int page,
                                      const domain::CancellationToken& token) override;
    domain::MetadataEnvelope fetchDecision(const domain::DecisionIdentifier& id,
                                           const domain::CancellationToken& token) override;
    domain::DownloadedDocument downloadDocument(const std::string& url,
                                                const domain::CancellationToken& token) override;

    /** @brief Parses a Retry-After value (delta-seconds or IMF-fixdate). */
    static std::optional<std::chrono::milliseconds> ParseRetryAfter(const std::string& value,
                                                                    std::chrono::system_clock::time_point now);

    /** @brief Percent-encodes one path segment (RFC 3986 unreserved characters kept). */
    static std::string EncodePathSegment(const std::string& segment);

private:
    struct Response {
        int status = 0;
        std::string body;
        std::string contentType;
        std::string retryAfter;
    };

    Response get(const std::string& origin, const std::string& pathAndQuery,
                 const domain::CancellationToken& token) const;
    void raiseForStatus(const Response& response, const std::string& what) const;

    Options m_options;
};

} // namespace adaharvest::infrastructure
