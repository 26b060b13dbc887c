/**
 * @file FetchStage.hpp
 * @brief Retrieves a decision's metadata envelope and document bytes.
 */

#pragma once

#include <memory>
#include "application/RateLimiter.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/DecisionSource.hpp"

namespace adaharvest::application {

/**
 * @struct FetchResult
 * @brief What one successful fetch produced. Nothing is persisted yet.
 */
struct FetchResult {
    domain::MetadataEnvelope envelope;
    domain::DownloadedDocument document;
};

/**
 * @class FetchStage
 * @brief Detail request then document download, each paced by the shared rate
 *        limiter and wrapped in the retry policy.
 *
 * Throws TransientFetchError once the attempts are exhausted, PermanentFetchError
 * for 404/gone/malformed responses (and for a decision that names no document),
 * CancelledError on shutdown.
 */
class FetchStage {
public:
    FetchStage(std::shared_ptr<domain::DecisionSource> source,
               std::shared_ptr<RateLimiter> rateLimiter,
               std::shared_ptr<RetryPolicy> retryPolicy);

    FetchResult fetch(const domain::DecisionIdentifier& id, const domain::CancellationToken& token);

    /** @brief Listing page through the same pacing and retry rules. */
    domain::ListingPage listPage(const domain::ListingQuery& query, int page, const domain::CancellationToken& token);

private:
    template <typename Fn>
    auto paced(const std::string& label, Fn&& fn, const domain::CancellationToken& token) -> decltype(fn());

    std::shared_ptr<domain::DecisionSource> m_source;
    std::shared_ptr<RateLimiter> m_rateLimiter;
    std::shared_ptr<RetryPolicy> m_retryPolicy;
};

} // namespace adaharvest::application
