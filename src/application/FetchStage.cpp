/**
 * @file FetchStage.cpp
 * @brief Implementation of FetchStage.
 */

#include "application/FetchStage.hpp"
#include "infrastructure/Log.hpp"

#include <sstream>

namespace adaharvest::application {

FetchStage::FetchStage(std::shared_ptr<domain::DecisionSource> source,
                       std::shared_ptr<RateLimiter> rateLimiter,
                       std::shared_ptr<RetryPolicy> retryPolicy)
    : m_source(std::move(source)),
      m_rateLimiter(std::move(rateLimiter)),
      m_retryPolicy(std::move(retryPolicy)) {}

template <typename Fn>
auto FetchStage::paced(const std::string& label, Fn&& fn, const domain::CancellationToken& token)
    -> decltype(fn()) {
    auto attempt = [&]() -> decltype(fn()) {
        m_rateLimiter->acquire(token);
        try {
            return fn();
        } catch (const domain::TransientFetchError& e) {
            if (e.httpStatus() == 429 && e.retryAfter()) {
                m_rateLimiter->pauseFor(*e.retryAfter());
            }
            throw;
        }
    };

    auto onRetry = [&label](int failed, int maxAttempts, std::chrono::milliseconds delay,
                            const std::exception& error) {
        std::ostringstream line;
        line << label << ": " << error.what()
             << ", retry " << (failed + 1) << "/" << maxAttempts
             << " in " << delay.count() << " ms";
        infrastructure::Log::Warn("FetchStage", line.str());
    };

    return m_retryPolicy->execute(attempt, token, onRetry);
}

FetchResult FetchStage::fetch(const domain::DecisionIdentifier& id, const domain::CancellationToken& token) {
    FetchResult result;
    result.envelope = paced(id.value(), [&] { return m_source->fetchDecision(id, token); }, token);

    const std::string url = result.envelope.documentUrl();
    if (url.empty()) {
        throw domain::PermanentFetchError("decision " + id.value() + " names no document");
    }
    result.document = paced(id.value(), [&] { return m_source->downloadDocument(url, token); }, token);
    return result;
}

domain::ListingPage FetchStage::listPage(const domain::ListingQuery& query, int page,
                                         const domain::CancellationToken& token) {
    return paced("listing page " + std::to_string(page),
                 [&] { return m_source->listDecisions(query, page, token); }, token);
}

} // namespace adaharvest::application
