/**
 * @file TestFakes.hpp
 * @brief In-process stand-ins for the portal and the OCR toolchain, shared by the tests.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "application/ExtractionStage.hpp"
#include "application/FetchStage.hpp"
#include "application/NormalizationStage.hpp"
#include "application/PipelineCoordinator.hpp"
#include "application/RateLimiter.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/DecisionSource.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/TextExtractionEngine.hpp"
#include "infrastructure/ContentStoreFs.hpp"
#include "infrastructure/EnvelopeStoreFs.hpp"
#include "infrastructure/ExtractedTextStoreFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/PipelineStateStoreFs.hpp"
#include "infrastructure/RecordStoreFs.hpp"

namespace adaharvest::test {

/**
 * @class ScratchDir
 * @brief Unique directory under the system temp dir, removed on destruction.
 */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& prefix) {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string str() const { return m_path.string(); }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string FakePdfBytes(const std::string& tag) {
    return "%PDF-1.4\n% " + tag + "\n%%EOF\n";
}

/**
 * @class FakeDecisionSource
 * @brief Serves envelopes and documents from memory and counts the calls it gets.
 */
class FakeDecisionSource : public domain::DecisionSource {
public:
    void addDecision(const std::string& ada, nlohmann::json fields, const std::string& documentBytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string url = "https://portal.test/doc/" + std::to_string(m_documents.size());
        fields["ada"] = ada;
        fields["documentUrl"] = url;
        m_decisions[ada] = std::move(fields);
        m_documents[url] = documentBytes;
    }

    void addDecisionWithoutDocument(const std::string& ada, nlohmann::json fields) {
        std::lock_guard<std::mutex> lock(m_mutex);
        fields["ada"] = ada;
        m_decisions[ada] = std::move(fields);
    }

    /** @brief The next @p count detail requests for @p ada fail with HTTP 503. */
    void failTransiently(const std::string& ada, int count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transientFailures[ada] = count;
    }

    void setListing(std::vector<std::vector<std::string>> pages) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pages = std::move(pages);
    }

    void setLatency(std::chrono::milliseconds latency) { m_latency = latency; }

    domain::ListingPage listDecisions(const domain::ListingQuery&, int page, const domain::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++listCalls;
        domain::ListingPage result;
        if (page >= 0 && page < static_cast<int>(m_pages.size())) {
            result.adas = m_pages[static_cast<size_t>(page)];
        }
        result.hasMore = page + 1 < static_cast<int>(m_pages.size());
        return result;
    }

    domain::MetadataEnvelope fetchDecision(const domain::DecisionIdentifier& id,
                                           const domain::CancellationToken& token) override {
        if (m_latency.count() > 0 && !token.sleepFor(m_latency)) {
            throw domain::CancelledError();
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        ++detailCalls;
        auto failures = m_transientFailures.find(id.value());
        if (failures != m_transientFailures.end() && failures->second > 0) {
            --failures->second;
            throw domain::TransientFetchError("HTTP 503 for " + id.value(), 503);
        }
        auto it = m_decisions.find(id.value());
        if (it == m_decisions.end()) {
            throw domain::PermanentFetchError("HTTP 404 for " + id.value(), 404);
        }
        domain::MetadataEnvelope envelope;
        envelope.ada = id.value();
        envelope.fields = it->second;
        envelope.retrievedAt = std::chrono::system_clock::now();
        return envelope;
    }

    domain::DownloadedDocument downloadDocument(const std::string& url, const domain::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++downloadCalls;
        auto it = m_documents.find(url);
        if (it == m_documents.end()) {
            throw domain::PermanentFetchError("HTTP 404 for " + url, 404);
        }
        domain::DownloadedDocument doc;
        doc.bytes = it->second;
        doc.sourceUrl = url;
        doc.contentType = "application/pdf";
        doc.retrievedAt = std::chrono::system_clock::now();
        return doc;
    }

    std::atomic<int> listCalls{0};
    std::atomic<int> detailCalls{0};
    std::atomic<int> downloadCalls{0};

private:
    std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_decisions;
    std::map<std::string, std::string> m_documents;
    std::map<std::string, int> m_transientFailures;
    std::vector<std::vector<std::string>> m_pages;
    std::chrono::milliseconds m_latency{0};
};

/**
 * @class FakeExtractionEngine
 * @brief Scripted engine: every document gets the same inspection and texts.
 */
class FakeExtractionEngine : public domain::TextExtractionEngine {
public:
    Inspection inspection{1, false};
    std::string nativeText;
    std::string ocrText;
    bool failRecognize = false;

    Inspection inspect(const std::string&, const domain::CancellationToken&) override {
        ++inspectCalls;
        return inspection;
    }

    domain::EngineOutput extractNative(const std::string&, const domain::CancellationToken&) override {
        ++nativeCalls;
        return {nativeText, inspection.pageCount};
    }

    domain::EngineOutput recognize(const std::string&, domain::DocumentFormat, const domain::CancellationToken&) override {
        ++ocrCalls;
        if (failRecognize) {
            throw domain::ExtractionError("tesseract could not read the document");
        }
        return {ocrText, inspection.pageCount};
    }

    std::atomic<int> inspectCalls{0};
    std::atomic<int> nativeCalls{0};
    std::atomic<int> ocrCalls{0};
};

/**
 * @struct PipelineHarness
 * @brief Real file-system stores under a scratch root, fake portal and engine.
 */
struct PipelineHarness {
    explicit PipelineHarness(const std::string& prefix)
        : root(prefix),
          persistence(std::make_shared<infrastructure::PersistenceService>()),
          source(std::make_shared<FakeDecisionSource>()),
          engine(std::make_shared<FakeExtractionEngine>()) {
        application::RetryPolicy::Options fast;
        fast.maxAttempts = 3;
        fast.baseDelay = std::chrono::milliseconds(1);
        fast.maxDelay = std::chrono::milliseconds(5);

        deps.states = std::make_shared<infrastructure::PipelineStateStoreFs>(root.str(), persistence);
        deps.content = std::make_shared<infrastructure::ContentStoreFs>(root.str(), persistence);
        deps.envelopes = std::make_shared<infrastructure::EnvelopeStoreFs>(root.str(), persistence);
        deps.records = std::make_shared<infrastructure::RecordStoreFs>(root.str(), persistence);
        deps.fetch = std::make_shared<application::FetchStage>(
            source, std::make_shared<application::RateLimiter>(0.0, 1),
            std::make_shared<application::RetryPolicy>(fast, application::RetryPolicy::IsTransientFetch, 7));
        texts = std::make_shared<infrastructure::ExtractedTextStoreFs>(root.str(), persistence);
        deps.extraction = std::make_shared<application::ExtractionStage>(
            engine, texts, application::ExtractionStage::Options{});
        application::NormalizationStage::Options normalization;
        normalization.datasetRoot = root.str();
        deps.normalization = std::make_shared<application::NormalizationStage>(normalization);
        deps.storageRetry = std::make_shared<application::RetryPolicy>(
            fast, application::RetryPolicy::IsStorage, 7);
    }

    std::shared_ptr<application::PipelineCoordinator> coordinator(const std::string& runId) {
        return std::make_shared<application::PipelineCoordinator>(deps, runId);
    }

    ScratchDir root;
    std::shared_ptr<infrastructure::PersistenceService> persistence;
    std::shared_ptr<FakeDecisionSource> source;
    std::shared_ptr<FakeExtractionEngine> engine;
    std::shared_ptr<infrastructure::ExtractedTextStoreFs> texts;
    application::PipelineCoordinator::Dependencies deps;
};

/** @brief Metadata with every core field present. */
inline nlohmann::json CompleteFields() {
    return {
        {"protocolNumber", "1234/2020"},
        {"issueDate", 1577836800000LL},   // 2020-01-01 00:00 UTC
        {"subject", "Έγκριση δαπάνης"},
        {"organizationId", "100015981"},
        {"unitIds", nlohmann::json::array({"81689"})},
        {"signatories", nlohmann::json::array({"100001234"})},
        {"decisionType", "Β.2.1"},
        {"thematicCategoryIds", nlohmann::json::array({"20", "04", "20"})},
        {"extraFieldValues", {{"awardAmount", {{"amount", "1.234,50"}, {"currency", "EUR"}}}}}
    };
}

} // namespace adaharvest::test
