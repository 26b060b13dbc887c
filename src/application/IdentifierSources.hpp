/**
 * @file IdentifierSources.hpp
 * @brief Concrete identifier sources: command-line list, manifest file, portal listing.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/FetchStage.hpp"
#include "domain/IdentifierSource.hpp"

namespace adaharvest::application {

/**
 * @class ListIdentifierSource
 * @brief Fixed, in-memory list. Cursor "index:<n>" is the count already returned.
 */
class ListIdentifierSource : public domain::IdentifierSource {
public:
    explicit ListIdentifierSource(std::vector<domain::DecisionIdentifier> ids);

    std::optional<domain::DecisionIdentifier> next() override;
    std::string cursor() const override;
    void resumeFrom(const std::string& cursor) override;
    std::string describe() const override;

private:
    std::vector<domain::DecisionIdentifier> m_ids;
    size_t m_index = 0;
};

/**
 * @class ManifestIdentifierSource
 * @brief One identifier per line. Blank lines and '#' comments are ignored,
 *        unusable identifiers are skipped with a warning.
 *
 * Cursor "line:<n>" is the number of lines consumed, so edits below the
 * checkpoint do not shift it.
 */
class ManifestIdentifierSource : public domain::IdentifierSource {
public:
    /** @throws std::runtime_error when the manifest cannot be read. */
    explicit ManifestIdentifierSource(const std::string& path);

    std::optional<domain::DecisionIdentifier> next() override;
    std::string cursor() const override;
    void resumeFrom(const std::string& cursor) override;
    std::string describe() const override;

private:
    std::string m_path;
    std::vector<std::string> m_lines;
    size_t m_line = 0;
};

/**
 * @class ApiListingIdentifierSource
 * @brief Pages through the portal's search listing lazily, one page at a time.
 *
 * Cursor "page:<p>:<i>" names the next entry to return. Listing failures that
 * outlive the fetch retry policy propagate out of next().
 */
class ApiListingIdentifierSource : public domain::IdentifierSource {
public:
    ApiListingIdentifierSource(std::shared_ptr<FetchStage> fetch,
                               domain::ListingQuery query,
                               const domain::CancellationToken& token);

    std::optional<domain::DecisionIdentifier> next() override;
    std::string cursor() const override;
    void resumeFrom(const std::string& cursor) override;
    std::string describe() const override;

private:
    bool loadPage();

    std::shared_ptr<FetchStage> m_fetch;
    domain::ListingQuery m_query;
    const domain::CancellationToken& m_token;

    int m_page = 0;
    size_t m_index = 0;
    bool m_loaded = false;
    bool m_exhausted = false;
    domain::ListingPage m_current;
};

} // namespace adaharvest::application
