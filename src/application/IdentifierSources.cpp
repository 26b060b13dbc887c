/**
 * @file IdentifierSources.cpp
 * @brief Implementation of the identifier sources.
 */

#include "application/IdentifierSources.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/FsSupport.hpp"
#include "infrastructure/Log.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace adaharvest::application {

using infrastructure::Log;

namespace {

// Splits "<prefix>:<n>[:<n>...]" into its numbers; throws on anything else.
std::vector<size_t> ParseCursor(const std::string& cursor, const std::string& prefix, size_t fields) {
    if (cursor.compare(0, prefix.size() + 1, prefix + ":") != 0) {
        throw std::invalid_argument("cursor '" + cursor + "' does not belong to a " + prefix + " source");
    }
    std::vector<size_t> numbers;
    std::stringstream rest(cursor.substr(prefix.size() + 1));
    std::string part;
    while (std::getline(rest, part, ':')) {
        if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos || part.size() > 12) {
            throw std::invalid_argument("malformed cursor '" + cursor + "'");
        }
        numbers.push_back(static_cast<size_t>(std::stoull(part)));
    }
    if (numbers.size() != fields) {
        throw std::invalid_argument("malformed cursor '" + cursor + "'");
    }
    return numbers;
}

std::optional<domain::DecisionIdentifier> TryIdentifier(const std::string& raw, const std::string& where) {
    try {
        return domain::DecisionIdentifier(raw);
    } catch (const domain::ValidationError& e) {
        Log::Warn("IdentifierSource", where + ": skipping unusable identifier: " + e.what());
        return std::nullopt;
    }
}

} // namespace

// --- ListIdentifierSource ---

ListIdentifierSource::ListIdentifierSource(std::vector<domain::DecisionIdentifier> ids)
    : m_ids(std::move(ids)) {}

std::optional<domain::DecisionIdentifier> ListIdentifierSource::next() {
    if (m_index >= m_ids.size()) return std::nullopt;
    return m_ids[m_index++];
}

std::string ListIdentifierSource::cursor() const {
    return "index:" + std::to_string(m_index);
}

void ListIdentifierSource::resumeFrom(const std::string& cursor) {
    size_t index = ParseCursor(cursor, "index", 1)[0];
    if (index > m_ids.size()) {
        throw std::invalid_argument("cursor '" + cursor + "' is past the end of the list");
    }
    m_index = index;
}

std::string ListIdentifierSource::describe() const {
    std::string joined;
    for (const auto& id : m_ids) {
        joined += id.value();
        joined += '\n';
    }
    return "list:" + std::to_string(m_ids.size()) + ":" +
           infrastructure::ContentHasher::HexDigest(joined).substr(0, 16);
}

// --- ManifestIdentifierSource ---

ManifestIdentifierSource::ManifestIdentifierSource(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    m_path = ec ? path : absolute.lexically_normal().string();

    auto content = infrastructure::FsSupport::ReadFile(m_path);
    if (!content) {
        throw std::runtime_error("manifest not found: " + m_path);
    }
    std::stringstream stream(*content);
    std::string line;
    while (std::getline(stream, line)) {
        m_lines.push_back(line);
    }
}

std::optional<domain::DecisionIdentifier> ManifestIdentifierSource::next() {
    while (m_line < m_lines.size()) {
        std::string text = m_lines[m_line++];
        auto hash = text.find('#');
        if (hash != std::string::npos) text.erase(hash);
        if (text.find_first_not_of(" \t\r") == std::string::npos) continue;

        auto id = TryIdentifier(text, m_path + ":" + std::to_string(m_line));
        if (id) return id;
    }
    return std::nullopt;
}

std::string ManifestIdentifierSource::cursor() const {
    return "line:" + std::to_string(m_line);
}

void ManifestIdentifierSource::resumeFrom(const std::string& cursor) {
    size_t line = ParseCursor(cursor, "line", 1)[0];
    if (line > m_lines.size()) {
        throw std::invalid_argument("cursor '" + cursor + "' is past the end of " + m_path);
    }
    m_line = line;
}

std::string ManifestIdentifierSource::describe() const {
    return "manifest:" + m_path;
}

// --- ApiListingIdentifierSource ---

ApiListingIdentifierSource::ApiListingIdentifierSource(std::shared_ptr<FetchStage> fetch,
                                                       domain::ListingQuery query,
                                                       const domain::CancellationToken& token)
    : m_fetch(std::move(fetch)), m_query(std::move(query)), m_token(token) {}

bool ApiListingIdentifierSource::loadPage() {
    m_current = m_fetch->listPage(m_query, m_page, m_token);
    m_loaded = true;
    Log::Info("IdentifierSource", "listing page " + std::to_string(m_page) + ": " +
              std::to_string(m_current.adas.size()) + " decisions");
    return !m_current.adas.empty();
}

std::optional<domain::DecisionIdentifier> ApiListingIdentifierSource::next() {
    while (!m_exhausted) {
        if (!m_loaded && !loadPage() && m_index == 0) {
            m_exhausted = true;
            break;
        }
        if (m_index < m_current.adas.size()) {
            const std::string& raw = m_current.adas[m_index++];
            auto id = TryIdentifier(raw, "listing page " + std::to_string(m_page));
            if (id) return id;
            continue;
        }
        if (!m_current.hasMore) {
            m_exhausted = true;
            break;
        }
        ++m_page;
        m_index = 0;
        m_loaded = false;
    }
    return std::nullopt;
}

std::string ApiListingIdentifierSource::cursor() const {
    return "page:" + std::to_string(m_page) + ":" + std::to_string(m_index);
}

void ApiListingIdentifierSource::resumeFrom(const std::string& cursor) {
    auto numbers = ParseCursor(cursor, "page", 2);
    m_page = static_cast<int>(numbers[0]);
    m_index = numbers[1];
    m_loaded = false;
    m_exhausted = false;
}

std::string ApiListingIdentifierSource::describe() const {
    return "listing:org=" + m_query.organizationId + ";from=" + m_query.fromIssueDate +
           ";to=" + m_query.toIssueDate;
}

} // namespace adaharvest::application
