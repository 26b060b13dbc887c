/**
 * @file DiavgeiaClient.cpp
 * @brief Implementation of DiavgeiaClient.
 */

#include "infrastructure/DiavgeiaClient.hpp"
#include "domain/PipelineErrors.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace adaharvest::infrastructure {

using json = nlohmann::json;
using domain::PermanentFetchError;
using domain::TransientFetchError;

namespace {

constexpr const char* kDecisionPath = "/luminapi/opendata/decisions/";
constexpr const char* kSearchPath = "/luminapi/opendata/search";

struct SplitUrl {
    std::string origin;  ///< scheme://host[:port]
    std::string path;    ///< starts with '/'
};

SplitUrl Split(const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) {
        throw PermanentFetchError("not an absolute URL: " + url);
    }
    auto slash = url.find('/', scheme + 3);
    if (slash == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, slash), url.substr(slash)};
}

std::string TrimSlash(std::string path) {
    while (!path.empty() && path.back() == '/') path.pop_back();
    return path;
}

std::string EncodeQueryValue(const std::string& value) {
    return DiavgeiaClient::EncodePathSegment(value);
}

} // namespace

DiavgeiaClient::DiavgeiaClient(Options options) : m_options(std::move(options)) {}

std::string DiavgeiaClient::EncodePathSegment(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size() * 3);
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::chrono::milliseconds> DiavgeiaClient::ParseRetryAfter(const std::string& value,
                                                                         std::chrono::system_clock::time_point now) {
    if (value.empty()) return std::nullopt;

    bool digits = true;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            digits = false;
            break;
        }
    }
    if (digits) {
        if (value.size() > 9) return std::nullopt;
        return std::chrono::milliseconds(std::stoll(value) * 1000);
    }

    std::tm tm{};
    char zone[4] = {0};
    char weekday[4] = {0};
    char month[4] = {0};
    int day = 0, year = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(value.c_str(), "%3s, %d %3s %d %d:%d:%d %3s",
                    weekday, &day, month, &year, &hour, &minute, &second, zone) != 8) {
        return std::nullopt;
    }
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    int monthIndex = -1;
    for (int i = 0; i < 12; ++i) {
        if (std::string(months[i]) == month) monthIndex = i;
    }
    if (monthIndex < 0) return std::nullopt;

    tm.tm_year = year - 1900;
    tm.tm_mon = monthIndex;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    auto at = std::chrono::system_clock::from_time_t(::timegm(&tm));
    if (at <= now) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(at - now);
}

DiavgeiaClient::Response DiavgeiaClient::get(const std::string& origin, const std::string& pathAndQuery,
                                             const domain::CancellationToken& token) const {
    httplib::Client cli(origin);
    if (!cli.is_valid()) {
        throw PermanentFetchError("unsupported URL origin: " + origin);
    }
    cli.set_connection_timeout(m_options.timeoutSeconds, 0);
    cli.set_read_timeout(m_options.timeoutSeconds, 0);
    cli.set_follow_location(true);

    httplib::Headers headers = {
        {"User-Agent", m_options.userAgent},
        {"Accept", "application/json, application/pdf, */*"}
    };

    Response response;
    auto res = cli.Get(pathAndQuery, headers, [&](const char* data, size_t length) {
        response.body.append(data, length);
        return !token.isCancelled();
    });

    if (token.isCancelled()) {
        throw domain::CancelledError();
    }
    if (!res) {
        throw TransientFetchError("GET " + origin + pathAndQuery + " failed: " + httplib::to_string(res.error()));
    }

    response.status = res->status;
    response.contentType = res->get_header_value("Content-Type");
    response.retryAfter = res->get_header_value("Retry-After");
    return response;
}

void DiavgeiaClient::raiseForStatus(const Response& response, const std::string& what) const {
    const int status = response.status;
    if (status >= 200 && status < 300) return;

    std::string message = what + ": HTTP " + std::to_string(status);
    if (status == 408 || status == 429 || status >= 500) {
        auto hint = ParseRetryAfter(response.retryAfter, std::chrono::system_clock::now());
        throw TransientFetchError(message, status, hint);
    }
    throw PermanentFetchError(message, status);
}

domain::ListingPage DiavgeiaClient::listDecisions(const domain::ListingQuery& query, int page,
                                                  const domain::CancellationToken& token) {
    auto base = Split(m_options.baseUrl);
    std::string target = TrimSlash(base.path) + kSearchPath +
                         "?page=" + std::to_string(page) +
                         "&size=" + std::to_string(query.pageSize);
    if (!query.organizationId.empty()) target += "&org=" + EncodeQueryValue(query.organizationId);
    if (!query.fromIssueDate.empty()) target += "&from_issue_date=" + EncodeQueryValue(query.fromIssueDate);
    if (!query.toIssueDate.empty()) target += "&to_issue_date=" + EncodeQueryValue(query.toIssueDate);

    auto response = get(base.origin, target, token);
    raiseForStatus(response, "listing page " + std::to_string(page));

    domain::ListingPage result;
    try {
        auto body = json::parse(response.body);
        const auto& decisions = body.at("decisions");
        for (const auto& decision : decisions) {
            result.adas.push_back(decision.at("ada").get<std::string>());
        }
        if (body.contains("info") && body["info"].contains("total")) {
            long long total = body["info"]["total"].get<long long>();
            result.hasMore = static_cast<long long>(page + 1) * query.pageSize < total;
        } else {
            result.hasMore = static_cast<int>(result.adas.size()) == query.pageSize;
        }
    } catch (const json::exception& e) {
        throw PermanentFetchError("malformed listing page " + std::to_string(page) + ": " + e.what());
    }
    return result;
}

domain::MetadataEnvelope DiavgeiaClient::fetchDecision(const domain::DecisionIdentifier& id,
                                                       const domain::CancellationToken& token) {
    auto base = Split(m_options.baseUrl);
    std::string target = TrimSlash(base.path) + kDecisionPath + EncodePathSegment(id.value()) + ".json";

    auto response = get(base.origin, target, token);
    raiseForStatus(response, "decision " + id.value());

    domain::MetadataEnvelope envelope;
    envelope.ada = id.value();
    envelope.retrievedAt = std::chrono::system_clock::now();
    try {
        envelope.fields = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw PermanentFetchError("malformed detail response for " + id.value() + ": " + e.what());
    }
    if (!envelope.fields.is_object()) {
        throw PermanentFetchError("detail response for " + id.value() + " is not a JSON object");
    }
    return envelope;
}

domain::DownloadedDocument DiavgeiaClient::downloadDocument(const std::string& url,
                                                            const domain::CancellationToken& token) {
    auto target = Split(url);
    auto response = get(target.origin, target.path, token);
    raiseForStatus(response, "document " + url);

    if (response.body.empty()) {
        throw PermanentFetchError("document " + url + " has an empty body");
    }

    domain::DownloadedDocument document;
    document.bytes = std::move(response.body);
    document.sourceUrl = url;
    document.contentType = response.contentType;
    document.retrievedAt = std::chrono::system_clock::now();
    return document;
}

} // namespace adaharvest::infrastructure
