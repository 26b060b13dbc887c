#include <cassert>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/IdentifierSources.hpp"
#include "domain/PipelineErrors.hpp"
#include "test/TestFakes.hpp"

using namespace adaharvest;
using application::ApiListingIdentifierSource;
using application::ListIdentifierSource;
using application::ManifestIdentifierSource;

namespace {

std::vector<std::string> Drain(domain::IdentifierSource& source) {
    std::vector<std::string> out;
    while (auto id = source.next()) {
        out.push_back(id->value());
    }
    return out;
}

bool RejectsCursor(domain::IdentifierSource& source, const std::string& cursor) {
    try {
        source.resumeFrom(cursor);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool Rejects(const std::string& raw) {
    try {
        domain::DecisionIdentifier id(raw);
    } catch (const domain::ValidationError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IdentifierSource Test..." << std::endl;

    // --- explicit list ---
    {
        std::vector<domain::DecisionIdentifier> ids = {
            domain::DecisionIdentifier("ΑΑΑ1"), domain::DecisionIdentifier("ΒΒΒ2"),
            domain::DecisionIdentifier("ΓΓΓ3")};
        ListIdentifierSource source(ids);
        assert(source.cursor() == "index:0");
        assert(source.next()->value() == "ΑΑΑ1");
        std::string checkpoint = source.cursor();
        assert(checkpoint == "index:1");

        ListIdentifierSource resumed(ids);
        resumed.resumeFrom(checkpoint);
        assert((Drain(resumed) == std::vector<std::string>{"ΒΒΒ2", "ΓΓΓ3"}));
        assert(!resumed.next());

        // Same list, same description; a different list does not match.
        assert(ListIdentifierSource(ids).describe() == source.describe());
        ids.pop_back();
        assert(ListIdentifierSource(ids).describe() != source.describe());

        assert(RejectsCursor(source, "line:1"));
        assert(RejectsCursor(source, "index:x"));
        assert(RejectsCursor(source, "index:9"));
    }
    std::cout << "[PASS] List source and cursor." << std::endl;

    // --- manifest file ---
    {
        test::ScratchDir dir("adaharvest_manifest");
        const std::string path = (dir.path() / "adas.txt").string();
        {
            std::ofstream out(path);
            out << "# harvested 2020\n"
                << "ΩΞ4Θ469Β7Γ-ΑΙΦ\n"
                << "\n"
                << "   \t\n"
                << "6ΨΕΡ46ΜΤΛΡ-ΓΔΠ   # trailing comment\n"
                << "bad\x01id\n"
                << "123456/ΑΒΓ1Ψ-ΞΩΖ\r\n";
        }

        ManifestIdentifierSource source(path);
        assert(source.describe() == "manifest:" + path);
        assert(source.next()->value() == "ΩΞ4Θ469Β7Γ-ΑΙΦ");
        assert(source.next()->value() == "6ΨΕΡ46ΜΤΛΡ-ΓΔΠ");
        std::string checkpoint = source.cursor();
        assert(checkpoint == "line:5");

        ManifestIdentifierSource resumed(path);
        resumed.resumeFrom(checkpoint);
        // The control-character line is skipped, CRLF endings are tolerated.
        assert((Drain(resumed) == std::vector<std::string>{"123456/ΑΒΓ1Ψ-ΞΩΖ"}));

        assert(RejectsCursor(source, "index:1"));
        assert(RejectsCursor(source, "line:100"));

        bool missing = false;
        try {
            ManifestIdentifierSource absent((dir.path() / "absent.txt").string());
        } catch (const std::runtime_error&) {
            missing = true;
        }
        assert(missing);
    }
    std::cout << "[PASS] Manifest source skips comments and unusable lines." << std::endl;

    // --- over-long identifiers are refused, not passed on to the stores ---
    {
        std::string greek;
        for (int i = 0; i < 32; ++i) greek += "Α";
        assert(domain::DecisionIdentifier(greek).storageKey().size() == 64);
        assert(Rejects(greek + "Β"));
        assert(Rejects(std::string(240, 'A')));
        // Percent-encoding can triple the length of the key; 64 bytes still fit a file name.
        assert(domain::DecisionIdentifier(std::string(64, '/')).storageKey().size() == 192);

        test::ScratchDir dir("adaharvest_manifest_long");
        const std::string path = (dir.path() / "adas.txt").string();
        {
            std::ofstream out(path);
            out << "ΩΞ4Θ469Β7Γ-ΑΙΦ\n"
                << std::string(240, 'A') << "\n"
                << greek << greek << "\n"
                << "6ΨΕΡ46ΜΤΛΡ-ΓΔΠ\n";
        }
        ManifestIdentifierSource source(path);
        assert((Drain(source) == std::vector<std::string>{"ΩΞ4Θ469Β7Γ-ΑΙΦ", "6ΨΕΡ46ΜΤΛΡ-ΓΔΠ"}));

        auto portal = std::make_shared<test::FakeDecisionSource>();
        portal->setListing({{"Α1", std::string(240, 'A'), "Α2"}});
        auto fetch = std::make_shared<application::FetchStage>(
            portal, std::make_shared<application::RateLimiter>(0.0, 1),
            std::make_shared<application::RetryPolicy>(application::RetryPolicy::Options{}));
        domain::CancellationToken token;
        ApiListingIdentifierSource listing(fetch, domain::ListingQuery{}, token);
        assert((Drain(listing) == std::vector<std::string>{"Α1", "Α2"}));
    }
    std::cout << "[PASS] Over-long identifiers skipped." << std::endl;

    // --- portal listing ---
    {
        auto source = std::make_shared<test::FakeDecisionSource>();
        source->setListing({{"Α1", "Α2"}, {"Β1", "", "Β2"}, {"Γ1"}});

        application::RetryPolicy::Options fast;
        fast.maxAttempts = 2;
        fast.baseDelay = std::chrono::milliseconds(1);
        fast.maxDelay = std::chrono::milliseconds(1);
        auto fetch = std::make_shared<application::FetchStage>(
            source, std::make_shared<application::RateLimiter>(0.0, 1),
            std::make_shared<application::RetryPolicy>(fast));

        domain::ListingQuery query;
        query.organizationId = "100015981";
        query.fromIssueDate = "2020-01-01";
        query.toIssueDate = "2020-12-31";
        domain::CancellationToken token;

        ApiListingIdentifierSource listing(fetch, query, token);
        assert(listing.describe() == "listing:org=100015981;from=2020-01-01;to=2020-12-31");
        // Pages are requested lazily.
        assert(source->listCalls == 0);
        assert(listing.next()->value() == "Α1");
        assert(source->listCalls == 1);
        assert(listing.next()->value() == "Α2");
        assert(listing.next()->value() == "Β1");
        std::string checkpoint = listing.cursor();
        assert(checkpoint == "page:1:1");

        auto rest = Drain(listing);
        assert((rest == std::vector<std::string>{"Β2", "Γ1"}));
        assert(source->listCalls == 3);

        ApiListingIdentifierSource resumed(fetch, query, token);
        resumed.resumeFrom(checkpoint);
        assert((Drain(resumed) == std::vector<std::string>{"Β2", "Γ1"}));
        // Resuming starts at the checkpoint page, earlier pages are not requested again.
        assert(source->listCalls == 5);

        assert(RejectsCursor(resumed, "page:1"));
        assert(RejectsCursor(resumed, "index:3"));
    }
    std::cout << "[PASS] Listing source pages lazily and resumes mid-page." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
