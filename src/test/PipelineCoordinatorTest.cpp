#include <cassert>
#include <filesystem>
#include <iostream>
#include <thread>

#include "application/PipelineCoordinator.hpp"
#include "test/TestFakes.hpp"

using namespace adaharvest;
using application::ProcessStatus;
using domain::Stage;

namespace {

const char* kBody =
    "ΑΠΟΦΑΣΗ\n"
    "Έγκριση δαπάνης για την προμήθεια εξοπλισμού γραφείου, ποσού 1.234,50 €.\n";

bool HasFlag(const domain::StructuredRecord& record, const std::string& flag) {
    for (const auto& f : record.flags) {
        if (f == flag) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PipelineCoordinator Test..." << std::endl;
    domain::CancellationToken token;

    // --- full run, then idempotent re-run ---
    {
        test::PipelineHarness h("adaharvest_coord_full");
        h.engine->nativeText = kBody;
        const domain::DecisionIdentifier id("ΩΞ4Θ469Β7Γ-ΑΙΦ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("full"));

        auto first = h.coordinator("run-1")->process(id, token);
        assert(first.status == ProcessStatus::Completed);

        auto record = h.deps.records->get(id);
        assert(record);
        assert(record->completeness == domain::Completeness::Complete);
        assert(record->extractedTextRef->method == "native");
        assert(record->rawDocumentRef->version == 1);

        auto state = h.coordinator("run-1")->ledger().load(id);
        assert(state->stage == Stage::Complete);
        assert(!state->isLeased());
        assert(state->attempts["fetch"] == 1);

        auto second = h.coordinator("run-2")->process(id, token);
        assert(second.status == ProcessStatus::Skipped);
        assert(h.source->detailCalls == 1);
        assert(h.source->downloadCalls == 1);
        assert(h.engine->nativeCalls == 1);
        h.persistence->stop();
    }
    std::cout << "[PASS] Completed once, skipped on re-run." << std::endl;

    // --- a run that died after fetching resumes without fetching again ---
    {
        test::PipelineHarness h("adaharvest_coord_resume");
        h.engine->nativeText = kBody;
        const domain::DecisionIdentifier id("6ΨΕΡ46ΜΤΛΡ-ΓΔΠ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("resume"));

        // The dead run fetched and stored everything, then died while extracting.
        auto dead = h.coordinator("dead-run");
        auto begin = dead->ledger().tryBegin(id, "dead-run/w0");
        assert(begin.status == application::BeginStatus::Acquired);
        auto fetched = h.deps.fetch->fetch(id, token);
        auto raw = h.deps.content->put(id, fetched.document);
        auto envelopeHash = h.deps.envelopes->put(id, fetched.envelope);
        dead->ledger().transition(id, "dead-run/w0", [&](domain::PipelineState& s) {
            s.stage = Stage::Extracting;
            s.rawHash = raw.hash;
            s.rawVersion = raw.version;
            s.envelopeHash = envelopeHash;
        });

        auto outcome = h.coordinator("run-2")->process(id, token);
        assert(outcome.status == ProcessStatus::Completed);
        assert(h.source->detailCalls == 1);
        assert(h.source->downloadCalls == 1);
        assert(h.engine->nativeCalls == 1);
        assert(h.deps.records->get(id)->rawDocumentRef->hash == raw.hash);
        h.persistence->stop();
    }
    std::cout << "[PASS] Dead run's lease reclaimed, resumed after fetch." << std::endl;

    // --- two workers on one identifier: only one does the work ---
    {
        test::PipelineHarness h("adaharvest_coord_race");
        h.engine->nativeText = kBody;
        h.source->setLatency(std::chrono::milliseconds(100));
        const domain::DecisionIdentifier id("ΒΛ2Ω4653Π8-ΛΜΝ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("race"));

        auto coordinator = h.coordinator("run-1");
        application::ProcessOutcome a;
        application::ProcessOutcome b;
        std::thread t1([&] { a = coordinator->process(id, token, "w0"); });
        std::thread t2([&] { b = coordinator->process(id, token, "w1"); });
        t1.join();
        t2.join();

        const bool aWorked = a.status == ProcessStatus::Completed;
        const bool bWorked = b.status == ProcessStatus::Completed;
        assert(aWorked != bWorked);
        const auto& other = aWorked ? b : a;
        assert(other.status == ProcessStatus::InFlight || other.status == ProcessStatus::Skipped);
        assert(h.source->detailCalls == 1);
        assert(h.source->downloadCalls == 1);
        h.persistence->stop();
    }
    std::cout << "[PASS] Concurrent attempts on one identifier fetched once." << std::endl;

    // --- scanned two-page decision whose metadata carries only the issue date ---
    {
        test::PipelineHarness h("adaharvest_coord_scan");
        h.engine->inspection = {2, true};
        h.engine->ocrText = kBody;
        const domain::DecisionIdentifier id("123456/ΑΒΓ1Ψ-ΞΩΖ");
        nlohmann::json fields = {{"issueDate", 1577836800000LL}};
        h.source->addDecision(id.value(), fields, test::FakePdfBytes("scan"));

        auto outcome = h.coordinator("run-1")->process(id, token);
        assert(outcome.status == ProcessStatus::Degraded);
        assert(outcome.errorKind == domain::ErrorKind::None);

        auto record = h.deps.records->get(id);
        assert(record->completeness == domain::Completeness::Partial);
        assert(record->subject.state() == domain::FieldState::Missing);
        assert(record->financialAmounts.state() == domain::FieldState::Missing);
        assert(record->issueDate.value().toIso() == "2020-01-01");
        assert(record->extractedTextRef->method == "ocr");
        auto versions = h.deps.content->versions(id);
        assert(versions.size() == 1);
        assert(record->extractedTextRef->rawHash == versions[0].hash);
        assert(h.engine->nativeCalls == 0);
        assert(h.engine->ocrCalls == 1);
        // The identifier's '/' never becomes a directory.
        assert(std::filesystem::exists(h.deps.records->pathFor(id)));
        assert(h.deps.records->pathFor(id).find("123456%2F") != std::string::npos);
        h.persistence->stop();
    }
    std::cout << "[PASS] Scanned decision yields a partial OCR record." << std::endl;

    // --- extraction failure still publishes a record ---
    {
        test::PipelineHarness h("adaharvest_coord_noext");
        h.engine->inspection = {1, true};
        h.engine->failRecognize = true;
        const domain::DecisionIdentifier id("ΨΩΩ1469Β7Γ-ΚΛΜ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("noext"));

        auto outcome = h.coordinator("run-1")->process(id, token);
        assert(outcome.status == ProcessStatus::Degraded);
        assert(outcome.errorKind == domain::ErrorKind::Extraction);

        auto record = h.deps.records->get(id);
        assert(!record->extractedTextRef);
        assert(record->rawDocumentRef);
        assert(HasFlag(*record, "extractedText:failed"));

        auto state = h.coordinator("run-1")->ledger().load(id);
        assert(state->stage == Stage::Complete);
        assert(state->extractionFailed);
        h.persistence->stop();
    }
    std::cout << "[PASS] Extraction failure degrades the record." << std::endl;

    // --- permanent failures are terminal until reset ---
    {
        test::PipelineHarness h("adaharvest_coord_perm");
        h.engine->nativeText = kBody;
        const domain::DecisionIdentifier missing("ΑΓΝ0ΣΤ0-ΑΔΑ");
        const domain::DecisionIdentifier noDocument("ΧΩΡΙΣ-ΕΓΓΡΑΦΟ");
        h.source->addDecisionWithoutDocument(noDocument.value(), test::CompleteFields());

        auto coordinator = h.coordinator("run-1");
        auto outcome = coordinator->process(missing, token);
        assert(outcome.status == ProcessStatus::Failed);
        assert(outcome.errorKind == domain::ErrorKind::PermanentFetch);
        auto state = coordinator->ledger().load(missing);
        assert(state->stage == Stage::Failed);
        assert(!state->isLeased());
        assert(state->lastErrorKind == domain::ErrorKind::PermanentFetch);

        // Stays failed without another request.
        assert(coordinator->process(missing, token).status == ProcessStatus::Failed);
        assert(h.source->detailCalls == 1);

        assert(coordinator->process(noDocument, token).status == ProcessStatus::Failed);
        assert(h.source->downloadCalls == 0);
        assert(!h.deps.records->get(noDocument));

        // Published later: an explicit reset lets it through.
        h.source->addDecision(missing.value(), test::CompleteFields(), test::FakePdfBytes("late"));
        assert(coordinator->ledger().resetFailed(missing));
        assert(coordinator->ledger().load(missing)->stage == Stage::Pending);
        assert(coordinator->process(missing, token).status == ProcessStatus::Completed);
        assert(!coordinator->ledger().resetFailed(missing));
        h.persistence->stop();
    }
    std::cout << "[PASS] Permanent failures recorded and resettable." << std::endl;

    // --- transient failures outliving the retries leave the identifier pending ---
    {
        test::PipelineHarness h("adaharvest_coord_transient");
        h.engine->nativeText = kBody;
        const domain::DecisionIdentifier id("ΤΡΝ4Θ469Β7-ΣΦΑ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("flaky"));
        h.source->failTransiently(id.value(), 3);

        auto coordinator = h.coordinator("run-1");
        auto outcome = coordinator->process(id, token);
        assert(outcome.status == ProcessStatus::Failed);
        assert(outcome.errorKind == domain::ErrorKind::TransientFetch);
        assert(h.source->detailCalls == 3);

        auto state = coordinator->ledger().load(id);
        assert(state->stage == Stage::Pending);
        assert(!state->isLeased());
        assert(state->lastErrorKind == domain::ErrorKind::TransientFetch);
        assert(state->lastError.find("503") != std::string::npos);

        // The next attempt goes through without a reset.
        assert(coordinator->process(id, token).status == ProcessStatus::Completed);
        assert(coordinator->ledger().load(id)->lastErrorKind == domain::ErrorKind::None);
        h.persistence->stop();
    }
    std::cout << "[PASS] Exhausted transient failures stay retryable." << std::endl;

    // --- cancellation mid-fetch rolls the identifier back ---
    {
        test::PipelineHarness h("adaharvest_coord_cancel");
        h.source->setLatency(std::chrono::milliseconds(10000));
        const domain::DecisionIdentifier id("ΑΚΥΡ469Β7Γ-ΩΩΩ");
        h.source->addDecision(id.value(), test::CompleteFields(), test::FakePdfBytes("cancel"));

        domain::CancellationToken cancel;
        std::thread canceller([&cancel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            cancel.cancel();
        });
        auto coordinator = h.coordinator("run-1");
        auto outcome = coordinator->process(id, cancel);
        canceller.join();

        assert(outcome.status == ProcessStatus::Cancelled);
        auto state = coordinator->ledger().load(id);
        assert(state->stage == Stage::Pending);
        assert(!state->isLeased());
        h.persistence->stop();
    }
    std::cout << "[PASS] Cancelled identifier left pending and unleased." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
