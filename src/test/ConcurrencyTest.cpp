#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <cassert>
#include "application/HarvestRunner.hpp"
#include "application/IdentifierSources.hpp"
#include "infrastructure/FsSupport.hpp"
#include "test/TestFakes.hpp"

using namespace adaharvest;
using application::HarvestRunner;
using application::ListIdentifierSource;

namespace {

const char* kBody =
    "ΑΠΟΦΑΣΗ\n"
    "Έγκριση δαπάνης για την προμήθεια εξοπλισμού γραφείου, ποσού 1.234,50 €.\n";

std::string Ada(int i) {
    return "ΩΞ4Θ469Β7Γ-" + std::to_string(100 + i);
}

HarvestRunner::Options RunnerOptions(const test::PipelineHarness& h, int workers, bool resume) {
    HarvestRunner::Options options;
    options.outputRoot = h.root.str();
    options.workers = workers;
    options.resume = resume;
    return options;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // --- many identifiers, a few duplicates and one unknown, over four workers ---
    {
        test::PipelineHarness h("adaharvest_runner");
        h.engine->nativeText = kBody;
        h.source->setLatency(std::chrono::milliseconds(5));

        const int NUM_DECISIONS = 24;
        std::vector<domain::DecisionIdentifier> ids;
        for (int i = 0; i < NUM_DECISIONS; ++i) {
            h.source->addDecision(Ada(i), test::CompleteFields(), test::FakePdfBytes(Ada(i)));
            ids.emplace_back(Ada(i));
        }
        ids.emplace_back(Ada(3));
        ids.emplace_back(Ada(7));
        ids.emplace_back("ΑΓΝΩΣΤΗ-ΑΠΟΦΑΣΗ");

        std::cout << "[Test] Harvesting " << ids.size() << " identifiers with 4 workers..." << std::endl;
        auto startTime = std::chrono::steady_clock::now();

        domain::CancellationToken token;
        ListIdentifierSource source(ids);
        HarvestRunner runner(h.coordinator(HarvestRunner::NewRunId()), h.persistence, RunnerOptions(h, 4, false), token);
        auto summary = runner.run(source);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
        std::cout << "[Test] Run took " << elapsed.count() << " ms" << std::endl;
        std::cout << summary.report();

        assert(summary.ok == NUM_DECISIONS);
        assert(summary.skipped + summary.inFlight == 2);
        assert(summary.failed == 1);
        assert(summary.failures.size() == 1);
        assert(summary.failures[0].ada == "ΑΓΝΩΣΤΗ-ΑΠΟΦΑΣΗ");
        assert(summary.failures[0].kind == domain::ErrorKind::PermanentFetch);
        assert(summary.exitCode() == 1);
        assert(h.source->detailCalls == NUM_DECISIONS + 1);
        assert(h.source->downloadCalls == NUM_DECISIONS);

        for (int i = 0; i < NUM_DECISIONS; ++i) {
            assert(h.deps.records->get(domain::DecisionIdentifier(Ada(i))));
        }

        auto written = infrastructure::FsSupport::ReadJsonFile(runner.summaryPath());
        assert(written);
        assert((*written)["counts"]["ok"] == NUM_DECISIONS);
        assert((*written)["exitCode"] == 1);

        auto checkpoint = infrastructure::FsSupport::ReadJsonFile(runner.checkpointPath());
        assert(checkpoint);
        assert((*checkpoint)["cursor"] == "index:" + std::to_string(ids.size()));
        assert((*checkpoint)["source"] == source.describe());

        // A second pass finds nothing to do.
        ListIdentifierSource again(ids);
        HarvestRunner rerun(h.coordinator(HarvestRunner::NewRunId()), h.persistence, RunnerOptions(h, 4, false), token);
        auto second = rerun.run(again);
        assert(second.ok == 0);
        assert(second.skipped == NUM_DECISIONS + 2);
        assert(second.failed == 1);
        assert(h.source->detailCalls == NUM_DECISIONS + 1);

        // Resuming from a finished checkpoint dispenses nothing.
        ListIdentifierSource resumed(ids);
        HarvestRunner resumer(h.coordinator(HarvestRunner::NewRunId()), h.persistence, RunnerOptions(h, 2, true), token);
        auto third = resumer.run(resumed);
        assert(third.ok + third.skipped + third.failed == 0);
        assert(third.exitCode() == 0);
        h.persistence->stop();
    }
    std::cout << "[PASS] Every identifier processed exactly once." << std::endl;

    // --- cancellation mid-run, then resume ---
    {
        test::PipelineHarness h("adaharvest_runner_cancel");
        h.engine->nativeText = kBody;
        h.source->setLatency(std::chrono::milliseconds(200));

        const int NUM_DECISIONS = 10;
        std::vector<domain::DecisionIdentifier> ids;
        for (int i = 0; i < NUM_DECISIONS; ++i) {
            h.source->addDecision(Ada(i), test::CompleteFields(), test::FakePdfBytes(Ada(i)));
            ids.emplace_back(Ada(i));
        }

        domain::CancellationToken token;
        std::thread canceller([&token] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });
        ListIdentifierSource source(ids);
        HarvestRunner runner(h.coordinator(HarvestRunner::NewRunId()), h.persistence, RunnerOptions(h, 2, false), token);
        auto summary = runner.run(source);
        canceller.join();

        assert(summary.cancelled);
        assert(summary.exitCode() == 130);
        assert(summary.ok < NUM_DECISIONS);
        assert(summary.report().find("--resume") != std::string::npos);

        // Nothing is left leased behind.
        auto ledger = h.coordinator("inspect")->ledger();
        for (const auto& id : ids) {
            auto state = ledger.load(id);
            assert(!state || !state->isLeased());
        }

        h.source->setLatency(std::chrono::milliseconds(0));
        domain::CancellationToken fresh;
        ListIdentifierSource restart(ids);
        HarvestRunner resumer(h.coordinator(HarvestRunner::NewRunId()), h.persistence, RunnerOptions(h, 2, true), fresh);
        auto resumedSummary = resumer.run(restart);
        assert(resumedSummary.exitCode() == 0);
        assert(summary.ok + resumedSummary.ok == NUM_DECISIONS);
        // Identifiers interrupted mid-fetch are fetched once, by the resumed run.
        assert(h.source->detailCalls == NUM_DECISIONS);
        for (const auto& id : ids) {
            assert(h.deps.records->get(id));
        }
        h.persistence->stop();
    }
    std::cout << "[PASS] Cancelled run resumed to completion." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
