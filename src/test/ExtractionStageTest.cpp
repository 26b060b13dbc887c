#include <cassert>
#include <iostream>
#include <string>

#include "application/ExtractionStage.hpp"
#include "domain/PipelineErrors.hpp"
#include "test/TestFakes.hpp"

using namespace adaharvest;
using application::ExtractionStage;

namespace {

domain::RawDocument Raw(const std::string& ada, char hashDigit, const std::string& extension) {
    domain::RawDocument raw;
    raw.ada = ada;
    raw.hash = std::string(64, hashDigit);
    raw.version = 1;
    raw.contentType = "application/octet-stream";
    raw.storagePath = "/nonexistent/raw/" + ada + "/" + raw.hash + extension;
    return raw;
}

const char* kBody =
    "ΑΠΟΦΑΣΗ\n"
    "Έγκριση δαπάνης για την προμήθεια εξοπλισμού γραφείου, ποσού 1.234,50 €.\n";

} // namespace

int main() {
    std::cout << "[Test] Starting ExtractionStage Test..." << std::endl;

    test::ScratchDir root("adaharvest_extract");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto texts = std::make_shared<infrastructure::ExtractedTextStoreFs>(root.str(), persistence);
    domain::CancellationToken token;

    // --- a usable text layer is taken as is ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        engine->inspection = {1, false};
        engine->nativeText = kBody;
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});

        auto text = stage.extract(Raw("ΑΔΑ-1", '1', ".pdf"), token);
        assert(text.method == domain::ExtractionMethod::NativeText);
        assert(text.text == kBody);
        assert(text.pageCount == 1);
        assert(!text.storagePath.empty());
        assert(engine->ocrCalls == 0);

        // Same raw hash: served from the store, engine untouched.
        auto again = stage.extract(Raw("ΑΔΑ-1", '1', ".pdf"), token);
        assert(again.text == text.text);
        assert(engine->inspectCalls == 1);
        assert(engine->nativeCalls == 1);
        assert(stage.lookup(Raw("ΑΔΑ-1", '1', ".pdf")));
        assert(!stage.lookup(Raw("ΑΔΑ-1", '2', ".pdf")));
    }
    std::cout << "[PASS] Native text accepted and cached by raw hash." << std::endl;

    // --- a thin text layer falls back to OCR ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        engine->inspection = {1, false};
        engine->nativeText = "Σελ. 1";
        engine->ocrText = kBody;
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});

        auto text = stage.extract(Raw("ΑΔΑ-2", '3', ".pdf"), token);
        assert(text.method == domain::ExtractionMethod::Ocr);
        assert(text.text == kBody);
        assert(engine->nativeCalls == 1);
        assert(engine->ocrCalls == 1);
    }
    std::cout << "[PASS] Thin text layer falls back to OCR." << std::endl;

    // --- OCR never replaces a text layer that carried more ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        engine->inspection = {1, false};
        engine->nativeText = "Σελίδα 1 από 2";
        engine->ocrText = "";
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});

        auto text = stage.extract(Raw("ΑΔΑ-3", '4', ".pdf"), token);
        assert(text.method == domain::ExtractionMethod::NativeText);
        assert(text.text == "Σελίδα 1 από 2\n");
        assert(engine->ocrCalls == 1);
    }
    std::cout << "[PASS] OCR result with less text discarded." << std::endl;

    // --- image-only PDFs and images go straight to OCR ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        engine->inspection = {2, true};
        engine->ocrText = kBody;
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});

        auto scanned = stage.extract(Raw("ΑΔΑ-4", '5', ".pdf"), token);
        assert(scanned.method == domain::ExtractionMethod::Ocr);
        assert(scanned.pageCount == 2);
        assert(engine->nativeCalls == 0);

        auto image = stage.extract(Raw("ΑΔΑ-5", '6', ".png"), token);
        assert(image.method == domain::ExtractionMethod::Ocr);
        // Images are never inspected.
        assert(engine->inspectCalls == 1);
        assert(engine->ocrCalls == 2);
    }
    std::cout << "[PASS] Image-only PDF and image sent to OCR." << std::endl;

    // --- a document without any text is stored as empty ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        engine->inspection = {1, true};
        engine->ocrText = " \n\f ";
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});

        auto text = stage.extract(Raw("ΑΔΑ-6", '7', ".pdf"), token);
        assert(text.quality == domain::TextQuality::Empty);
        assert(text.text.empty());
        assert(text.qualityScore == 0.0);
    }
    std::cout << "[PASS] Blank document yields empty text." << std::endl;

    // --- unreadable documents ---
    {
        auto engine = std::make_shared<test::FakeExtractionEngine>();
        ExtractionStage stage(engine, texts, ExtractionStage::Options{});
        bool rejected = false;
        try {
            stage.extract(Raw("ΑΔΑ-7", '8', ".bin"), token);
        } catch (const domain::ExtractionError&) {
            rejected = true;
        }
        assert(rejected);
        assert(engine->inspectCalls == 0);
        assert(engine->ocrCalls == 0);

        engine->inspection = {1, true};
        engine->failRecognize = true;
        bool failed = false;
        try {
            stage.extract(Raw("ΑΔΑ-8", '9', ".pdf"), token);
        } catch (const domain::ExtractionError&) {
            failed = true;
        }
        assert(failed);
        assert(!stage.lookup(Raw("ΑΔΑ-8", '9', ".pdf")));
    }
    std::cout << "[PASS] Unknown formats and engine failures raise ExtractionError." << std::endl;

    // --- quality heuristic ---
    {
        assert(ExtractionStage::ScoreQuality("", 1, 1200.0) == 0.0);
        assert(ExtractionStage::ScoreQuality(std::string(1200, 'a'), 1, 1200.0) == 1.0);
        // Half of the visible characters are noise.
        assert(ExtractionStage::ScoreQuality(std::string(600, 'a') + std::string(600, '~'), 1, 1200.0) == 0.5);
        // Sparse for its page count.
        assert(ExtractionStage::ScoreQuality(std::string(120, 'a'), 1, 1200.0) == 0.1);
        assert(ExtractionStage::ScoreQuality(std::string(1200, 'a'), 2, 1200.0) == 0.5);

        assert(ExtractionStage::CountVisible("α β\nγ\t") == 3);
        assert(domain::TextQualityFromScore(0.8, false) == domain::TextQuality::High);
        assert(domain::TextQualityFromScore(0.5, false) == domain::TextQuality::Medium);
        assert(domain::TextQualityFromScore(0.1, false) == domain::TextQuality::Low);
        assert(domain::TextQualityFromScore(0.0, true) == domain::TextQuality::Empty);
    }
    std::cout << "[PASS] Quality scored and bucketed." << std::endl;

    persistence->stop();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
