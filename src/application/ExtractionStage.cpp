/**
 * @file ExtractionStage.cpp
 * @brief Implementation of ExtractionStage.
 */

#include "application/ExtractionStage.hpp"
#include "application/TextCleaner.hpp"
#include "domain/DecisionIdentifier.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/Utf8.hpp"
#include "infrastructure/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>

namespace adaharvest::application {

using domain::ExtractedText;
using domain::ExtractionMethod;
using domain::Utf8;

namespace {

bool IsSpace(char32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
           cp == 0x00A0 || cp == 0x2009 || cp == 0x202F;
}

bool IsRecognised(char32_t cp) {
    if (Utf8::IsLetter(cp) || (cp >= '0' && cp <= '9')) return true;
    if (cp < 0x80) return std::strchr(".,;:!?()[]-/%$'\"&+*=#@_", static_cast<char>(cp)) != nullptr;
    switch (cp) {
        case 0x00AB: case 0x00BB:   // « »
        case 0x00A7: case 0x00B0:   // § °
        case 0x0387: case 0x037E:   // Greek ano teleia, question mark
        case 0x2013: case 0x2014:   // dashes
        case 0x2018: case 0x2019: case 0x201C: case 0x201D:
        case 0x20AC:                // €
            return true;
        default:
            return false;
    }
}

} // namespace

ExtractionStage::ExtractionStage(std::shared_ptr<domain::TextExtractionEngine> engine,
                                 std::shared_ptr<infrastructure::ExtractedTextStoreFs> store,
                                 Options options)
    : m_engine(std::move(engine)), m_store(std::move(store)), m_options(options) {}

std::size_t ExtractionStage::CountVisible(const std::string& text) {
    std::size_t count = 0;
    size_t pos = 0;
    char32_t cp = 0;
    while (pos < text.size()) {
        size_t n = Utf8::Decode(text, pos, cp);
        if (n == 0) {
            ++pos;
            continue;
        }
        if (!IsSpace(cp)) ++count;
        pos += n;
    }
    return count;
}

double ExtractionStage::ScoreQuality(const std::string& text, int pageCount, double expectedCharsPerPage) {
    std::size_t visible = 0;
    std::size_t recognised = 0;
    size_t pos = 0;
    char32_t cp = 0;
    while (pos < text.size()) {
        size_t n = Utf8::Decode(text, pos, cp);
        if (n == 0) {
            ++pos;
            continue;
        }
        pos += n;
        if (IsSpace(cp)) continue;
        ++visible;
        if (IsRecognised(cp)) ++recognised;
    }
    if (visible == 0) return 0.0;

    double ratio = static_cast<double>(recognised) / static_cast<double>(visible);
    double expected = std::max(1, pageCount) * std::max(1.0, expectedCharsPerPage);
    double density = std::min(1.0, static_cast<double>(visible) / expected);
    return std::round(ratio * density * 1000.0) / 1000.0;
}

ExtractedText ExtractionStage::build(const domain::RawDocument& document, ExtractionMethod method,
                                     std::string cleaned, int pageCount) const {
    ExtractedText result;
    result.ada = document.ada;
    result.rawHash = document.hash;
    result.method = method;
    result.pageCount = std::max(1, pageCount);
    result.characterCount = Utf8::Length(cleaned);
    result.qualityScore = ScoreQuality(cleaned, result.pageCount, m_options.expectedCharsPerPage);
    result.quality = domain::TextQualityFromScore(result.qualityScore, CountVisible(cleaned) == 0);
    result.text = std::move(cleaned);
    return result;
}

std::optional<ExtractedText> ExtractionStage::lookup(const domain::RawDocument& document) const {
    return m_store->find(domain::DecisionIdentifier(document.ada), document.hash);
}

ExtractedText ExtractionStage::extract(const domain::RawDocument& document, const domain::CancellationToken& token) {
    domain::DecisionIdentifier id(document.ada);

    if (auto cached = m_store->find(id, document.hash)) {
        infrastructure::Log::Info("ExtractionStage", document.ada + ": reusing " +
                                  domain::ExtractionMethodToString(cached->method) +
                                  " text for " + document.hash.substr(0, 12));
        return *cached;
    }

    const auto extension = std::filesystem::path(document.storagePath).extension().string();
    const auto format = domain::DocumentFormatFromExtension(extension);
    if (format == domain::DocumentFormat::Unknown) {
        throw domain::ExtractionError("unsupported document format for " + document.ada +
                                      " (" + document.contentType + ")");
    }

    int pageCount = 0;
    std::string nativeText;
    if (format == domain::DocumentFormat::Pdf) {
        auto inspection = m_engine->inspect(document.storagePath, token);
        pageCount = inspection.pageCount;

        if (!inspection.imageOnly) {
            auto native = m_engine->extractNative(document.storagePath, token);
            nativeText = TextCleaner::Clean(native.text);
            if (pageCount == 0) pageCount = native.pageCount;

            if (CountVisible(nativeText) >= m_options.minNativeChars) {
                return m_store->put(id, build(document, ExtractionMethod::NativeText, nativeText, pageCount));
            }
            infrastructure::Log::Info("ExtractionStage",
                                      document.ada + ": text layer too thin, falling back to OCR");
        } else {
            infrastructure::Log::Info("ExtractionStage", document.ada + ": image-only PDF, running OCR");
        }
    }

    auto recognised = m_engine->recognize(document.storagePath, format, token);
    std::string ocrText = TextCleaner::Clean(recognised.text);
    if (pageCount == 0) pageCount = recognised.pageCount;

    // OCR never replaces a text layer that carried more.
    if (CountVisible(nativeText) > CountVisible(ocrText)) {
        return m_store->put(id, build(document, ExtractionMethod::NativeText, nativeText, pageCount));
    }
    return m_store->put(id, build(document, ExtractionMethod::Ocr, ocrText, pageCount));
}

} // namespace adaharvest::application
