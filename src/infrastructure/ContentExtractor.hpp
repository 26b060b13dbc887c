/**
 * @file ContentExtractor.hpp
 * @brief Text extraction engine backed by poppler-utils, ocrmypdf and tesseract.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "domain/TextExtractionEngine.hpp"
#include "infrastructure/ProcessRunner.hpp"

namespace adaharvest::infrastructure {

/**
 * @class ContentExtractor
 * @brief Tiered extraction: pdftotext for the native layer, then ocrmypdf, then raw
 *        page OCR (pdftoppm + tesseract) as the last resort.
 *
 * Every tool runs through ProcessRunner, so a long OCR job is killed as soon as the
 * run is cancelled.
 */
class ContentExtractor : public domain::TextExtractionEngine {
public:
    struct Options {
        std::string ocrLanguages = "ell+eng";
        std::chrono::seconds timeout{900};
        int ocrJobs = 1;
    };

    explicit ContentExtractor(Options options);

    Inspection inspect(const std::string& path, const domain::CancellationToken& token) override;
    domain::EngineOutput extractNative(const std::string& path, const domain::CancellationToken& token) override;
    domain::EngineOutput recognize(const std::string& path,
                                   domain::DocumentFormat format,
                                   const domain::CancellationToken& token) override;

private:
    ProcessRunner::Result run(const std::vector<std::string>& argv, const domain::CancellationToken& token) const;
    std::string pdfToText(const std::string& path, const domain::CancellationToken& token) const;

    bool tryOcrMyPdf(const std::string& path, const std::string& scratch,
                     const domain::CancellationToken& token, domain::EngineOutput& out) const;
    bool tryRasterOcr(const std::string& path, const std::string& scratch,
                      const domain::CancellationToken& token, domain::EngineOutput& out) const;
    std::string tesseract(const std::string& imagePath, const domain::CancellationToken& token) const;

    Options m_options;
};

} // namespace adaharvest::infrastructure
