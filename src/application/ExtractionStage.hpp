/**
 * @file ExtractionStage.hpp
 * @brief Turns a stored raw document into cleaned, scored plain text.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include "domain/ExtractedText.hpp"
#include "domain/RawDocument.hpp"
#include "domain/TextExtractionEngine.hpp"
#include "infrastructure/ExtractedTextStoreFs.hpp"

namespace adaharvest::application {

/**
 * @class ExtractionStage
 * @brief Native text layer first, OCR when the PDF is image-only or its text layer
 *        is too thin. Results are cached by raw document hash.
 *
 * A document that yields no text at all is stored with quality "empty"; only a
 * document the engine cannot read raises ExtractionError.
 */
class ExtractionStage {
public:
    struct Options {
        std::size_t minNativeChars = 32;
        double expectedCharsPerPage = 1200.0;
    };

    ExtractionStage(std::shared_ptr<domain::TextExtractionEngine> engine,
                    std::shared_ptr<infrastructure::ExtractedTextStoreFs> store,
                    Options options);

    domain::ExtractedText extract(const domain::RawDocument& document, const domain::CancellationToken& token);

    /** @brief Text already extracted from exactly this raw version, if any. */
    std::optional<domain::ExtractedText> lookup(const domain::RawDocument& document) const;

    /**
     * @brief Share of recognised characters, damped when the text is sparse for its page count.
     *
     * score = recognised / nonWhitespace * min(1, nonWhitespace / (pages * expectedCharsPerPage)),
     * rounded to three decimals. Empty text scores 0.
     */
    static double ScoreQuality(const std::string& text, int pageCount, double expectedCharsPerPage);

    /** @brief Code points other than whitespace. */
    static std::size_t CountVisible(const std::string& text);

private:
    domain::ExtractedText build(const domain::RawDocument& document, domain::ExtractionMethod method,
                                std::string cleaned, int pageCount) const;

    std::shared_ptr<domain::TextExtractionEngine> m_engine;
    std::shared_ptr<infrastructure::ExtractedTextStoreFs> m_store;
    Options m_options;
};

} // namespace adaharvest::application
