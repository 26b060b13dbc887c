/**
 * @file TextExtractionEngine.hpp
 * @brief Port to the black-box text layer and OCR capabilities.
 */

#pragma once

#include <string>
#include "domain/CancellationToken.hpp"

namespace adaharvest::domain {

/**
 * @enum DocumentFormat
 * @brief Format sniffed from the leading bytes of a raw document.
 */
enum class DocumentFormat {
    Pdf,
    Image,
    Unknown
};

/** @brief Format from the extension the content store gave the blob (".pdf", ".png", ...). */
inline DocumentFormat DocumentFormatFromExtension(const std::string& extension) {
    if (extension == ".pdf") return DocumentFormat::Pdf;
    if (extension == ".png" || extension == ".jpg" || extension == ".tif") return DocumentFormat::Image;
    return DocumentFormat::Unknown;
}

/**
 * @struct EngineOutput
 * @brief Raw text as produced by a capability, before cleanup and scoring.
 */
struct EngineOutput {
    std::string text;
    int pageCount = 0;
};

/**
 * @class TextExtractionEngine
 * @brief Abstract interface for native text extraction and OCR.
 *
 * Every call throws ExtractionError when the capability cannot read the file at all
 * and CancelledError when @p token fires while it runs. Returning empty text is
 * not an error.
 */
class TextExtractionEngine {
public:
    virtual ~TextExtractionEngine() = default;

    /** @brief Number of pages and whether any page carries a font (text layer). */
    struct Inspection {
        int pageCount = 0;
        bool imageOnly = false;
    };

    virtual Inspection inspect(const std::string& path, const CancellationToken& token) = 0;

    /** @brief Reads the embedded text layer of a PDF. */
    virtual EngineOutput extractNative(const std::string& path, const CancellationToken& token) = 0;

    /** @brief Recognises text in a scanned PDF or image. */
    virtual EngineOutput recognize(const std::string& path, DocumentFormat format, const CancellationToken& token) = 0;
};

} // namespace adaharvest::domain
