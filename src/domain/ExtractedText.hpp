/**
 * @file ExtractedText.hpp
 * @brief Domain entity for plain text derived from a RawDocument.
 */

#pragma once

#include <cstddef>
#include <string>

namespace adaharvest::domain {

/**
 * @enum ExtractionMethod
 * @brief Which capability produced the text.
 */
enum class ExtractionMethod {
    NativeText,   ///< Embedded text layer of the PDF.
    Ocr           ///< Optical character recognition of rendered pages or images.
};

inline std::string ExtractionMethodToString(ExtractionMethod method) {
    switch (method) {
        case ExtractionMethod::NativeText: return "native";
        case ExtractionMethod::Ocr: return "ocr";
    }
    return "native";
}

inline bool ExtractionMethodFromString(const std::string& value, ExtractionMethod& out) {
    if (value == "native") { out = ExtractionMethod::NativeText; return true; }
    if (value == "ocr") { out = ExtractionMethod::Ocr; return true; }
    return false;
}

/**
 * @enum TextQuality
 * @brief Coarse bucket of the heuristic quality score.
 */
enum class TextQuality {
    Empty,    ///< Extraction succeeded but the document carries no text.
    Low,
    Medium,
    High
};

inline std::string TextQualityToString(TextQuality quality) {
    switch (quality) {
        case TextQuality::Empty: return "empty";
        case TextQuality::Low: return "low";
        case TextQuality::Medium: return "medium";
        case TextQuality::High: return "high";
    }
    return "empty";
}

inline TextQuality TextQualityFromScore(double score, bool empty) {
    if (empty) return TextQuality::Empty;
    if (score >= 0.75) return TextQuality::High;
    if (score >= 0.40) return TextQuality::Medium;
    return TextQuality::Low;
}

/**
 * @class ExtractedText
 * @brief Regenerable text artifact, linked to the raw bytes it came from.
 */
class ExtractedText {
public:
    std::string ada;
    std::string rawHash;           ///< Provenance: hash of the RawDocument version.
    ExtractionMethod method = ExtractionMethod::NativeText;
    std::string text;              ///< Cleaned UTF-8 text. May be empty (see quality).
    double qualityScore = 0.0;     ///< 0..1, recognised characters against expected page area.
    TextQuality quality = TextQuality::Empty;
    int pageCount = 0;
    std::size_t characterCount = 0;
    std::string storagePath;       ///< Set once persisted.

    bool isEmpty() const { return quality == TextQuality::Empty; }
};

} // namespace adaharvest::domain
