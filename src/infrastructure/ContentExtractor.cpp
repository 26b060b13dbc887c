/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace adaharvest::infrastructure {

using domain::EngineOutput;
using domain::ExtractionError;

namespace {

/** Private mkdtemp directory, removed when the extraction call returns. */
class ScratchDir {
public:
    ScratchDir() {
        std::string pattern = (fs::temp_directory_path() / "adaharvest_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw ExtractionError(std::string("cannot create scratch directory: ") + std::strerror(errno));
        }
        m_path = buffer.data();
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

std::string FirstLine(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

int CountPages(const std::string& text) {
    // pdftotext terminates every page with a form feed.
    int pages = static_cast<int>(std::count(text.begin(), text.end(), '\f'));
    if (pages == 0 && !text.empty()) pages = 1;
    return pages;
}

} // namespace

ContentExtractor::ContentExtractor(Options options) : m_options(std::move(options)) {}

ProcessRunner::Result ContentExtractor::run(const std::vector<std::string>& argv,
                                            const domain::CancellationToken& token) const {
    try {
        return ProcessRunner::Run(argv, token, m_options.timeout);
    } catch (const domain::CancelledError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ExtractionError(argv.front() + ": " + e.what());
    }
}

ContentExtractor::Inspection ContentExtractor::inspect(const std::string& path,
                                                       const domain::CancellationToken& token) {
    Inspection inspection;

    auto info = run({"pdfinfo", path}, token);
    if (!info.ok()) {
        throw ExtractionError("pdfinfo cannot read " + path + ": " +
                              (info.timedOut ? std::string("timed out") : FirstLine(info.err)));
    }
    std::istringstream lines(info.out);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Pages:", 0) == 0) {
            inspection.pageCount = std::atoi(line.c_str() + 6);
        }
    }

    // pdffonts prints a two-line header followed by one row per embedded font.
    auto fonts = run({"pdffonts", path}, token);
    if (fonts.ok()) {
        std::istringstream rows(fonts.out);
        bool pastHeader = false;
        int fontRows = 0;
        while (std::getline(rows, line)) {
            if (line.rfind("----", 0) == 0) {
                pastHeader = true;
                continue;
            }
            if (pastHeader && !line.empty()) ++fontRows;
        }
        inspection.imageOnly = fontRows == 0;
    } else {
        Log::Warn("ContentExtractor", "pdffonts failed on " + path + ", assuming a text layer may exist");
    }
    return inspection;
}

std::string ContentExtractor::pdfToText(const std::string& path, const domain::CancellationToken& token) const {
    auto result = run({"pdftotext", "-enc", "UTF-8", path, "-"}, token);
    if (!result.ok()) {
        throw ExtractionError("pdftotext failed on " + path + ": " +
                              (result.timedOut ? std::string("timed out") : FirstLine(result.err)));
    }
    return result.out;
}

EngineOutput ContentExtractor::extractNative(const std::string& path, const domain::CancellationToken& token) {
    EngineOutput out;
    out.text = pdfToText(path, token);
    out.pageCount = CountPages(out.text);
    return out;
}

EngineOutput ContentExtractor::recognize(const std::string& path,
                                         domain::DocumentFormat format,
                                         const domain::CancellationToken& token) {
    if (!ProcessRunner::HasTool("tesseract") && !ProcessRunner::HasTool("ocrmypdf")) {
        throw ExtractionError("no OCR tool available (install ocrmypdf or tesseract)");
    }

    EngineOutput out;
    if (format == domain::DocumentFormat::Image) {
        out.text = tesseract(path, token);
        out.pageCount = 1;
        return out;
    }
    if (format != domain::DocumentFormat::Pdf) {
        throw ExtractionError("unsupported document format: " + path);
    }

    ScratchDir scratch;
    if (tryOcrMyPdf(path, scratch.path(), token, out)) {
        return out;
    }
    if (tryRasterOcr(path, scratch.path(), token, out)) {
        return out;
    }
    throw ExtractionError("every OCR tier failed on " + path);
}

bool ContentExtractor::tryOcrMyPdf(const std::string& path, const std::string& scratch,
                                   const domain::CancellationToken& token, EngineOutput& out) const {
    if (!ProcessRunner::HasTool("ocrmypdf")) return false;

    std::string ocrPdf = (fs::path(scratch) / "ocr.pdf").string();
    auto result = run({"ocrmypdf", "--force-ocr", "--quiet",
                       "--jobs", std::to_string(m_options.ocrJobs),
                       "-l", m_options.ocrLanguages,
                       "--output-type", "pdf", path, ocrPdf}, token);
    if (!result.ok()) {
        Log::Warn("ContentExtractor", "ocrmypdf failed on " + path + ": " +
                                      (result.timedOut ? std::string("timed out") : FirstLine(result.err)));
        return false;
    }

    out.text = pdfToText(ocrPdf, token);
    out.pageCount = CountPages(out.text);
    return true;
}

bool ContentExtractor::tryRasterOcr(const std::string& path, const std::string& scratch,
                                    const domain::CancellationToken& token, EngineOutput& out) const {
    if (!ProcessRunner::HasTool("pdftoppm") || !ProcessRunner::HasTool("tesseract")) return false;

    std::string prefix = (fs::path(scratch) / "page").string();
    auto raster = run({"pdftoppm", "-r", "300", "-gray", "-png", path, prefix}, token);
    if (!raster.ok()) {
        Log::Warn("ContentExtractor", "pdftoppm failed on " + path + ": " +
                                      (raster.timedOut ? std::string("timed out") : FirstLine(raster.err)));
        return false;
    }

    std::vector<std::string> pages;
    for (const auto& entry : fs::directory_iterator(scratch)) {
        const auto name = entry.path().filename().string();
        if (name.rfind("page", 0) == 0 && entry.path().extension() == ".png") {
            pages.push_back(entry.path().string());
        }
    }
    if (pages.empty()) return false;

    // pdftoppm zero-pads page numbers to a common width, so lexical order is page order.
    std::sort(pages.begin(), pages.end());

    out.text.clear();
    for (const auto& page : pages) {
        out.text += tesseract(page, token);
        out.text += '\f';
    }
    out.pageCount = static_cast<int>(pages.size());
    return true;
}

std::string ContentExtractor::tesseract(const std::string& imagePath, const domain::CancellationToken& token) const {
    auto result = run({"tesseract", imagePath, "stdout", "-l", m_options.ocrLanguages}, token);
    if (!result.ok()) {
        throw ExtractionError("tesseract failed on " + imagePath + ": " +
                              (result.timedOut ? std::string("timed out") : FirstLine(result.err)));
    }
    return result.out;
}

} // namespace adaharvest::infrastructure
