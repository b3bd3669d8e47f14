/**
 * @file PdfReader.hpp
 * @brief poppler-cpp wrapper: per-page digital text and grayscale page rendering.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
}

namespace tenderlens::infrastructure {

/** @brief 8-bit grayscale raster of one page. */
struct PageImage {
    int width = 0;
    int height = 0;
    int bytesPerLine = 0;
    std::vector<unsigned char> pixels;
};

/**
 * @class PdfReader
 * @brief Opens a PDF from memory.
 *
 * Throws ExtractionError(ParseFailure) when the bytes are not a readable PDF
 * and ExtractionError(ConversionFailure) when a page cannot be rendered.
 */
class PdfReader {
public:
    explicit PdfReader(const std::string& bytes);
    ~PdfReader();

    PdfReader(const PdfReader&) = delete;
    PdfReader& operator=(const PdfReader&) = delete;

    int pageCount() const;

    /** @brief UTF-8 text of page @p index (0-based); empty for image-only pages. */
    std::string pageText(int index) const;

    /** @brief Renders page @p index at @p dpi in gray8. */
    PageImage renderPage(int index, int dpi) const;

private:
    std::vector<char> m_data;  // poppler reads from this buffer for the document's whole life
    std::unique_ptr<poppler::document> m_document;
};

} // namespace tenderlens::infrastructure
