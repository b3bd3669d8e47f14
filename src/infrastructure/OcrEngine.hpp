/**
 * @file OcrEngine.hpp
 * @brief Tesseract recognition of rendered pages.
 */

#pragma once
#include <string>
#include "infrastructure/PdfReader.hpp"

namespace tenderlens::infrastructure {

/**
 * @class OcrEngine
 * @brief Runs tesseract over gray8 page images.
 *
 * TessBaseAPI is not thread safe, so every calling thread gets its own
 * instance, initialised lazily on first use and kept for the thread's life.
 * Call @ref recognize from ConversionPool workers.
 */
class OcrEngine {
public:
    OcrEngine(std::string language, std::string tessdataPath);

    /** @throws ExtractionError(ConversionFailure) when tesseract cannot start or read the image. */
    std::string recognize(const PageImage& image) const;

private:
    std::string m_language;
    std::string m_tessdataPath;
};

} // namespace tenderlens::infrastructure
