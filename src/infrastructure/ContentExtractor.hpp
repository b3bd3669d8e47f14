/**
 * @file ContentExtractor.hpp
 * @brief Format dispatch for first-page sampling and full-text extraction.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "domain/DocumentRecords.hpp"
#include "domain/RawFile.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConversionPool.hpp"
#include "infrastructure/OcrEngine.hpp"

namespace tenderlens::infrastructure {

class PdfReader;

/**
 * @class ContentExtractor
 * @brief Turns raw bundle files into text.
 *
 * Sampling is cheap and used for classification only; full extraction is
 * reserved for the files the orchestrator selects. OCR pages and legacy
 * converter runs are pushed through the shared ConversionPool.
 */
class ContentExtractor {
public:
    struct Sample {
        std::string text;
        bool isScanned = false;
    };

    /** Below this many code points of digital text, page 1 counts as scanned. */
    static constexpr std::size_t kScannedThreshold = 100;

    ContentExtractor(PipelineSettings settings, std::shared_ptr<ConversionPool> pool);

    /**
     * @brief First-page sample of @p file.
     * @throws domain::ExtractionError UnsupportedFormat for unknown extensions,
     *         ParseFailure for unreadable containers.
     */
    Sample extractSample(const domain::RawFile& file) const;

    /**
     * @brief Full text of @p file. Never throws: failures come back as
     *        success=false with a "<Kind>: <message>" error.
     * The returned category is @p category untouched; refinement is the caller's call.
     */
    domain::ExtractionRecord extractFull(const domain::RawFile& file, bool isScanned,
                                         domain::DocumentCategory category) const;

    static bool IsSupportedExtension(const std::string& ext);

    /** @brief True when the trimmed text has fewer than kScannedThreshold code points. */
    static bool LooksScanned(const std::string& digitalText);

private:
    std::string samplePdf(const std::string& bytes, bool& isScanned) const;
    std::string sampleSpreadsheet(const std::string& bytes) const;
    std::string sampleLegacyDoc(const std::string& bytes) const;

    void extractPdfDigital(const std::string& bytes, domain::ExtractionRecord& record) const;
    void extractPdfOcr(const std::string& bytes, domain::ExtractionRecord& record) const;
    void extractSpreadsheet(const std::string& bytes, domain::ExtractionRecord& record) const;
    void extractLegacyDoc(const std::string& bytes, domain::ExtractionRecord& record) const;

    /** OCR pages [0, count) of @p pdf in pool-sized batches; returns per-page text. */
    std::vector<std::string> ocrPages(const PdfReader& pdf, int count) const;

    template <typename F>
    auto runConversion(F&& job) const -> decltype(job());

    PipelineSettings m_settings;
    std::shared_ptr<ConversionPool> m_pool;
    OcrEngine m_ocr;
};

} // namespace tenderlens::infrastructure
