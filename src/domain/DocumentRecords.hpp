/**
 * @file DocumentRecords.hpp
 * @brief Per-file results of the classification and extraction passes.
 */

#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include "domain/DocumentCategory.hpp"

namespace tenderlens::domain {

enum class ExtractionMethod {
    Digital,
    OCR
};

inline std::string MethodToLabel(ExtractionMethod method) {
    return method == ExtractionMethod::OCR ? "OCR" : "DIGITAL";
}

/**
 * @struct ClassificationRecord
 * @brief Outcome of the cheap first-page scan of one file.
 *
 * @c sampleText only lives until candidate selection is over; the orchestrator
 * purges it before the record leaves the pipeline.
 */
struct ClassificationRecord {
    std::string filename;
    std::string sampleText;
    DocumentCategory category = DocumentCategory::Unknown;
    bool isScanned = false;
    std::string mime;
    std::size_t size = 0;
    bool success = false;
    std::optional<std::string> error;

    void purgeSample() {
        // Overwrite before releasing so the text does not linger in the old buffer.
        std::fill(sampleText.begin(), sampleText.end(), '\0');
        sampleText.clear();
        sampleText.shrink_to_fit();
    }
};

/**
 * @struct ExtractionRecord
 * @brief Full text of a selected file, handed to the caller for persistence.
 */
struct ExtractionRecord {
    std::string filename;
    DocumentCategory category = DocumentCategory::Unknown;
    std::string fullText;
    std::optional<int> pageCount;
    ExtractionMethod method = ExtractionMethod::Digital;
    std::size_t size = 0;
    std::string mime;
    bool success = false;
    std::optional<std::string> error;
};

} // namespace tenderlens::domain
