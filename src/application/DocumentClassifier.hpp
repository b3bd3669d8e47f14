/**
 * @file DocumentClassifier.hpp
 * @brief First-pass classification of every file in a bundle.
 */

#pragma once
#include <memory>
#include <string>

#include "domain/DocumentClassificationService.hpp"
#include "domain/DocumentRecords.hpp"
#include "domain/RawFile.hpp"
#include "infrastructure/ContentExtractor.hpp"

namespace tenderlens::application {

/**
 * @class DocumentClassifier
 * @brief Samples a file and assigns it a category.
 *
 * Only the cheap first-page sample is ever read here. The external
 * classifier is optional and consulted last, once the filename and keyword
 * rules have both come back empty.
 */
class DocumentClassifier {
public:
    /** Samples with this many non-blank characters or fewer are not sent out. */
    static constexpr std::size_t kMinExternalSampleChars = 20;
    static constexpr std::size_t kExternalScannedWords = 500;
    static constexpr std::size_t kExternalDigitalChars = 2000;

    DocumentClassifier(std::shared_ptr<const infrastructure::ContentExtractor> extractor,
                       std::shared_ptr<domain::DocumentClassificationService> external = nullptr);

    /** @brief Classifies one file. Never throws; reader failures become success=false. */
    domain::ClassificationRecord classify(const domain::RawFile& file) const;

    /** @brief Category for an already sampled file (rules, then the external classifier). */
    domain::DocumentCategory categorize(const std::string& filename, const std::string& sampleText,
                                        bool isScanned) const;

    /**
     * @brief Re-runs the filename and keyword rules over the full text.
     * @return The refined category, or @p current when the rules find nothing.
     */
    static domain::DocumentCategory Refine(const std::string& filename, const std::string& fullText,
                                           domain::DocumentCategory current);

    /** @brief Truncation applied before the sample leaves the process. */
    static std::string PrepareExternalSample(const std::string& sampleText, bool isScanned);

    /** @brief True when the hidden/temporary-file filter drops @p filename. */
    static bool IsIgnoredFile(const std::string& filename);

private:
    std::shared_ptr<const infrastructure::ContentExtractor> m_extractor;
    std::shared_ptr<domain::DocumentClassificationService> m_external;
};

} // namespace tenderlens::application
