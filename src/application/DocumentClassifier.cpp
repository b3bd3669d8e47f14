/**
 * @file DocumentClassifier.cpp
 * @brief Implementation of DocumentClassifier.
 */

#include "application/DocumentClassifier.hpp"

#include <iostream>

#include "application/CategoryHeuristics.hpp"
#include "domain/ExtractionError.hpp"
#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::ClassificationRecord;
using domain::DocumentCategory;
using domain::ExtractionError;
using domain::ExtractionErrorKind;
using infrastructure::TextUtils;

DocumentClassifier::DocumentClassifier(std::shared_ptr<const infrastructure::ContentExtractor> extractor,
                                       std::shared_ptr<domain::DocumentClassificationService> external)
    : m_extractor(std::move(extractor)), m_external(std::move(external)) {}

bool DocumentClassifier::IsIgnoredFile(const std::string& filename) {
    const auto slash = filename.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    return base.rfind(".", 0) == 0 || base.rfind("~$", 0) == 0 || base.rfind("__", 0) == 0;
}

std::string DocumentClassifier::PrepareExternalSample(const std::string& sampleText, bool isScanned) {
    if (isScanned) return TextUtils::FirstWords(sampleText, kExternalScannedWords);
    return TextUtils::Utf8Prefix(sampleText, kExternalDigitalChars);
}

ClassificationRecord DocumentClassifier::classify(const domain::RawFile& file) const {
    ClassificationRecord record;
    record.filename = file.filename;
    record.mime = file.mime;
    record.size = file.size;

    try {
        auto sample = m_extractor->extractSample(file);
        record.sampleText = std::move(sample.text);
        record.isScanned = sample.isScanned;
        record.success = true;
    } catch (const ExtractionError& e) {
        record.error = e.describe();
        std::cerr << "[DocumentClassifier] " << file.filename << ": " << *record.error << std::endl;
        return record;
    } catch (const std::exception& e) {
        record.error = ExtractionError::Describe(ExtractionErrorKind::ParseFailure, e.what());
        std::cerr << "[DocumentClassifier] " << file.filename << ": " << *record.error << std::endl;
        return record;
    }

    record.category = categorize(file.filename, record.sampleText, record.isScanned);
    std::cout << "[DocumentClassifier] " << file.filename << " -> " << domain::CategoryToLabel(record.category)
              << (record.isScanned ? " [SCANNED]" : "") << std::endl;
    return record;
}

DocumentCategory DocumentClassifier::categorize(const std::string& filename, const std::string& sampleText,
                                                bool isScanned) const {
    DocumentCategory category = CategoryHeuristics::Classify(filename, sampleText);
    if (category != DocumentCategory::Unknown) return category;

    if (m_external && TextUtils::Utf8Length(TextUtils::Trim(sampleText)) > kMinExternalSampleChars) {
        category = m_external->classify(PrepareExternalSample(sampleText, isScanned), filename, isScanned);
        if (category != DocumentCategory::Unknown) return category;
    }

    std::cout << "[DocumentClassifier] "
              << ExtractionError::Describe(ExtractionErrorKind::ClassificationAmbiguous, filename)
              << ", leaving as UNKNOWN" << std::endl;
    return DocumentCategory::Unknown;
}

DocumentCategory DocumentClassifier::Refine(const std::string& filename, const std::string& fullText,
                                            DocumentCategory current) {
    DocumentCategory refined = CategoryHeuristics::Classify(filename, fullText);
    return refined == DocumentCategory::Unknown ? current : refined;
}

} // namespace tenderlens::application
