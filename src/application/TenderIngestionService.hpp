/**
 * @file TenderIngestionService.hpp
 * @brief Drives classification, selection and lazy extraction for one tender.
 */

#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/DocumentClassifier.hpp"
#include "domain/DocumentRecords.hpp"
#include "domain/FragmentExtractionService.hpp"
#include "domain/RawFile.hpp"
#include "domain/TenderMetadata.hpp"
#include "infrastructure/ContentExtractor.hpp"

namespace tenderlens::application {

/**
 * @enum Phase1Source
 * @brief What made the primary metadata complete.
 */
enum class Phase1Source {
    Existing,  ///< Complete before any document was extracted.
    Primary,   ///< Completed by the notice.
    Fallback,  ///< Completed by the rules or the specification.
    None       ///< Waterfall exhausted; insufficient data.
};

std::string Phase1SourceToLabel(Phase1Source source);

/** @brief Pipeline states, recorded in order in IngestionResult::trace. */
enum class IngestionStage { Classifying, SelectingCandidates, CheckComplete, Extracting, Merging, Done };

std::string StageToString(IngestionStage stage);

/**
 * @class TenderIngestionService
 * @brief Runs the document waterfall over one tender bundle.
 *
 * Stateless between runs: one instance serves every tender worker. Each run
 * owns its bundle view, its classification records and its metadata record.
 */
class TenderIngestionService {
public:
    using StatusCallback = std::function<void(std::string)>;

    struct IngestionResult {
        std::map<domain::DocumentCategory, domain::ExtractionRecord> extractions;
        std::vector<domain::ExtractionRecord> failedExtractions;
        std::vector<domain::ClassificationRecord> classifications;  ///< Sample text already purged.
        domain::MetadataRecord metadata;
        std::vector<std::string> missingFields;
        int extractionsPerformed = 0;
        Phase1Source phase1 = Phase1Source::None;
        bool cancelled = false;
        std::vector<IngestionStage> trace;

        /** @brief True when no candidate survived selection. Not an error. */
        bool noUsableDocument = false;
    };

    TenderIngestionService(std::shared_ptr<const DocumentClassifier> classifier,
                           std::shared_ptr<const infrastructure::ContentExtractor> extractor,
                           std::shared_ptr<domain::FragmentExtractionService> fragments = nullptr);

    /**
     * @brief Lazy waterfall: notice, then rules, then specification, each only
     * while the record is still incomplete.
     * @param current Metadata already known for the tender (may be empty).
     * @param cancel Checked between files and between candidates.
     */
    IngestionResult runLazy(const domain::TenderBundle& bundle,
                            const std::optional<std::string>& tenderReference,
                            domain::MetadataRecord current,
                            StatusCallback statusCallback = nullptr,
                            const std::atomic<bool>* cancel = nullptr) const;

    /** @brief Extracts the best annex, specification, rules and notice regardless of completeness. */
    IngestionResult assembleAll(const domain::TenderBundle& bundle,
                                const std::optional<std::string>& tenderReference,
                                StatusCallback statusCallback = nullptr,
                                const std::atomic<bool>* cancel = nullptr) const;

    /** @brief Fixed order of the lazy waterfall. */
    static const std::vector<domain::DocumentCategory>& WaterfallOrder();

private:
    /** Classifies every non-ignored file; false when cancelled midway. */
    bool classifyAll(const domain::TenderBundle& bundle, IngestionResult& result,
                     const StatusCallback& statusCallback, const std::atomic<bool>* cancel) const;

    /** Best candidate per requested category; the notice passes the multi-tender guard first. */
    std::map<domain::DocumentCategory, domain::ClassificationRecord> selectCandidates(
        const std::vector<domain::ClassificationRecord>& classifications,
        const std::vector<domain::DocumentCategory>& categories,
        const std::optional<std::string>& tenderReference) const;

    domain::ExtractionRecord extract(const domain::TenderBundle& bundle,
                                     const domain::ClassificationRecord& candidate,
                                     domain::DocumentCategory slot) const;

    static void PurgeSamples(IngestionResult& result);

    std::shared_ptr<const DocumentClassifier> m_classifier;
    std::shared_ptr<const infrastructure::ContentExtractor> m_extractor;
    std::shared_ptr<domain::FragmentExtractionService> m_fragments;
};

} // namespace tenderlens::application
