/**
 * @file TenderIngestionService.cpp
 * @brief Implementation of TenderIngestionService.
 */

#include "application/TenderIngestionService.hpp"

#include <iostream>

#include "application/CandidateSelector.hpp"
#include "application/CompletenessOracle.hpp"
#include "application/ContextAssembler.hpp"
#include "application/MetadataMerger.hpp"
#include "domain/ExtractionError.hpp"
#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::ClassificationRecord;
using domain::DocumentCategory;
using domain::ExtractionRecord;

namespace {

bool Cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}

void Notify(const TenderIngestionService::StatusCallback& callback, const std::string& message) {
    std::cout << "[TenderIngestionService] " << message << std::endl;
    if (callback) callback(message);
}

} // namespace

std::string Phase1SourceToLabel(Phase1Source source) {
    switch (source) {
        case Phase1Source::Existing: return "existing";
        case Phase1Source::Primary: return "primary";
        case Phase1Source::Fallback: return "fallback";
        case Phase1Source::None: return "none";
    }
    return "none";
}

std::string StageToString(IngestionStage stage) {
    switch (stage) {
        case IngestionStage::Classifying: return "Classifying";
        case IngestionStage::SelectingCandidates: return "SelectingCandidates";
        case IngestionStage::CheckComplete: return "CheckComplete";
        case IngestionStage::Extracting: return "Extracting";
        case IngestionStage::Merging: return "Merging";
        case IngestionStage::Done: return "Done";
    }
    return "Done";
}

TenderIngestionService::TenderIngestionService(std::shared_ptr<const DocumentClassifier> classifier,
                                               std::shared_ptr<const infrastructure::ContentExtractor> extractor,
                                               std::shared_ptr<domain::FragmentExtractionService> fragments)
    : m_classifier(std::move(classifier)), m_extractor(std::move(extractor)), m_fragments(std::move(fragments)) {}

const std::vector<DocumentCategory>& TenderIngestionService::WaterfallOrder() {
    static const std::vector<DocumentCategory> kOrder = {
        DocumentCategory::PrimaryNotice, DocumentCategory::Rules, DocumentCategory::Specification,
    };
    return kOrder;
}

bool TenderIngestionService::classifyAll(const domain::TenderBundle& bundle, IngestionResult& result,
                                         const StatusCallback& statusCallback,
                                         const std::atomic<bool>* cancel) const {
    result.trace.push_back(IngestionStage::Classifying);
    Notify(statusCallback, "Classifying " + std::to_string(bundle.size()) + " files...");

    for (const auto& file : bundle.files()) {
        if (Cancelled(cancel)) return false;
        if (DocumentClassifier::IsIgnoredFile(file.filename)) continue;
        result.classifications.push_back(m_classifier->classify(file));
    }
    return true;
}

std::map<DocumentCategory, ClassificationRecord> TenderIngestionService::selectCandidates(
    const std::vector<ClassificationRecord>& classifications,
    const std::vector<DocumentCategory>& categories,
    const std::optional<std::string>& tenderReference) const {
    std::map<DocumentCategory, ClassificationRecord> selected;

    for (DocumentCategory category : categories) {
        std::vector<ClassificationRecord> candidates;
        for (const auto& record : classifications) {
            if (record.success && record.category == category) candidates.push_back(record);
        }

        auto best = CandidateSelector::SelectBest(candidates);
        if (!best) continue;

        if (category == DocumentCategory::PrimaryNotice &&
            CandidateSelector::IsMultiTenderNotice(best->sampleText, tenderReference)) {
            std::cout << "[TenderIngestionService] Ignoring notice '" << best->filename
                      << "' (multi-tender compilation)" << std::endl;
            continue;
        }

        std::cout << "[TenderIngestionService] Selected " << domain::CategoryToLabel(category) << ": "
                  << best->filename << " (" << candidates.size() << " candidates)" << std::endl;
        best->purgeSample();
        selected.emplace(category, std::move(*best));
    }
    return selected;
}

ExtractionRecord TenderIngestionService::extract(const domain::TenderBundle& bundle,
                                                 const ClassificationRecord& candidate,
                                                 DocumentCategory slot) const {
    const domain::RawFile* file = bundle.find(candidate.filename);
    if (!file) {
        ExtractionRecord missing;
        missing.filename = candidate.filename;
        missing.category = slot;
        missing.error = domain::ExtractionError::Describe(domain::ExtractionErrorKind::ParseFailure,
                                                          "File not found in bundle");
        return missing;
    }

    ExtractionRecord record = m_extractor->extractFull(*file, candidate.isScanned, slot);
    if (record.success) {
        record.category = DocumentClassifier::Refine(file->filename, record.fullText, slot);
        if (record.category != slot) {
            std::cout << "[TenderIngestionService] " << file->filename << " reads as "
                      << domain::CategoryToLabel(record.category) << " in full, kept in the "
                      << domain::CategoryToLabel(slot) << " slot" << std::endl;
        }
    }
    return record;
}

void TenderIngestionService::PurgeSamples(IngestionResult& result) {
    for (auto& record : result.classifications) record.purgeSample();
}

TenderIngestionService::IngestionResult TenderIngestionService::runLazy(
    const domain::TenderBundle& bundle,
    const std::optional<std::string>& tenderReference,
    domain::MetadataRecord current,
    StatusCallback statusCallback,
    const std::atomic<bool>* cancel) const {
    IngestionResult result;
    result.metadata = std::move(current);

    if (!classifyAll(bundle, result, statusCallback, cancel)) {
        result.cancelled = true;
        PurgeSamples(result);
        result.missingFields = CompletenessOracle::MissingFields(result.metadata);
        result.trace.push_back(IngestionStage::Done);
        return result;
    }

    result.trace.push_back(IngestionStage::SelectingCandidates);
    auto selected = selectCandidates(result.classifications, WaterfallOrder(), tenderReference);
    PurgeSamples(result);
    result.noUsableDocument = selected.empty();

    std::optional<DocumentCategory> completedBy;
    bool completeAtStart = false;

    for (DocumentCategory category : WaterfallOrder()) {
        auto it = selected.find(category);
        if (it == selected.end()) continue;

        if (Cancelled(cancel)) {
            result.cancelled = true;
            Notify(statusCallback, "Cancelled before " + domain::CategoryToLabel(category));
            break;
        }

        result.trace.push_back(IngestionStage::CheckComplete);
        const auto missing = CompletenessOracle::MissingFields(result.metadata);
        if (missing.empty()) {
            if (result.extractionsPerformed == 0) completeAtStart = true;
            Notify(statusCallback, "Metadata complete, skipping " + domain::CategoryToLabel(category));
            break;
        }

        Notify(statusCallback, "Missing: " + infrastructure::TextUtils::Join(missing, ", ") + ". Extracting " +
                                   domain::CategoryToLabel(category) + " (" + it->second.filename + ")...");
        result.trace.push_back(IngestionStage::Extracting);
        ExtractionRecord record = extract(bundle, it->second, category);
        ++result.extractionsPerformed;

        if (!record.success) {
            result.failedExtractions.push_back(std::move(record));
            continue;
        }

        result.trace.push_back(IngestionStage::Merging);
        if (m_fragments) {
            auto fragment = m_fragments->extractFragment(record.fullText, domain::SourceDocument{category});
            if (fragment) {
                result.metadata = MetadataMerger::Merge(result.metadata, *fragment);
            }
        }
        result.extractions.emplace(category, std::move(record));

        if (!completedBy && CompletenessOracle::IsComplete(result.metadata)) completedBy = category;
    }

    // Complete with nothing to extract at all still counts as already satisfied.
    if (!result.cancelled && result.extractionsPerformed == 0 && CompletenessOracle::IsComplete(result.metadata)) {
        completeAtStart = true;
    }

    result.missingFields = CompletenessOracle::MissingFields(result.metadata);
    if (completeAtStart) {
        result.phase1 = Phase1Source::Existing;
    } else if (completedBy) {
        result.phase1 = *completedBy == DocumentCategory::PrimaryNotice ? Phase1Source::Primary : Phase1Source::Fallback;
    } else {
        result.phase1 = Phase1Source::None;
    }

    result.trace.push_back(IngestionStage::Done);
    Notify(statusCallback, "Done: " + std::to_string(result.extractionsPerformed) + " extractions, phase 1 " +
                               Phase1SourceToLabel(result.phase1));
    return result;
}

TenderIngestionService::IngestionResult TenderIngestionService::assembleAll(
    const domain::TenderBundle& bundle,
    const std::optional<std::string>& tenderReference,
    StatusCallback statusCallback,
    const std::atomic<bool>* cancel) const {
    IngestionResult result;

    if (!classifyAll(bundle, result, statusCallback, cancel)) {
        result.cancelled = true;
        PurgeSamples(result);
        result.trace.push_back(IngestionStage::Done);
        return result;
    }

    result.trace.push_back(IngestionStage::SelectingCandidates);
    const std::vector<DocumentCategory> order(ContextAssembler::DeepOrder().begin(), ContextAssembler::DeepOrder().end());
    auto selected = selectCandidates(result.classifications, order, tenderReference);
    PurgeSamples(result);
    result.noUsableDocument = selected.empty();

    for (DocumentCategory category : order) {
        auto it = selected.find(category);
        if (it == selected.end()) continue;

        if (Cancelled(cancel)) {
            result.cancelled = true;
            Notify(statusCallback, "Cancelled before " + domain::CategoryToLabel(category));
            break;
        }

        Notify(statusCallback, "Extracting " + domain::CategoryToLabel(category) + " (" + it->second.filename + ")...");
        result.trace.push_back(IngestionStage::Extracting);
        ExtractionRecord record = extract(bundle, it->second, category);
        ++result.extractionsPerformed;

        if (record.success) {
            result.extractions.emplace(category, std::move(record));
        } else {
            result.failedExtractions.push_back(std::move(record));
        }
    }

    result.trace.push_back(IngestionStage::Done);
    Notify(statusCallback, "Assembled " + std::to_string(result.extractions.size()) + " documents");
    return result;
}

} // namespace tenderlens::application
