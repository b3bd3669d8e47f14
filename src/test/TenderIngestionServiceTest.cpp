#include <atomic>
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "application/TenderIngestionService.hpp"
#include "domain/FragmentExtractionService.hpp"
#include "infrastructure/ContentExtractor.hpp"

using namespace tenderlens;
using domain::DocumentCategory;
using domain::MetadataRecord;
using domain::SourceDocument;
using domain::TrackedValue;
using application::IngestionStage;
using application::Phase1Source;
using application::TenderIngestionService;

namespace {

TrackedValue Tracked(const std::string& value, const SourceDocument& source) {
    TrackedValue tracked;
    tracked.value = domain::Scalar{value};
    tracked.sourceDocument = source;
    return tracked;
}

// Mock fragment extractor: one canned fragment per source document.
class MockFragments : public domain::FragmentExtractionService {
public:
    std::optional<MetadataRecord> extractFragment(const std::string& text, const SourceDocument& sourceLabel) override {
        calls.push_back(domain::SourceDocumentToLabel(sourceLabel));
        texts.push_back(text);
        auto it = fragments.find(domain::SourceDocumentToLabel(sourceLabel));
        if (it == fragments.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, MetadataRecord> fragments;
    std::vector<std::string> calls;
    std::vector<std::string> texts;
};

MetadataRecord CompleteRecord(const SourceDocument& source) {
    MetadataRecord record;
    record.set(domain::fields::kReference, Tracked("12/2024", source));
    record.set(domain::fields::kSubject, Tracked("Travaux de voirie", source));
    record.set(domain::fields::kIssuingInstitution, Tracked("Commune de Tiznit", source));
    domain::SubmissionDeadline deadline;
    deadline.date = Tracked("2024-06-01", source);
    record.set(domain::fields::kSubmissionDeadline, deadline);
    return record;
}

domain::TenderBundle StandardBundle() {
    domain::TenderBundle bundle;
    bundle.add("avis_fr.txt", "Avis d'appel d'offres ouvert n° 12/2024 pour des travaux de voirie.");
    bundle.add("rc.txt", "Reglement de consultation relatif aux travaux de voirie, article premier.");
    bundle.add("cps.txt", "Cahier des prescriptions speciales, clauses administratives et techniques.");
    bundle.add(".DS_Store", "binary junk");
    return bundle;
}

struct Fixture {
    std::shared_ptr<infrastructure::ContentExtractor> extractor;
    std::shared_ptr<application::DocumentClassifier> classifier;
    std::shared_ptr<MockFragments> fragments;
    std::unique_ptr<TenderIngestionService> service;

    Fixture() {
        extractor = std::make_shared<infrastructure::ContentExtractor>(infrastructure::PipelineSettings{}, nullptr);
        classifier = std::make_shared<application::DocumentClassifier>(extractor);
        fragments = std::make_shared<MockFragments>();
        service = std::make_unique<TenderIngestionService>(classifier, extractor, fragments);
    }
};

void AssertSamplesPurged(const TenderIngestionService::IngestionResult& result) {
    for (const auto& record : result.classifications) {
        assert(record.sampleText.empty() && "Sample text must not survive the run");
    }
}

} // namespace

void TestCompleteBaseSkipsExtraction() {
    std::cout << "[Test] Complete base record skips every document..." << std::endl;
    Fixture f;
    auto result = f.service->runLazy(StandardBundle(), std::string("12/2024"), CompleteRecord(domain::WebsiteSource{}));

    assert(result.extractionsPerformed == 0);
    assert(result.extractions.empty());
    assert(result.phase1 == Phase1Source::Existing);
    assert(application::Phase1SourceToLabel(result.phase1) == "existing");
    assert(result.missingFields.empty());
    assert(f.fragments->calls.empty());
    assert(result.classifications.size() == 3 && "Hidden files are not classified");

    const std::vector<IngestionStage> expected = {
        IngestionStage::Classifying, IngestionStage::SelectingCandidates, IngestionStage::CheckComplete,
        IngestionStage::Done,
    };
    assert(result.trace == expected);
    AssertSamplesPurged(result);
    std::cout << "[PASS] Complete base." << std::endl;
}

void TestNoticeCompletesRecord() {
    std::cout << "[Test] Notice alone completes the record..." << std::endl;
    Fixture f;
    f.fragments->fragments["AVIS"] = CompleteRecord(DocumentCategory::PrimaryNotice);

    auto result = f.service->runLazy(StandardBundle(), std::string("12/2024"), MetadataRecord{});

    assert(result.extractionsPerformed == 1);
    assert(result.extractions.count(DocumentCategory::PrimaryNotice) == 1);
    assert(result.extractions.at(DocumentCategory::PrimaryNotice).filename == "avis_fr.txt");
    assert(result.phase1 == Phase1Source::Primary);
    assert(result.missingFields.empty());
    assert(f.fragments->calls.size() == 1 && f.fragments->calls[0] == "AVIS");
    assert(f.fragments->texts[0].find("n° 12/2024") != std::string::npos && "Fragment sees the full text");

    const std::vector<IngestionStage> expected = {
        IngestionStage::Classifying, IngestionStage::SelectingCandidates, IngestionStage::CheckComplete,
        IngestionStage::Extracting, IngestionStage::Merging, IngestionStage::CheckComplete, IngestionStage::Done,
    };
    assert(result.trace == expected);
    AssertSamplesPurged(result);
    std::cout << "[PASS] Primary." << std::endl;
}

void TestFallbackCompletesRecord() {
    std::cout << "[Test] Rules fill what the notice left out..." << std::endl;
    Fixture f;
    MetadataRecord notice;
    notice.set(domain::fields::kReference, Tracked("12/2024", DocumentCategory::PrimaryNotice));
    notice.set(domain::fields::kSubject, Tracked("Travaux de voirie", DocumentCategory::PrimaryNotice));
    f.fragments->fragments["AVIS"] = notice;

    MetadataRecord rules = CompleteRecord(DocumentCategory::Rules);
    rules.set(domain::fields::kSubject, Tracked("Autre objet", DocumentCategory::Rules));
    f.fragments->fragments["RC"] = rules;

    auto result = f.service->runLazy(StandardBundle(), std::nullopt, MetadataRecord{});

    assert(result.extractionsPerformed == 2);
    assert(result.phase1 == Phase1Source::Fallback);
    assert(result.missingFields.empty());
    assert(result.extractions.count(DocumentCategory::Specification) == 0 && "Specification never read");

    // The notice's values win over the rules'.
    const auto* subject = result.metadata.get<TrackedValue>(domain::fields::kSubject);
    assert(subject && std::get<std::string>(*subject->value) == "Travaux de voirie");
    assert(domain::SourceDocumentToLabel(subject->sourceDocument) == "AVIS");
    const auto* institution = result.metadata.get<TrackedValue>(domain::fields::kIssuingInstitution);
    assert(institution && domain::SourceDocumentToLabel(institution->sourceDocument) == "RC");
    std::cout << "[PASS] Fallback." << std::endl;
}

void TestWaterfallExhausted() {
    std::cout << "[Test] Nothing found anywhere..." << std::endl;
    Fixture f;
    auto result = f.service->runLazy(StandardBundle(), std::nullopt, MetadataRecord{});

    assert(result.extractionsPerformed == 3);
    assert(result.extractions.size() == 3);
    assert(result.phase1 == Phase1Source::None);
    assert(result.missingFields.size() == 4);
    assert(result.missingFields[0] == domain::fields::kReference);
    const std::vector<std::string> order = {"AVIS", "RC", "CPS"};
    assert(f.fragments->calls == order);
    assert(!result.noUsableDocument);
    std::cout << "[PASS] Exhausted." << std::endl;
}

void TestMultiTenderNoticeSkipped() {
    std::cout << "[Test] Multi-tender notice falls through to the rules..." << std::endl;
    Fixture f;
    f.fragments->fragments["RC"] = CompleteRecord(DocumentCategory::Rules);

    domain::TenderBundle bundle;
    bundle.add("avis.txt", "Avis: n° 1/2024, n° 2/2024, n° 3/2024 et n° 4/2024 sont publies ce jour.");
    bundle.add("rc.txt", "Reglement de consultation relatif aux travaux de voirie, article premier.");

    auto result = f.service->runLazy(bundle, std::string("2/2024"), MetadataRecord{});
    assert(result.extractions.count(DocumentCategory::PrimaryNotice) == 0);
    assert(result.extractionsPerformed == 1);
    assert(result.phase1 == Phase1Source::Fallback);
    assert(f.fragments->calls.size() == 1 && f.fragments->calls[0] == "RC");
    std::cout << "[PASS] Multi-tender guard." << std::endl;
}

void TestFrenchNoticePreferred() {
    std::cout << "[Test] French notice preferred over Arabic..." << std::endl;
    Fixture f;
    f.fragments->fragments["AVIS"] = CompleteRecord(DocumentCategory::PrimaryNotice);

    domain::TenderBundle bundle;
    bundle.add("avis_ar.txt", "Avis en langue arabe, version officielle du meme appel d'offres.");
    bundle.add("avis_fr.txt", "Avis d'appel d'offres ouvert pour des travaux de voirie, version francaise.");

    auto result = f.service->runLazy(bundle, std::nullopt, MetadataRecord{});
    assert(result.extractions.at(DocumentCategory::PrimaryNotice).filename == "avis_fr.txt");
    std::cout << "[PASS] Language preference." << std::endl;
}

void TestCancellation() {
    std::cout << "[Test] Cancellation before classification..." << std::endl;
    Fixture f;
    std::atomic<bool> cancel{true};
    auto result = f.service->runLazy(StandardBundle(), std::nullopt, MetadataRecord{}, nullptr, &cancel);

    assert(result.cancelled);
    assert(result.classifications.empty());
    assert(result.extractionsPerformed == 0);
    assert(result.trace.back() == IngestionStage::Done);
    assert(f.fragments->calls.empty());
    std::cout << "[PASS] Cancellation." << std::endl;
}

void TestNoUsableDocument() {
    std::cout << "[Test] Bundle without any waterfall document..." << std::endl;
    Fixture f;
    domain::TenderBundle bundle;
    bundle.add("photo.png", "not a document");
    bundle.add("notes.txt", "Liste de courses.");

    std::vector<std::string> statuses;
    auto result = f.service->runLazy(bundle, std::nullopt, MetadataRecord{},
                                     [&statuses](std::string message) { statuses.push_back(std::move(message)); });
    assert(result.noUsableDocument);
    assert(result.extractionsPerformed == 0);
    assert(result.phase1 == Phase1Source::None);
    assert(result.classifications.size() == 2);
    assert(!result.classifications[0].success && "png is unsupported");
    assert(!statuses.empty());
    std::cout << "[PASS] No usable document." << std::endl;
}

void TestAssembleAll() {
    std::cout << "[Test] Deep assembly extracts regardless of completeness..." << std::endl;
    Fixture f;
    domain::TenderBundle bundle = StandardBundle();
    bundle.add("annexe 1.txt", "Additif au dossier de consultation.");

    auto result = f.service->assembleAll(bundle, std::nullopt);
    assert(result.extractions.size() == 4);
    assert(result.extractionsPerformed == 4);
    assert(result.extractions.count(DocumentCategory::Addendum) == 1);
    assert(f.fragments->calls.empty() && "Deep assembly does not call the fragment extractor");
    AssertSamplesPurged(result);
    std::cout << "[PASS] Assemble all." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Tender Ingestion Test..." << std::endl;
    TestCompleteBaseSkipsExtraction();
    TestNoticeCompletesRecord();
    TestFallbackCompletesRecord();
    TestWaterfallExhausted();
    TestMultiTenderNoticeSkipped();
    TestFrenchNoticePreferred();
    TestCancellation();
    TestNoUsableDocument();
    TestAssembleAll();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
