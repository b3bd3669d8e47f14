#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/CandidateSelector.hpp"

using namespace tenderlens;
using application::CandidateSelector;
using domain::ClassificationRecord;

static ClassificationRecord Candidate(const std::string& filename, const std::string& sample = "") {
    ClassificationRecord record;
    record.filename = filename;
    record.sampleText = sample;
    record.category = domain::DocumentCategory::PrimaryNotice;
    record.success = true;
    return record;
}

static std::string ArabicText(int letters) {
    std::string out;
    for (int i = 0; i < letters; ++i) out += "ب";
    return out;
}

void TestLanguageDetection() {
    std::cout << "[Test] Language detection..." << std::endl;
    assert(CandidateSelector::IsFrench("avis_fr.pdf", ""));
    assert(CandidateSelector::IsFrench("AVIS (FR).pdf", ""));
    assert(CandidateSelector::IsFrench("avis version francaise.pdf", ""));
    assert(CandidateSelector::IsFrench("avis - francais.pdf", ""));
    assert(CandidateSelector::IsFrench("doc.pdf", "Marché public. Le soumissionnaire doit fournir..."));
    assert(!CandidateSelector::IsFrench("doc.pdf", "Marché public uniquement."));

    assert(CandidateSelector::IsArabic("avis_ar.pdf", ""));
    assert(CandidateSelector::IsArabic("إعلان عربي.pdf", ""));
    assert(CandidateSelector::IsArabic("doc.pdf", ArabicText(60)));
    assert(!CandidateSelector::IsArabic("doc.pdf", ArabicText(40)));
    assert(!CandidateSelector::IsArabic("doc.pdf", ArabicText(60) + std::string(80, 'x')));
    std::cout << "[PASS] Language detection." << std::endl;
}

void TestSelectBest() {
    std::cout << "[Test] Candidate tiers..." << std::endl;
    assert(!CandidateSelector::SelectBest({}).has_value());

    auto best = CandidateSelector::SelectBest({Candidate("avis_ar.pdf"), Candidate("avis_fr.pdf")});
    assert(best && best->filename == "avis_fr.pdf");

    best = CandidateSelector::SelectBest({Candidate("avis_ar.pdf"), Candidate("avis.pdf"), Candidate("avis2.pdf")});
    assert(best && best->filename == "avis.pdf" && "Neutral beats Arabic, first neutral wins");

    best = CandidateSelector::SelectBest({Candidate("avis_ar.pdf"), Candidate("avis-ar-2.pdf")});
    assert(best && best->filename == "avis_ar.pdf" && "Arabic only: first one");

    // A file tagged both ways counts as neutral.
    best = CandidateSelector::SelectBest({Candidate("avis_ar.pdf"), Candidate("avis_fr_ar.pdf")});
    assert(best && best->filename == "avis_fr_ar.pdf");

    // Stable for identical input.
    const std::vector<ClassificationRecord> list = {Candidate("a.pdf"), Candidate("b.pdf"), Candidate("c_fr.pdf")};
    for (int i = 0; i < 3; ++i) assert(CandidateSelector::SelectBest(list)->filename == "c_fr.pdf");
    std::cout << "[PASS] Candidate tiers." << std::endl;
}

void TestMultiTenderNotice() {
    std::cout << "[Test] Multi-tender notice detection..." << std::endl;
    assert(!CandidateSelector::IsMultiTenderNotice(""));
    assert(!CandidateSelector::IsMultiTenderNotice("Avis d'appel d'offres n° 12/2024"));
    assert(CandidateSelector::IsMultiTenderNotice("Le maître d'ouvrage lance les appels d'offres suivants :"));
    assert(CandidateSelector::IsMultiTenderNotice("Voir les marchés ci-après", std::string("12/2024")));

    // Exactly three references is still a single tender.
    assert(!CandidateSelector::IsMultiTenderNotice("n° 1/2024 n° 2/2024 ref: 3/2024"));
    assert(CandidateSelector::IsMultiTenderNotice("n° 1/2024 n° 2/2024 ref: 3/2024 4/AO/2024"));

    // Whole matches are compared as written: only a verbatim repeat collapses.
    assert(CandidateSelector::CountDistinctReferences("n° 5/2024, n° 5/2024") == 1);
    assert(CandidateSelector::CountDistinctReferences("n° 5/2024, no 5-2024, ref: 5/2024") == 3);
    assert(CandidateSelector::CountDistinctReferences("AO n° 5/2024 ref: 5-2024 n° 6/2024 ref: 6-2024") == 4);
    assert(CandidateSelector::IsMultiTenderNotice("AO n° 5/2024 ref: 5-2024 n° 6/2024 ref: 6-2024"));
    assert(CandidateSelector::CountDistinctReferences("AO N°7/2023 et N°8/2023") == 2);
    std::cout << "[PASS] Multi-tender notice." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Candidate Selector Test..." << std::endl;
    TestLanguageDetection();
    TestSelectBest();
    TestMultiTenderNotice();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
