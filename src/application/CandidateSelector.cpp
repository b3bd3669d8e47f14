/**
 * @file CandidateSelector.cpp
 * @brief Implementation of CandidateSelector.
 */

#include "application/CandidateSelector.hpp"

#include <iostream>
#include <regex>
#include <set>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::ClassificationRecord;
using infrastructure::TextUtils;

namespace {

constexpr std::size_t kFrenchMarkerThreshold = 2;
constexpr std::size_t kArabicLetterThreshold = 50;

std::vector<std::regex> Compile(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    for (const char* source : sources) out.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
    return out;
}

const std::vector<std::regex>& FrenchFilenamePatterns() {
    static const std::vector<std::regex> kPatterns = Compile({
        R"([\s_\-\.]fr[\s_\-\.])", R"([\s_\-\.]fr$)", R"(^fr[\s_\-\.])",
        R"([\s_\-]français)", R"([\s_\-]francais)", R"([\s_\-]french)",
        R"(\(fr\))", R"(\[fr\])", R"(version[\s_\-]*fr)",
    });
    return kPatterns;
}

const std::vector<std::regex>& ArabicFilenamePatterns() {
    static const std::vector<std::regex> kPatterns = Compile({
        R"([\s_\-\.]ar[\s_\-\.])", R"([\s_\-\.]ar$)", R"(^ar[\s_\-\.])",
        R"([\s_\-]arabe)", R"([\s_\-]arabic)",
        R"(\(ar\))", R"(\[ar\])", R"(version[\s_\-]*ar)",
        "عربي", "العربية",
    });
    return kPatterns;
}

const std::vector<std::string>& FrenchContentMarkers() {
    static const std::vector<std::string> kMarkers = {
        "règlement de consultation", "cahier des prescriptions", "avis d'appel d'offres",
        "marché public", "le soumissionnaire", "pièces justificatives",
    };
    return kMarkers;
}

const std::vector<std::string>& MultiTenderPhrases() {
    static const std::vector<std::string> kPhrases = {
        "appels d'offres suivants", "marchés suivants", "consultations suivantes", "liste des appels",
        "tableau des marchés", "les références ci-après", "les marchés ci-après",
    };
    return kPhrases;
}

// "n° 12/2024", "ref: 12/2024", "12/ao/2024". Each whole match is one reference.
const std::vector<std::regex>& ReferencePatterns() {
    static const std::vector<std::regex> kPatterns = Compile({
        R"(n(?:°|o)?\s*\d+[/\-]\d{4})",
        R"(ref[:\s]+\d+[/\-]\d{4})",
        R"(\d+[/\-]ao[/\-]\d{4})",
    });
    return kPatterns;
}

bool AnyMatch(const std::string& text, const std::vector<std::regex>& patterns) {
    for (const auto& pattern : patterns) {
        if (std::regex_search(text, pattern)) return true;
    }
    return false;
}

// Filenames are matched against the full (lower-cased) path, as they were stored.
std::string LowerName(const std::string& filename) {
    return TextUtils::ToLower(filename);
}

} // namespace

bool CandidateSelector::IsFrench(const std::string& filename, const std::string& sampleText) {
    if (AnyMatch(LowerName(filename), FrenchFilenamePatterns())) return true;
    if (sampleText.empty()) return false;

    const std::string lower = TextUtils::ToLower(sampleText);
    std::size_t score = 0;
    for (const auto& marker : FrenchContentMarkers()) {
        if (lower.find(marker) != std::string::npos) ++score;
    }
    return score >= kFrenchMarkerThreshold;
}

bool CandidateSelector::IsArabic(const std::string& filename, const std::string& sampleText) {
    if (AnyMatch(LowerName(filename), ArabicFilenamePatterns())) return true;
    if (sampleText.empty()) return false;

    const std::size_t arabic = TextUtils::CountArabicLetters(sampleText);
    const std::size_t latin = TextUtils::CountLatinLetters(sampleText);
    return arabic > latin && arabic > kArabicLetterThreshold;
}

std::optional<ClassificationRecord> CandidateSelector::SelectBest(const std::vector<ClassificationRecord>& candidates) {
    if (candidates.empty()) return std::nullopt;

    const ClassificationRecord* firstFrench = nullptr;
    const ClassificationRecord* firstNeutral = nullptr;
    const ClassificationRecord* firstArabic = nullptr;

    for (const auto& candidate : candidates) {
        const bool french = IsFrench(candidate.filename, candidate.sampleText);
        const bool arabic = IsArabic(candidate.filename, candidate.sampleText);

        if (french && !arabic) {
            if (!firstFrench) firstFrench = &candidate;
        } else if (arabic && !french) {
            if (!firstArabic) firstArabic = &candidate;
        } else if (!firstNeutral) {
            firstNeutral = &candidate;
        }
    }

    if (firstFrench) return *firstFrench;
    if (firstNeutral) return *firstNeutral;
    std::cout << "[CandidateSelector] Only Arabic versions available, using " << firstArabic->filename << std::endl;
    return *firstArabic;
}

std::size_t CandidateSelector::CountDistinctReferences(const std::string& text) {
    const std::string lower = TextUtils::ToLower(text);
    std::set<std::string> references;
    for (const auto& pattern : ReferencePatterns()) {
        for (auto it = std::sregex_iterator(lower.begin(), lower.end(), pattern); it != std::sregex_iterator(); ++it) {
            references.insert(it->str());
        }
    }
    return references.size();
}

bool CandidateSelector::IsMultiTenderNotice(const std::string& sampleText,
                                            const std::optional<std::string>& tenderReference) {
    if (sampleText.empty()) return false;
    const std::string lower = TextUtils::ToLower(sampleText);
    const std::string context = tenderReference ? " (tender " + *tenderReference + ")" : "";

    for (const auto& phrase : MultiTenderPhrases()) {
        if (lower.find(phrase) != std::string::npos) {
            std::cout << "[CandidateSelector] Multi-tender phrase '" << phrase << "' found" << context << std::endl;
            return true;
        }
    }

    const std::size_t references = CountDistinctReferences(sampleText);
    if (references > kMaxNoticeReferences) {
        std::cout << "[CandidateSelector] " << references << " distinct references in notice" << context
                  << ", likely a multi-tender compilation" << std::endl;
        return true;
    }
    return false;
}

} // namespace tenderlens::application
