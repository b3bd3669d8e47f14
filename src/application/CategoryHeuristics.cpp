#include "application/CategoryHeuristics.hpp"

#include <regex>
#include <utility>
#include <vector>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::DocumentCategory;
using infrastructure::TextUtils;

namespace {

struct FilenameRule {
    DocumentCategory category;
    std::vector<std::regex> patterns;
};

std::vector<std::regex> Compile(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    for (const char* source : sources) {
        out.emplace_back(source, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
    return out;
}

// Order matters: AVIS, RC, CPS, ANNEXE first, then the annex forms.
const std::vector<FilenameRule>& FilenameRules() {
    static const std::vector<FilenameRule> kRules = {
        {DocumentCategory::PrimaryNotice, Compile({R"(\bavis\b)", R"(\bavis[\s_-])", R"([\s_-]avis\b)", R"(avis[\s_-]*(ar|fr))"})},
        {DocumentCategory::Rules, Compile({R"(\brc\b)", R"(\brcdp\b)", R"(\brcdg\b)"})},
        {DocumentCategory::Specification, Compile({R"(\bcps\b)", R"(\bccaf\b)"})},
        {DocumentCategory::Addendum, Compile({R"(\bannexe\b)"})},
        {DocumentCategory::PriceSchedule, Compile({R"(\bbpde\b)", R"(\bbordereau[\s_-]*prix\b)", R"(\bbdp\b)"})},
        {DocumentCategory::CommitmentForm, Compile({R"(\bae\b)", R"(\bacte[\s_-]*engagement\b)"})},
        {DocumentCategory::CostBreakdown, Compile({R"(\bdsh\b)", R"(\bsous[\s_-]*detail\b)", R"(\bdecomposition\b)"})},
        {DocumentCategory::GeneralAdminClauses, Compile({R"(\bccag\b)"})},
        {DocumentCategory::TechnicalClauses, Compile({R"(\bcctp\b)"})},
        {DocumentCategory::QuantitySchedule, Compile({R"(\bbq\b)", R"(\bbordereau[\s_-]*quantit\b)"})},
        {DocumentCategory::EstimatedQuantities, Compile({R"(\bdqe\b)", R"(\bdevis[\s_-]*quantitatif\b)"})},
    };
    return kRules;
}

// A file called "avis_rc.pdf" is the rules, not the notice.
const std::regex& NoticeGuard() {
    static const std::regex kGuard(R"(\b(rc|cps|ccaf|rcdp|rcdg)\b)", std::regex::ECMAScript | std::regex::optimize);
    return kGuard;
}

const std::vector<std::pair<DocumentCategory, std::vector<std::string>>>& ContentKeywords() {
    static const std::vector<std::pair<DocumentCategory, std::vector<std::string>>> kKeywords = {
        {DocumentCategory::PrimaryNotice,
         {"avis de consultation", "avis d'appel d'offres", "avis d'appel", "avis appel offres", "avis ao", "avis"}},
        {DocumentCategory::Rules,
         {"règlement de consultation", "reglement de consultation", "règlement de la consultation",
          "reglement de la consultation"}},
        {DocumentCategory::Specification,
         {"cahier des prescriptions spéciales", "cahier des prescriptions speciales", "cahier des clauses"}},
        {DocumentCategory::Addendum, {"annexe", "additif", "avenant"}},
    };
    return kKeywords;
}

} // namespace

std::string CategoryHeuristics::NormalizedBasename(const std::string& filename) {
    const auto slash = filename.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    return TextUtils::ToLower(base);
}

DocumentCategory CategoryHeuristics::FromFilename(const std::string& filename) {
    const std::string base = NormalizedBasename(filename);
    if (base.empty()) return DocumentCategory::Unknown;

    for (const auto& rule : FilenameRules()) {
        for (const auto& pattern : rule.patterns) {
            if (!std::regex_search(base, pattern)) continue;
            if (rule.category == DocumentCategory::PrimaryNotice && std::regex_search(base, NoticeGuard())) {
                continue;
            }
            return rule.category;
        }
    }
    return DocumentCategory::Unknown;
}

DocumentCategory CategoryHeuristics::FromContent(const std::string& text) {
    if (text.empty()) return DocumentCategory::Unknown;
    const std::string lower = TextUtils::ToLower(text);

    for (const auto& [category, keywords] : ContentKeywords()) {
        for (const auto& keyword : keywords) {
            if (lower.find(keyword) != std::string::npos) return category;
        }
    }
    return DocumentCategory::Unknown;
}

DocumentCategory CategoryHeuristics::Classify(const std::string& filename, const std::string& text) {
    DocumentCategory category = FromFilename(filename);
    if (category != DocumentCategory::Unknown) return category;
    return FromContent(text);
}

} // namespace tenderlens::application
