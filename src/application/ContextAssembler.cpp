/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include <sstream>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::DocumentCategory;
using infrastructure::TextUtils;

const std::array<DocumentCategory, 4>& ContextAssembler::DeepOrder() {
    static const std::array<DocumentCategory, 4> kOrder = {
        DocumentCategory::Addendum, DocumentCategory::Specification,
        DocumentCategory::Rules, DocumentCategory::PrimaryNotice,
    };
    return kOrder;
}

std::optional<ContextBundle> ContextAssembler::Assemble(
    const std::map<DocumentCategory, domain::ExtractionRecord>& extractions,
    const std::optional<std::string>& websiteContact) {
    ContextBundle bundle;

    for (DocumentCategory category : DeepOrder()) {
        auto it = extractions.find(category);
        if (it == extractions.end() || it->second.fullText.empty()) continue;
        bundle.sections.push_back({category, it->second.filename, TextUtils::Utf8Prefix(it->second.fullText, kSectionChars)});
    }

    if (bundle.isEmpty()) return std::nullopt;

    if (websiteContact && !TextUtils::IsBlank(*websiteContact)) {
        bundle.websiteContact = websiteContact;
    }
    return bundle;
}

std::string ContextBundle::render() const {
    std::stringstream ss;

    for (std::size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) ss << "\n\n";
        ss << "=== " << domain::CategoryToLabel(sections[i].category) << ": " << sections[i].filename << " ===\n"
           << sections[i].text;
    }

    if (websiteContact) {
        ss << "\n\n=== CONTACT ADMINISTRATIF (Site Web - à structurer) ===\n" << *websiteContact;
    }

    return TextUtils::Utf8Prefix(ss.str(), ContextAssembler::kContextChars);
}

} // namespace tenderlens::application
