/**
 * @file AIFragmentExtractor.cpp
 * @brief Implementation of AIFragmentExtractor.
 */

#include "application/AIFragmentExtractor.hpp"

#include <iostream>

#include "application/ContextAssembler.hpp"
#include "infrastructure/MetadataCodec.hpp"
#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using infrastructure::MetadataCodec;
using infrastructure::TextUtils;

AIFragmentExtractor::AIFragmentExtractor(std::shared_ptr<domain::AIService> ai,
                                         std::shared_ptr<const infrastructure::PromptCatalog> prompts,
                                         std::optional<std::string> sourceDate)
    : m_ai(std::move(ai)), m_prompts(std::move(prompts)), m_sourceDate(std::move(sourceDate)) {}

std::string AIFragmentExtractor::BuildFragmentPrompt(const std::string& text, const domain::SourceDocument& sourceLabel) {
    return "SOURCE_LABEL: " + domain::SourceDocumentToLabel(sourceLabel) + "\n\nTEXTE À ANALYSER:\n\n" +
           TextUtils::Utf8Prefix(text, kMaxTextChars);
}

std::optional<nlohmann::json> AIFragmentExtractor::parseObject(const std::string& response, const char* what) const {
    try {
        auto j = nlohmann::json::parse(MetadataCodec::StripCodeFence(response));
        if (!j.is_object()) {
            std::cerr << "[AIFragmentExtractor] " << what << " response is not a JSON object" << std::endl;
            return std::nullopt;
        }
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[AIFragmentExtractor] Failed to parse " << what << " response: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<domain::MetadataRecord> AIFragmentExtractor::extractFragment(const std::string& text,
                                                                           const domain::SourceDocument& sourceLabel) {
    const std::string label = domain::SourceDocumentToLabel(sourceLabel);
    if (TextUtils::Utf8Length(TextUtils::Trim(text)) < kMinTextChars) {
        std::cout << "[AIFragmentExtractor] " << label << " text too short, skipping" << std::endl;
        return std::nullopt;
    }

    std::cout << "[AIFragmentExtractor] Extracting fragment (source=" << label << ")..." << std::endl;
    auto response = m_ai->generateJson(m_prompts->primaryMetadataPrompt(), BuildFragmentPrompt(text, sourceLabel));
    if (!response) return std::nullopt;

    auto j = parseObject(*response, "fragment");
    if (!j) return std::nullopt;

    std::vector<std::string> issues;
    auto record = MetadataCodec::FromJson(*j, sourceLabel, issues);
    for (const auto& issue : issues) {
        std::cerr << "[AIFragmentExtractor] " << label << ": " << issue << std::endl;
    }
    if (m_sourceDate) record.stampSourceDate(*m_sourceDate);

    std::cout << "[AIFragmentExtractor] " << label << " fragment has " << record.fields().size() << " fields" << std::endl;
    return record;
}

std::optional<nlohmann::json> AIFragmentExtractor::analyzeDeep(const std::string& context) {
    if (TextUtils::IsBlank(context)) return std::nullopt;

    std::cout << "[AIFragmentExtractor] Starting deep analysis..." << std::endl;
    auto response = m_ai->generateJson(
        m_prompts->deepAnalysisPrompt(),
        "Extrait les métadonnées universelles de ces documents d'appel d'offres:\n\n" +
            TextUtils::Utf8Prefix(context, ContextAssembler::kContextChars));
    if (!response) return std::nullopt;
    return parseObject(*response, "deep analysis");
}

} // namespace tenderlens::application
