/**
 * @file AIFragmentExtractor.hpp
 * @brief Language-model backed fragment extraction and deep analysis.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "domain/AIService.hpp"
#include "domain/FragmentExtractionService.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace tenderlens::application {

/**
 * @class AIFragmentExtractor
 * @brief Sends one document's text to the model and validates the JSON it returns.
 *
 * Shared between tender workers; it holds no per-call state.
 */
class AIFragmentExtractor : public domain::FragmentExtractionService {
public:
    /** Texts with fewer non-blank characters are not worth a call. */
    static constexpr std::size_t kMinTextChars = 50;
    static constexpr std::size_t kMaxTextChars = 20000;

    AIFragmentExtractor(std::shared_ptr<domain::AIService> ai,
                        std::shared_ptr<const infrastructure::PromptCatalog> prompts,
                        std::optional<std::string> sourceDate = std::nullopt);

    std::optional<domain::MetadataRecord> extractFragment(const std::string& text,
                                                          const domain::SourceDocument& sourceLabel) override;

    /**
     * @brief Deep analysis over an assembled multi-document context.
     * @return The model's JSON object, nullopt on transport or parse failure.
     */
    std::optional<nlohmann::json> analyzeDeep(const std::string& context);

    /** @brief User message for one fragment call. */
    static std::string BuildFragmentPrompt(const std::string& text, const domain::SourceDocument& sourceLabel);

private:
    std::optional<nlohmann::json> parseObject(const std::string& response, const char* what) const;

    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<const infrastructure::PromptCatalog> m_prompts;
    std::optional<std::string> m_sourceDate;
};

} // namespace tenderlens::application
