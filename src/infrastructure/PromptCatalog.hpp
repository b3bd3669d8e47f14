/**
 * @file PromptCatalog.hpp
 * @brief System prompts for the AI collaborators, loaded once at start-up.
 */

#pragma once

#include <string>

namespace tenderlens::infrastructure {

/**
 * @class PromptCatalog
 * @brief Immutable set of prompts.
 *
 * Built once by the application and passed by reference into the AI
 * adapters. A prompt directory may override any of the built-in texts with
 * a file of the same name.
 */
class PromptCatalog {
public:
    static constexpr const char* kPrimaryMetadataFile = "primary_metadata_extraction_prompt.txt";
    static constexpr const char* kClassificationFile = "document_classification_prompt.txt";
    static constexpr const char* kDeepAnalysisFile = "universal_extraction_prompt.txt";

    /** @brief Built-in prompts only. */
    static PromptCatalog Defaults();

    /** @brief Built-in prompts, each replaced by @p directory/<file> when that file is readable. */
    static PromptCatalog LoadFromDirectory(const std::string& directory);

    const std::string& primaryMetadataPrompt() const { return m_primaryMetadata; }
    const std::string& classificationPrompt() const { return m_classification; }
    const std::string& deepAnalysisPrompt() const { return m_deepAnalysis; }

private:
    std::string m_primaryMetadata;
    std::string m_classification;
    std::string m_deepAnalysis;
};

} // namespace tenderlens::infrastructure
