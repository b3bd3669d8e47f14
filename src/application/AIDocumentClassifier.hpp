/**
 * @file AIDocumentClassifier.hpp
 * @brief Last-resort classifier that asks the language model.
 */

#pragma once
#include <memory>
#include <string>

#include "domain/AIService.hpp"
#include "domain/DocumentClassificationService.hpp"
#include "infrastructure/PromptCatalog.hpp"

namespace tenderlens::application {

class AIDocumentClassifier : public domain::DocumentClassificationService {
public:
    AIDocumentClassifier(std::shared_ptr<domain::AIService> ai,
                         std::shared_ptr<const infrastructure::PromptCatalog> prompts);

    /** @p sampleText is expected to be truncated already. */
    domain::DocumentCategory classify(const std::string& sampleText, const std::string& filename,
                                      bool isScanned) override;

    /** @brief Maps a one-word answer to a category; anything unrecognised is Other. */
    static domain::DocumentCategory ParseAnswer(const std::string& answer);

private:
    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<const infrastructure::PromptCatalog> m_prompts;
};

} // namespace tenderlens::application
