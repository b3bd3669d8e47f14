#include "application/AIDocumentClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using domain::AIService;
using domain::DocumentCategory;

AIDocumentClassifier::AIDocumentClassifier(std::shared_ptr<AIService> ai,
                                           std::shared_ptr<const infrastructure::PromptCatalog> prompts)
    : m_ai(std::move(ai)), m_prompts(std::move(prompts)) {}

DocumentCategory AIDocumentClassifier::ParseAnswer(const std::string& answer) {
    std::string label = infrastructure::TextUtils::Trim(answer);
    while (!label.empty() && std::ispunct(static_cast<unsigned char>(label.back()))) label.pop_back();
    std::transform(label.begin(), label.end(), label.begin(), [](unsigned char c) { return std::toupper(c); });

    auto category = domain::ParseCategoryLabel(label);
    if (!category || *category == DocumentCategory::Unknown) return DocumentCategory::Other;
    return *category;
}

DocumentCategory AIDocumentClassifier::classify(const std::string& sampleText, const std::string& filename,
                                                bool isScanned) {
    std::vector<AIService::ChatMessage> history;
    history.push_back({AIService::ChatMessage::Role::System, m_prompts->classificationPrompt()});
    history.push_back({AIService::ChatMessage::Role::User,
                       "Filename: " + filename + "\n\nDocument content:\n" + sampleText + "\n\nClassification:"});

    std::cout << "[AIDocumentClassifier] Classifying " << filename << (isScanned ? " (scanned)" : "") << std::endl;
    auto answer = m_ai->chat(history);
    if (!answer) {
        std::cerr << "[AIDocumentClassifier] No answer for " << filename << std::endl;
        return DocumentCategory::Unknown;
    }

    DocumentCategory category = ParseAnswer(*answer);
    std::cout << "[AIDocumentClassifier] " << filename << " -> " << domain::CategoryToLabel(category) << std::endl;
    return category;
}

} // namespace tenderlens::application
