/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for communication with a local Ollama server.
 */

#pragma once
#include "domain/AIService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>

namespace tenderlens::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements AIService using the Ollama REST API.
 *
 * Safe to share between tender workers: the only mutable state is the model name.
 */
class OllamaAdapter : public domain::AIService {
public:
    /**
     * @param model Model to use; empty means "detect the best installed one" in initialize().
     */
    OllamaAdapter(const std::string& host = "localhost", int port = 11434, const std::string& model = "");

    void initialize() override;

    std::optional<std::string> chat(const std::vector<ChatMessage>& history) override;
    std::optional<std::string> generateJson(const std::string& systemPrompt, const std::string& userPrompt) override;

    std::vector<std::string> getAvailableModels() override;
    void setModel(const std::string& modelName) override;
    std::string getCurrentModel() const override;

private:
    void detectBestModel();

    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model = "qwen2.5:7b"; ///< Target model name.
    bool m_modelPinned = false;
};

} // namespace tenderlens::infrastructure
