/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace tenderlens::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model)
    : m_client(host, port) {
    if (!model.empty()) {
        m_model = model;
        m_modelPinned = true;
    }
}

void OllamaAdapter::initialize() {
    if (!m_modelPinned) detectBestModel();
}

void OllamaAdapter::detectBestModel() {
    const auto availableModels = m_client.getAvailableModels();
    if (availableModels.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: " << getCurrentModel() << std::endl;
        return;
    }

    // Instruction-following models that handle French administrative text well come first.
    const std::vector<std::string> priorities = {
        "qwen2.5:7b",
        "qwen2.5",
        "llama3",
        "mistral",
        "gemma",
        "deepseek"
    };

    for (const auto& priority : priorities) {
        for (const auto& model : availableModels) {
            if (model.find(priority) != std::string::npos) {
                setModel(model);
                std::cout << "[OllamaAdapter] Auto-selected model: " << model << std::endl;
                return;
            }
        }
    }

    setModel(availableModels[0]);
    std::cout << "[OllamaAdapter] Fallback model: " << availableModels[0] << std::endl;
}

std::optional<std::string> OllamaAdapter::chat(const std::vector<ChatMessage>& history) {
    json messagesJson = json::array();
    for (const auto& msg : history) {
        messagesJson.push_back({
            {"role", ChatMessage::RoleToString(msg.role)},
            {"content", msg.content}
        });
    }
    return m_client.chat(getCurrentModel(), messagesJson, false);
}

std::optional<std::string> OllamaAdapter::generateJson(const std::string& systemPrompt, const std::string& userPrompt) {
    const std::string model = getCurrentModel();
    std::cout << "[OllamaAdapter] Sending request to " << model
              << " PromptSize=" << (systemPrompt.size() + userPrompt.size()) << " bytes" << std::endl;
    return m_client.generate(model, systemPrompt, userPrompt, true);
}

std::vector<std::string> OllamaAdapter::getAvailableModels() {
    return m_client.getAvailableModels();
}

void OllamaAdapter::setModel(const std::string& modelName) {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    m_model = modelName;
}

std::string OllamaAdapter::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace tenderlens::infrastructure
