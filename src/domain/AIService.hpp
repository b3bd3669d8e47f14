/**
 * @file AIService.hpp
 * @brief Interface for the language model backing fragment extraction and classification.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tenderlens::domain {

/**
 * @class AIService
 * @brief Abstract interface over a chat/completion model.
 */
class AIService {
public:
    virtual ~AIService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    struct ChatMessage {
        enum class Role { System, User, Assistant };
        Role role;
        std::string content;

        static std::string RoleToString(Role r) {
            switch (r) {
                case Role::System: return "system";
                case Role::User: return "user";
                case Role::Assistant: return "assistant";
            }
            return "user";
        }
    };

    /**
     * @brief Sends a chat history to the model and gets the next response.
     * @return The assistant's response content, nullopt on transport failure.
     */
    virtual std::optional<std::string> chat(const std::vector<ChatMessage>& history) = 0;

    /**
     * @brief Generates a JSON-only response using a system prompt and a user prompt.
     * @param systemPrompt System-level instructions (must enforce JSON-only output).
     * @param userPrompt User content (the document or request).
     * @return Optional JSON string if generation succeeded.
     */
    virtual std::optional<std::string> generateJson(const std::string& systemPrompt, const std::string& userPrompt) = 0;

    virtual std::vector<std::string> getAvailableModels() = 0;
    virtual void setModel(const std::string& modelName) = 0;
    virtual std::string getCurrentModel() const = 0;
};

} // namespace tenderlens::domain
