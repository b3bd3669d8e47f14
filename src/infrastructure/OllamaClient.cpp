#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace tenderlens::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kGenerationTimeoutSeconds = 600;
constexpr int kTagsTimeoutSeconds = 5;

json BuildRequest(const std::string& model, bool forceJson) {
    json request = {
        {"model", model},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        request["format"] = "json";
    }
    return request;
}

// Decodes a 200 response body; logs and yields nullopt on transport, status or parse failure.
std::optional<json> DecodeResponse(const char* endpoint, const httplib::Result& res) {
    if (!res) {
        std::cerr << "[OllamaClient] " << endpoint << " connection failed: "
                  << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] " << endpoint << " HTTP Error " << res->status << std::endl;
        return std::nullopt;
    }
    try {
        json body = json::parse(res->body);
        if (body.is_object()) return body;
        std::cerr << "[OllamaClient] " << endpoint << " unexpected response shape" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] " << endpoint << " JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson) {
    json request = BuildRequest(model, forceJson);
    request["system"] = system;
    request["prompt"] = prompt;

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kGenerationTimeoutSeconds);
    auto body = DecodeResponse("/api/generate",
                               cli.Post("/api/generate", request.dump(), "application/json"));
    if (!body) return std::nullopt;

    auto it = body->find("response");
    if (it == body->end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const nlohmann::json& messages,
                                              bool forceJson) {
    json request = BuildRequest(model, forceJson);
    request["messages"] = messages;

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kGenerationTimeoutSeconds);
    auto body = DecodeResponse("/api/chat",
                               cli.Post("/api/chat", request.dump(), "application/json"));
    if (!body) return std::nullopt;

    const json message = body->value("message", json::object());
    if (!message.is_object() || !message.contains("content") || !message["content"].is_string()) {
        return std::nullopt;
    }
    return message["content"].get<std::string>();
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kTagsTimeoutSeconds);

    std::vector<std::string> models;
    auto body = DecodeResponse("/api/tags", cli.Get("/api/tags"));
    if (!body || !body->contains("models") || !(*body)["models"].is_array()) return models;

    for (const auto& item : (*body)["models"]) {
        if (item.contains("name") && item["name"].is_string()) {
            models.push_back(item["name"].get<std::string>());
        }
    }
    return models;
}

} // namespace tenderlens::infrastructure
