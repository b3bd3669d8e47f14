/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace tenderlens::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& section, const char* key, T& target) {
    if (!section.is_object() || !section.contains(key)) return;
    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

const nlohmann::json& Section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (j.is_object() && j.contains(name) && j.at(name).is_object()) return j.at(name);
    return kEmpty;
}

} // namespace

PipelineSettings ConfigLoader::FromJson(const nlohmann::json& j) {
    PipelineSettings settings;

    const auto& ocr = Section(j, "ocr");
    ReadKey(ocr, "language", settings.ocr.language);
    ReadKey(ocr, "dpi", settings.ocr.dpi);
    ReadKey(ocr, "tessdata_path", settings.ocr.tessdataPath);

    const auto& legacy = Section(j, "legacy_doc");
    ReadKey(legacy, "sample_timeout_seconds", settings.legacyDoc.sampleTimeoutSeconds);
    ReadKey(legacy, "full_timeout_seconds", settings.legacyDoc.fullTimeoutSeconds);

    const auto& workers = Section(j, "workers");
    ReadKey(workers, "conversion", settings.workers.conversion);
    ReadKey(workers, "tenders", settings.workers.tenders);

    const auto& ai = Section(j, "ai");
    ReadKey(ai, "enabled", settings.ai.enabled);
    ReadKey(ai, "host", settings.ai.host);
    ReadKey(ai, "port", settings.ai.port);
    ReadKey(ai, "model", settings.ai.model);
    ReadKey(ai, "classification_enabled", settings.ai.classificationEnabled);
    ReadKey(ai, "prompts_dir", settings.ai.promptsDir);

    ReadKey(j, "output_dir", settings.outputDir);

    if (settings.ocr.dpi <= 0) settings.ocr.dpi = 200;
    if (settings.legacyDoc.sampleTimeoutSeconds <= 0) settings.legacyDoc.sampleTimeoutSeconds = 30;
    if (settings.legacyDoc.fullTimeoutSeconds <= 0) settings.legacyDoc.fullTimeoutSeconds = 60;
    if (settings.workers.tenders == 0) settings.workers.tenders = 1;

    return settings;
}

PipelineSettings ConfigLoader::Load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return PipelineSettings{};
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return PipelineSettings{};
}

} // namespace tenderlens::infrastructure
