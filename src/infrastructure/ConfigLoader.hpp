/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading pipeline configuration (settings.json).
 *
 * Every key is optional; anything missing or of the wrong type keeps its default.
 */

#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tenderlens::infrastructure {

struct OcrSettings {
    std::string language = "fra+ara+eng";
    int dpi = 200;
    std::string tessdataPath;  ///< Empty = tesseract's compiled-in default.
};

struct LegacyDocSettings {
    int sampleTimeoutSeconds = 30;
    int fullTimeoutSeconds = 60;
};

struct WorkerSettings {
    std::size_t conversion = 0;  ///< 0 = hardware concurrency.
    std::size_t tenders = 2;
};

struct AISettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model;  ///< Empty = pick the best installed model.
    bool classificationEnabled = true;
    std::string promptsDir;  ///< Optional overrides for the built-in prompts.
};

struct PipelineSettings {
    OcrSettings ocr;
    LegacyDocSettings legacyDoc;
    WorkerSettings workers;
    AISettings ai;
    std::string outputDir = "tenderlens_results";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p path.
     * A missing file yields defaults silently; malformed JSON is reported on stderr and yields defaults.
     */
    static PipelineSettings Load(const std::string& path);

    /** @brief Applies the keys present in @p j over the defaults. */
    static PipelineSettings FromJson(const nlohmann::json& j);
};

} // namespace tenderlens::infrastructure
