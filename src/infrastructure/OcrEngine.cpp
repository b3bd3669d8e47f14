#include "infrastructure/OcrEngine.hpp"

#include <iostream>
#include <memory>
#include <tesseract/baseapi.h>

#include "domain/ExtractionError.hpp"

namespace tenderlens::infrastructure {

using domain::ExtractionError;
using domain::ExtractionErrorKind;

namespace {

struct TessApiDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        api->End();
        delete api;
    }
};

struct ThreadEngine {
    std::unique_ptr<tesseract::TessBaseAPI, TessApiDeleter> api;
    std::string key;
};

tesseract::TessBaseAPI& EngineForThisThread(const std::string& language, const std::string& tessdataPath) {
    thread_local ThreadEngine engine;
    const std::string key = tessdataPath + "|" + language;
    if (engine.api && engine.key == key) {
        return *engine.api;
    }

    engine.api.reset(new tesseract::TessBaseAPI());
    const char* dataPath = tessdataPath.empty() ? nullptr : tessdataPath.c_str();
    if (engine.api->Init(dataPath, language.c_str(), tesseract::OEM_DEFAULT) != 0) {
        engine.api.reset();
        engine.key.clear();
        throw ExtractionError(ExtractionErrorKind::ConversionFailure,
                              "tesseract could not load language data '" + language + "'");
    }
    engine.api->SetPageSegMode(tesseract::PSM_AUTO);
    engine.key = key;
    std::cout << "[OcrEngine] Tesseract " << tesseract::TessBaseAPI::Version()
              << " ready (" << language << ")" << std::endl;
    return *engine.api;
}

} // namespace

OcrEngine::OcrEngine(std::string language, std::string tessdataPath)
    : m_language(std::move(language)), m_tessdataPath(std::move(tessdataPath)) {}

std::string OcrEngine::recognize(const PageImage& image) const {
    if (image.pixels.empty() || image.width <= 0 || image.height <= 0) {
        throw ExtractionError(ExtractionErrorKind::ConversionFailure, "empty page image");
    }

    tesseract::TessBaseAPI& api = EngineForThisThread(m_language, m_tessdataPath);
    api.SetImage(image.pixels.data(), image.width, image.height, 1, image.bytesPerLine);

    std::unique_ptr<char[]> text(api.GetUTF8Text());
    api.Clear();
    if (!text) {
        throw ExtractionError(ExtractionErrorKind::ConversionFailure, "tesseract returned no text");
    }
    return std::string(text.get());
}

} // namespace tenderlens::infrastructure
