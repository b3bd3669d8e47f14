/**
 * @file TenderLensApp.cpp
 * @brief Implementation of the TenderLensApp class.
 */

#include "app/TenderLensApp.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

#include "application/AIDocumentClassifier.hpp"
#include "application/ContextAssembler.hpp"
#include "application/MetadataMerger.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/MetadataCodec.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tenderlens::app {

using infrastructure::MetadataCodec;

namespace {

json ResultToJson(const infrastructure::TenderSource& source,
                  const application::TenderIngestionService::IngestionResult& result) {
    json extractions = json::object();
    for (const auto& [category, record] : result.extractions) {
        extractions[domain::CategoryToLabel(category)] = MetadataCodec::ToJson(record);
    }

    json failed = json::array();
    for (const auto& record : result.failedExtractions) failed.push_back(MetadataCodec::ToJson(record));

    json classifications = json::array();
    for (const auto& record : result.classifications) classifications.push_back(MetadataCodec::ToJson(record));

    json trace = json::array();
    for (auto stage : result.trace) trace.push_back(application::StageToString(stage));

    return json{
        {"tender", source.id},
        {"reference", source.reference ? json(*source.reference) : json(nullptr)},
        {"phase1_source", application::Phase1SourceToLabel(result.phase1)},
        {"missing_fields", result.missingFields},
        {"extractions_performed", result.extractionsPerformed},
        {"no_usable_document", result.noUsableDocument},
        {"cancelled", result.cancelled},
        {"metadata", MetadataCodec::ToJson(result.metadata)},
        {"extractions", extractions},
        {"failed_extractions", failed},
        {"classifications", classifications},
        {"trace", trace}
    };
}

} // namespace

TenderLensApp::TenderLensApp() = default;

TenderLensApp::~TenderLensApp() {
    Shutdown();
}

std::string TenderLensApp::Usage() {
    std::ostringstream ss;
    ss << "Usage: tenderlens [options] <tenders-root>\n"
       << "\n"
       << "Each sub-directory of <tenders-root> is one tender bundle.\n"
       << "\n"
       << "Options:\n"
       << "  --config <file>    settings.json to use\n"
       << "  --output <dir>     result directory (overrides output_dir)\n"
       << "  --only <name>      process only this tender directory (repeatable)\n"
       << "  --deep             also extract annex/CPS/RC/notice for deep analysis\n"
       << "  --no-ai            disable the language model for this run\n"
       << "  -h, --help         show this help\n";
    return ss.str();
}

std::optional<CliOptions> TenderLensApp::ParseArgs(const std::vector<std::string>& args, std::string& error) {
    CliOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                error = std::string(flag) + " needs a value";
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config") {
            auto v = value("--config");
            if (!v) return std::nullopt;
            options.configPath = *v;
        } else if (arg == "--output") {
            auto v = value("--output");
            if (!v) return std::nullopt;
            options.outputDir = *v;
        } else if (arg == "--only") {
            auto v = value("--only");
            if (!v) return std::nullopt;
            options.only.push_back(*v);
        } else if (arg == "--deep") {
            options.deep = true;
        } else if (arg == "--no-ai") {
            options.noAi = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (options.tendersRoot.empty()) {
            options.tendersRoot = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }

    if (!options.help && options.tendersRoot.empty()) {
        error = "Missing <tenders-root>";
        return std::nullopt;
    }
    return options;
}

bool TenderLensApp::Init(const CliOptions& options) {
    m_options = options;

    const fs::path settingsPath = infrastructure::PathUtils::ResolveSettingsPath(options.configPath);
    std::cout << "[TenderLensApp] Settings: " << settingsPath.string() << std::endl;
    m_settings = infrastructure::ConfigLoader::Load(settingsPath.string());
    if (options.outputDir) m_settings.outputDir = *options.outputDir;
    if (options.noAi) m_settings.ai.enabled = false;

    std::error_code ec;
    if (!fs::is_directory(options.tendersRoot, ec)) {
        std::cerr << "[TenderLensApp] Not a directory: " << options.tendersRoot << std::endl;
        return false;
    }
    fs::create_directories(m_settings.outputDir, ec);
    if (ec) {
        std::cerr << "[TenderLensApp] Cannot create output directory " << m_settings.outputDir << ": " << ec.message() << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    m_conversionPool = std::make_shared<infrastructure::ConversionPool>(m_settings.workers.conversion, "ConversionPool");
    m_tenderPool = std::make_unique<infrastructure::ConversionPool>(m_settings.workers.tenders, "TenderPool");
    m_writer = std::make_unique<infrastructure::ResultWriter>();
    m_extractor = std::make_shared<infrastructure::ContentExtractor>(m_settings, m_conversionPool);
    m_prompts = std::make_shared<infrastructure::PromptCatalog>(
        infrastructure::PromptCatalog::LoadFromDirectory(m_settings.ai.promptsDir));

    std::shared_ptr<domain::DocumentClassificationService> external;
    if (m_settings.ai.enabled) {
        auto ollama = std::make_shared<infrastructure::OllamaAdapter>(m_settings.ai.host, m_settings.ai.port, m_settings.ai.model);
        ollama->initialize();
        m_ai = ollama;
        if (m_settings.ai.classificationEnabled) {
            external = std::make_shared<application::AIDocumentClassifier>(m_ai, m_prompts);
        }
        std::cout << "[TenderLensApp] AI enabled, model " << m_ai->getCurrentModel() << std::endl;
    } else {
        std::cout << "[TenderLensApp] AI disabled: documents are classified and extracted, no metadata is structured" << std::endl;
    }

    m_classifier = std::make_shared<application::DocumentClassifier>(m_extractor, external);
    return true;
}

void TenderLensApp::Shutdown() {
    // Tender workers first: they still feed the conversion pool and the writer.
    if (m_tenderPool) m_tenderPool->stop();
    if (m_conversionPool) m_conversionPool->stop();
    if (m_writer) m_writer->stop();
}

domain::MetadataRecord TenderLensApp::websiteMetadata(const infrastructure::TenderSource& source,
                                                      domain::FragmentExtractionService* fragments) const {
    domain::MetadataRecord record = source.websiteMetadata.value_or(domain::MetadataRecord{});
    if (fragments && source.websiteText) {
        auto fragment = fragments->extractFragment(*source.websiteText, domain::WebsiteSource{});
        if (fragment) record = application::MetadataMerger::Merge(record, *fragment);
    }
    return record;
}

void TenderLensApp::runDeepAnalysis(const infrastructure::TenderSource& source,
                                    const application::TenderIngestionService& ingestion,
                                    application::AIFragmentExtractor* fragments,
                                    const std::string& outputBase) const {
    auto assembled = ingestion.assembleAll(source.bundle, source.reference, nullptr, &m_cancel);

    json documents = json::array();
    for (const auto& [category, record] : assembled.extractions) {
        documents.push_back(MetadataCodec::ToJson(record, false));
    }

    json out{
        {"tender", source.id},
        {"documents", documents},
        {"cancelled", assembled.cancelled},
        {"universal_metadata", nullptr}
    };

    auto context = application::ContextAssembler::Assemble(assembled.extractions, source.websiteContact);
    if (!context) {
        std::cout << "[TenderLensApp] " << source.id << ": no document text available for deep analysis" << std::endl;
    } else if (fragments) {
        auto analysis = fragments->analyzeDeep(context->render());
        if (analysis) out["universal_metadata"] = *analysis;
    }

    m_writer->writeJsonAsync(outputBase + ".deep.json", out);
}

TenderOutcome TenderLensApp::processTender(const std::string& tenderPath) const {
    TenderOutcome outcome;
    outcome.id = fs::path(tenderPath).filename().string();

    auto source = infrastructure::TenderDirectoryScanner::Load(tenderPath);
    if (!source) return outcome;
    outcome.loaded = true;

    // Per-tender collaborators: they carry the tender's source date.
    std::shared_ptr<application::AIFragmentExtractor> fragments;
    if (m_ai) fragments = std::make_shared<application::AIFragmentExtractor>(m_ai, m_prompts, source->sourceDate);
    application::TenderIngestionService ingestion(m_classifier, m_extractor, fragments);

    domain::MetadataRecord current = websiteMetadata(*source, fragments.get());
    auto result = ingestion.runLazy(source->bundle, source->reference, std::move(current), nullptr, &m_cancel);

    outcome.phase1 = result.phase1;
    outcome.extractions = result.extractionsPerformed;
    outcome.failures = result.failedExtractions.size();
    outcome.cancelled = result.cancelled;

    const std::string outputBase =
        (fs::path(m_settings.outputDir) / infrastructure::PathUtils::SanitizeFileComponent(source->id)).string();
    m_writer->writeJsonAsync(outputBase + ".json", ResultToJson(*source, result));

    if (m_options.deep && !m_cancel) {
        runDeepAnalysis(*source, ingestion, fragments.get(), outputBase);
    }
    return outcome;
}

int TenderLensApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;
    auto options = ParseArgs(args, error);
    if (!options) {
        std::cerr << "tenderlens: " << error << "\n\n" << Usage();
        return 1;
    }
    if (options->help) {
        std::cout << Usage();
        return 0;
    }
    if (!Init(*options)) return 1;

    infrastructure::TenderDirectoryScanner scanner(m_options.tendersRoot);
    std::vector<std::string> tenders;
    for (const auto& path : scanner.listTenders()) {
        const std::string name = fs::path(path).filename().string();
        if (m_options.only.empty() ||
            std::find(m_options.only.begin(), m_options.only.end(), name) != m_options.only.end()) {
            tenders.push_back(path);
        }
    }
    std::cout << "[TenderLensApp] " << tenders.size() << " tender(s) under " << m_options.tendersRoot << std::endl;

    std::vector<std::future<TenderOutcome>> futures;
    futures.reserve(tenders.size());
    for (const auto& path : tenders) {
        futures.push_back(m_tenderPool->submit([this, path]() { return processTender(path); }));
    }

    std::map<std::string, int> byPhase1;
    int unreadable = 0;
    for (auto& future : futures) {
        try {
            TenderOutcome outcome = future.get();
            if (!outcome.loaded) {
                ++unreadable;
                continue;
            }
            ++byPhase1[application::Phase1SourceToLabel(outcome.phase1)];
            std::cout << "[TenderLensApp] " << outcome.id << ": phase 1 " << application::Phase1SourceToLabel(outcome.phase1)
                      << ", " << outcome.extractions << " extraction(s), " << outcome.failures << " failure(s)"
                      << (outcome.cancelled ? " [CANCELLED]" : "") << std::endl;
        } catch (const std::exception& e) {
            ++unreadable;
            std::cerr << "[TenderLensApp] Tender failed: " << e.what() << std::endl;
        }
    }

    m_writer->waitIdle();
    const std::size_t writeFailures = m_writer->failureCount();
    Shutdown();

    std::cout << "[TenderLensApp] Summary:";
    for (const auto& [label, count] : byPhase1) std::cout << " " << label << "=" << count;
    std::cout << " unreadable=" << unreadable << std::endl;

    if (writeFailures > 0) {
        std::cerr << "[TenderLensApp] " << writeFailures << " result file(s) could not be written" << std::endl;
        return 2;
    }
    return 0;
}

} // namespace tenderlens::app
