/**
 * @file TenderLensApp.hpp
 * @brief Command-line application: loads tender directories and runs the pipeline.
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AIFragmentExtractor.hpp"
#include "application/TenderIngestionService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConversionPool.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/ResultWriter.hpp"
#include "infrastructure/TenderDirectoryScanner.hpp"

namespace tenderlens::domain {
class AIService;
}

namespace tenderlens::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string tendersRoot;
    std::string configPath;
    std::optional<std::string> outputDir;  ///< Overrides settings.output_dir.
    std::vector<std::string> only;         ///< Restrict to these tender directory names.
    bool deep = false;                     ///< Also run the assemble-everything pass.
    bool noAi = false;
    bool help = false;
};

/**
 * @struct TenderOutcome
 * @brief What happened to one tender, for the final summary.
 */
struct TenderOutcome {
    std::string id;
    bool loaded = false;
    application::Phase1Source phase1 = application::Phase1Source::None;
    int extractions = 0;
    std::size_t failures = 0;
    bool cancelled = false;
};

/**
 * @class TenderLensApp
 * @brief Composition root and lifecycle of the CLI.
 */
class TenderLensApp {
public:
    TenderLensApp();
    ~TenderLensApp();

    /**
     * @brief Parses arguments, processes every tender and prints a summary.
     * @return 0 on success, 1 on usage or setup errors, 2 when some result could not be written.
     */
    int Run(int argc, char** argv);

    /** @brief Parses @p args (argv without the program name). nullopt with @p error set on misuse. */
    static std::optional<CliOptions> ParseArgs(const std::vector<std::string>& args, std::string& error);

    static std::string Usage();

    /** @brief Asks running tenders to stop after their current file. */
    void requestCancel() { m_cancel = true; }

private:
    bool Init(const CliOptions& options);
    void Shutdown();

    TenderOutcome processTender(const std::string& tenderPath) const;

    /** Fragment from the consultation page text, merged over the page's structured metadata. */
    domain::MetadataRecord websiteMetadata(const infrastructure::TenderSource& source,
                                           domain::FragmentExtractionService* fragments) const;

    void runDeepAnalysis(const infrastructure::TenderSource& source,
                         const application::TenderIngestionService& ingestion,
                         application::AIFragmentExtractor* fragments,
                         const std::string& outputBase) const;

    CliOptions m_options;
    infrastructure::PipelineSettings m_settings;

    std::shared_ptr<infrastructure::ConversionPool> m_conversionPool;
    std::unique_ptr<infrastructure::ConversionPool> m_tenderPool;
    std::unique_ptr<infrastructure::ResultWriter> m_writer;
    std::shared_ptr<const infrastructure::ContentExtractor> m_extractor;
    std::shared_ptr<const infrastructure::PromptCatalog> m_prompts;
    std::shared_ptr<domain::AIService> m_ai;
    std::shared_ptr<const application::DocumentClassifier> m_classifier;

    std::atomic<bool> m_cancel{false};
};

} // namespace tenderlens::app
