#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "app/TenderLensApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/TenderDirectoryScanner.hpp"

namespace fs = std::filesystem;
using namespace tenderlens;
using infrastructure::ConfigLoader;
using infrastructure::PathUtils;
using infrastructure::TenderDirectoryScanner;

static void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestConfigLoader() {
    std::cout << "[Test] Settings loading..." << std::endl;
    const auto defaults = ConfigLoader::FromJson(nlohmann::json::object());
    assert(defaults.ocr.language == "fra+ara+eng");
    assert(defaults.ocr.dpi == 200);
    assert(!defaults.ai.enabled);
    assert(defaults.workers.tenders == 2);

    const auto settings = ConfigLoader::FromJson(nlohmann::json::parse(R"({
        "ocr": {"language": "fra", "dpi": 300},
        "legacy_doc": {"full_timeout_seconds": -5},
        "workers": {"conversion": 4, "tenders": 0},
        "ai": {"enabled": true, "port": "not a number", "model": "qwen2.5:7b", "prompts_dir": "/etc/prompts"},
        "output_dir": "out"
    })"));
    assert(settings.ocr.language == "fra");
    assert(settings.ocr.dpi == 300);
    assert(settings.legacyDoc.fullTimeoutSeconds == 60 && "Non-positive timeouts fall back");
    assert(settings.workers.conversion == 4);
    assert(settings.workers.tenders == 1);
    assert(settings.ai.enabled);
    assert(settings.ai.port == 11434 && "Wrongly typed keys keep their default");
    assert(settings.ai.model == "qwen2.5:7b");
    assert(settings.ai.promptsDir == "/etc/prompts");
    assert(settings.outputDir == "out");

    const fs::path root = fs::temp_directory_path() / "tenderlens_config_test";
    fs::remove_all(root);
    WriteFile(root / "broken.json", "{ not json");
    assert(ConfigLoader::Load((root / "broken.json").string()).outputDir == "tenderlens_results");
    assert(ConfigLoader::Load((root / "missing.json").string()).ocr.dpi == 200);
    fs::remove_all(root);
    std::cout << "[PASS] Settings loading." << std::endl;
}

void TestPathUtils() {
    std::cout << "[Test] Path utilities..." << std::endl;
    setenv("XDG_CONFIG_HOME", "/tmp/tenderlens_xdg", 1);
    assert(PathUtils::GetDefaultSettingsPath() == fs::path("/tmp/tenderlens_xdg/tenderlens/settings.json"));
    assert(PathUtils::ResolveSettingsPath("custom.json") == fs::path("custom.json"));

    assert(PathUtils::SanitizeFileComponent("AO 12/2024") == "AO_12_2024");
    assert(PathUtils::SanitizeFileComponent("..") == "_");
    assert(PathUtils::SanitizeFileComponent("") == "_");
    assert(PathUtils::SanitizeFileComponent("tender-01.v2") == "tender-01.v2");
    std::cout << "[PASS] Path utilities." << std::endl;
}

void TestPromptOverrides() {
    std::cout << "[Test] Prompt overrides..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "tenderlens_prompts_test";
    fs::remove_all(root);
    WriteFile(root / infrastructure::PromptCatalog::kClassificationFile, "Answer with one label.");

    const auto defaults = infrastructure::PromptCatalog::Defaults();
    const auto catalog = infrastructure::PromptCatalog::LoadFromDirectory(root.string());
    assert(catalog.classificationPrompt() == "Answer with one label.");
    assert(catalog.primaryMetadataPrompt() == defaults.primaryMetadataPrompt());
    assert(!defaults.deepAnalysisPrompt().empty());
    fs::remove_all(root);
    std::cout << "[PASS] Prompt overrides." << std::endl;
}

void TestScanner() {
    std::cout << "[Test] Tender directory scanning..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "tenderlens_scanner_test";
    fs::remove_all(root);

    WriteFile(root / "b_tender" / "rc.txt", "Reglement");
    WriteFile(root / "b_tender" / "pieces" / "cps.txt", "Cahier");
    WriteFile(root / "b_tender" / "avis.txt", "Avis");
    WriteFile(root / "b_tender" / TenderDirectoryScanner::kManifestName, R"({
        "reference": "12/2024",
        "source_date": "2024-05-02",
        "website_contact": "Tel: 0528",
        "website_metadata": {"subject": "Voirie", "issuing_institution": {"value": "Commune", "source_document": "WEBSITE"}}
    })");
    WriteFile(root / "a_tender" / "avis.txt", "Avis");
    WriteFile(root / ".cache" / "x.txt", "hidden");
    WriteFile(root / "loose_file.txt", "not a tender");

    TenderDirectoryScanner scanner(root.string());
    const auto tenders = scanner.listTenders();
    assert(tenders.size() == 2);
    assert(fs::path(tenders[0]).filename() == "a_tender");
    assert(fs::path(tenders[1]).filename() == "b_tender");

    auto plain = TenderDirectoryScanner::Load(tenders[0]);
    assert(plain && plain->reference && *plain->reference == "a_tender" && "Reference defaults to the directory name");
    assert(!plain->websiteMetadata);

    auto source = TenderDirectoryScanner::Load(tenders[1]);
    assert(source);
    assert(source->id == "b_tender");
    assert(*source->reference == "12/2024");
    assert(source->bundle.size() == 3 && "The manifest is not a bundle file");
    assert(source->bundle.files()[0].filename == "avis.txt");
    assert(source->bundle.files()[1].filename == "pieces/cps.txt");
    assert(source->bundle.files()[2].filename == "rc.txt");
    assert(source->websiteContact && *source->websiteContact == "Tel: 0528");

    assert(source->websiteMetadata);
    const auto* subject = source->websiteMetadata->get<domain::TrackedValue>(domain::fields::kSubject);
    assert(subject && domain::SourceDocumentToLabel(subject->sourceDocument) == "WEBSITE");
    assert(subject->sourceDate && *subject->sourceDate == "2024-05-02");

    assert(!TenderDirectoryScanner::Load((root / "nope").string()));
    assert(TenderDirectoryScanner("/definitely/not/here").listTenders().empty());
    fs::remove_all(root);
    std::cout << "[PASS] Scanning." << std::endl;
}

void TestParseArgs() {
    std::cout << "[Test] Command line parsing..." << std::endl;
    std::string error;
    auto options = app::TenderLensApp::ParseArgs(
        {"--config", "s.json", "--only", "a", "--deep", "tenders", "--only", "b", "--no-ai", "--output", "out"}, error);
    assert(options);
    assert(options->tendersRoot == "tenders");
    assert(options->configPath == "s.json");
    assert(options->only == (std::vector<std::string>{"a", "b"}));
    assert(options->deep && options->noAi);
    assert(options->outputDir && *options->outputDir == "out");

    assert(!app::TenderLensApp::ParseArgs({}, error));
    assert(error == "Missing <tenders-root>");
    assert(!app::TenderLensApp::ParseArgs({"root", "--bogus"}, error));
    assert(error == "Unknown option: --bogus");
    assert(!app::TenderLensApp::ParseArgs({"root", "--config"}, error));
    assert(error == "--config needs a value");
    assert(!app::TenderLensApp::ParseArgs({"root", "other"}, error));

    auto help = app::TenderLensApp::ParseArgs({"--help"}, error);
    assert(help && help->help);
    assert(app::TenderLensApp::Usage().find("--deep") != std::string::npos);
    std::cout << "[PASS] Command line parsing." << std::endl;
}

void TestEndToEndWithoutAI() {
    std::cout << "[Test] End-to-end run without the language model..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "tenderlens_e2e_test";
    fs::remove_all(root);
    const fs::path tenders = root / "tenders";
    const fs::path output = root / "results";

    WriteFile(tenders / "ao_12" / "avis_fr.txt", "Avis d'appel d'offres ouvert n° 12/2024 pour des travaux de voirie.");
    WriteFile(tenders / "ao_12" / "rc.txt", "Reglement de consultation relatif aux travaux de voirie.");
    WriteFile(tenders / "ao_12" / TenderDirectoryScanner::kManifestName, R"({
        "website_metadata": {"reference_tender": "12/2024", "subject": "Voirie",
                             "issuing_institution": "Commune", "submission_deadline": "2024-06-01"}
    })");
    WriteFile(tenders / "ao_13" / "rc.txt", "Reglement de consultation, lot unique.");
    WriteFile(tenders / "ao_14" / "rc.txt", "Skipped by --only.");

    const std::vector<std::string> args = {
        "tenderlens", "--no-ai", "--config", (root / "none.json").string(), "--output", output.string(),
        "--only", "ao_12", "--only", "ao_13", "--deep", tenders.string(),
    };
    std::vector<char*> argv;
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));

    int code = 0;
    {
        app::TenderLensApp app;
        code = app.Run(static_cast<int>(argv.size()), argv.data());
    }
    assert(code == 0);
    assert(!fs::exists(output / "ao_14.json"));

    auto complete = nlohmann::json::parse(ReadFile(output / "ao_12.json"));
    assert(complete["phase1_source"] == "existing");
    assert(complete["extractions_performed"] == 0);
    assert(complete["missing_fields"].empty());
    assert(complete["metadata"]["subject"]["value"] == "Voirie");
    for (const auto& record : complete["classifications"]) {
        assert(!record.contains("sample_text"));
    }

    auto incomplete = nlohmann::json::parse(ReadFile(output / "ao_13.json"));
    assert(incomplete["phase1_source"] == "none");
    assert(incomplete["extractions_performed"] == 1);
    assert(incomplete["missing_fields"].size() == 4);
    assert(incomplete["extractions"]["RC"]["full_text"] == "Reglement de consultation, lot unique.");

    auto deep = nlohmann::json::parse(ReadFile(output / "ao_12.deep.json"));
    assert(deep["documents"].size() == 2);
    assert(deep["universal_metadata"].is_null());

    assert(app::TenderLensApp().Run(2, argv.data()) == 1 && "--no-ai alone has no tenders root");
    fs::remove_all(root);
    std::cout << "[PASS] End-to-end." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Config And Scanner Test..." << std::endl;
    TestConfigLoader();
    TestPathUtils();
    TestPromptOverrides();
    TestScanner();
    TestParseArgs();
    TestEndToEndWithoutAI();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
