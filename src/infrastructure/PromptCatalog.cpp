#include "infrastructure/PromptCatalog.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace tenderlens::infrastructure {

namespace {

const char* kPrimaryMetadataPrompt =
    "Tu es un analyste des marchés publics marocains. Tu extrais les métadonnées principales "
    "d'un appel d'offres à partir d'UN SEUL document source.\n\n"
    "La première ligne du message indique SOURCE_LABEL (WEBSITE, AVIS, RC ou CPS). "
    "Chaque champ que tu remplis doit porter \"source_document\" égal à ce SOURCE_LABEL.\n\n"
    "RÈGLES:\n"
    "1. N'invente rien. Si une information n'est pas écrite dans le texte, mets \"value\": null.\n"
    "2. Recopie les références, montants et dates tels qu'ils apparaissent.\n"
    "3. Réponds UNIQUEMENT avec un objet JSON, sans texte autour.\n\n"
    "FORMAT:\n"
    "{\n"
    "  \"reference_tender\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"tender_type\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"issuing_institution\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"execution_location\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"folder_opening_location\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"subject\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"total_estimated_value\": {\"value\": ..., \"source_document\": \"...\", \"source_date\": null},\n"
    "  \"submission_deadline\": {\n"
    "    \"date\": {\"value\": \"JJ/MM/AAAA\", \"source_document\": \"...\", \"source_date\": null},\n"
    "    \"time\": {\"value\": \"HH:MM\", \"source_document\": \"...\", \"source_date\": null}\n"
    "  },\n"
    "  \"lots\": [{\"lot_number\": ..., \"lot_subject\": ..., \"lot_estimated_value\": ..., \"caution_provisoire\": ...}],\n"
    "  \"keywords\": {\"keywords_fr\": [], \"keywords_eng\": [], \"keywords_ar\": []}\n"
    "}";

const char* kClassificationPrompt =
    "Tu classes des documents de marchés publics marocains à partir de leur première page.\n"
    "Catégories possibles:\n"
    "AVIS - avis d'appel d'offres / avis de consultation\n"
    "RC - règlement de consultation\n"
    "CPS - cahier des prescriptions spéciales\n"
    "ANNEXE - annexe, additif, avenant\n"
    "BPDE - bordereau des prix et détail estimatif\n"
    "AE - acte d'engagement\n"
    "DSH - décomposition ou sous-détail des prix\n"
    "CCAG - cahier des clauses administratives générales\n"
    "CCTP - cahier des clauses techniques particulières\n"
    "BQ - bordereau des quantités\n"
    "DQE - devis quantitatif estimatif\n"
    "OTHER - autre document\n\n"
    "Réponds avec UN SEUL mot: le code de la catégorie.";

const char* kDeepAnalysisPrompt =
    "Tu es un analyste des marchés publics marocains. On te fournit plusieurs documents d'un "
    "même dossier d'appel d'offres (annexes, CPS, RC, avis), éventuellement suivis d'un bloc "
    "de contact administratif brut issu du site web.\n\n"
    "Extrais les métadonnées universelles du dossier: conditions de qualification, pièces "
    "exigées, critères d'évaluation, garanties, délais d'exécution, contact administratif "
    "structuré. Quand deux documents se contredisent, privilégie l'ordre annexe, CPS, RC, avis "
    "et signale la contradiction.\n\n"
    "Réponds UNIQUEMENT avec un objet JSON.";

void OverrideFromFile(const std::filesystem::path& path, std::string& target) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[PromptCatalog] Cannot open " << path << ", keeping built-in prompt" << std::endl;
        return;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (buffer.str().empty()) {
        std::cerr << "[PromptCatalog] " << path << " is empty, keeping built-in prompt" << std::endl;
        return;
    }
    target = buffer.str();
    std::cout << "[PromptCatalog] Loaded " << path.filename() << std::endl;
}

} // namespace

PromptCatalog PromptCatalog::Defaults() {
    PromptCatalog catalog;
    catalog.m_primaryMetadata = kPrimaryMetadataPrompt;
    catalog.m_classification = kClassificationPrompt;
    catalog.m_deepAnalysis = kDeepAnalysisPrompt;
    return catalog;
}

PromptCatalog PromptCatalog::LoadFromDirectory(const std::string& directory) {
    PromptCatalog catalog = Defaults();
    if (directory.empty()) return catalog;

    const std::filesystem::path dir(directory);
    OverrideFromFile(dir / kPrimaryMetadataFile, catalog.m_primaryMetadata);
    OverrideFromFile(dir / kClassificationFile, catalog.m_classification);
    OverrideFromFile(dir / kDeepAnalysisFile, catalog.m_deepAnalysis);
    return catalog;
}

} // namespace tenderlens::infrastructure
