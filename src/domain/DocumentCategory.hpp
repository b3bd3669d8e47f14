/**
 * @file DocumentCategory.hpp
 * @brief Closed set of roles a file can play inside a tender bundle.
 */

#pragma once
#include <array>
#include <optional>
#include <string>

namespace tenderlens::domain {

/**
 * @enum DocumentCategory
 * @brief Role of a document in a tender dossier.
 *
 * Wire labels (used in JSON, prompts and logs) follow the French acronyms
 * printed on the documents themselves.
 */
enum class DocumentCategory {
    PrimaryNotice,       ///< AVIS: avis de consultation / d'appel d'offres.
    Rules,               ///< RC: règlement de consultation.
    Specification,       ///< CPS: cahier des prescriptions spéciales.
    Addendum,            ///< ANNEXE: annexe, additif, avenant.
    PriceSchedule,       ///< BPDE: bordereau des prix - détail estimatif.
    CommitmentForm,      ///< AE: acte d'engagement.
    CostBreakdown,       ///< DSH: décomposition / sous-détail des prix.
    GeneralAdminClauses, ///< CCAG.
    TechnicalClauses,    ///< CCTP.
    QuantitySchedule,    ///< BQ: bordereau des quantités.
    EstimatedQuantities, ///< DQE: devis quantitatif estimatif.
    Other,
    Unknown
};

inline constexpr std::array<DocumentCategory, 13> kAllCategories = {
    DocumentCategory::PrimaryNotice,   DocumentCategory::Rules,
    DocumentCategory::Specification,   DocumentCategory::Addendum,
    DocumentCategory::PriceSchedule,   DocumentCategory::CommitmentForm,
    DocumentCategory::CostBreakdown,   DocumentCategory::GeneralAdminClauses,
    DocumentCategory::TechnicalClauses, DocumentCategory::QuantitySchedule,
    DocumentCategory::EstimatedQuantities, DocumentCategory::Other,
    DocumentCategory::Unknown
};

inline std::string CategoryToLabel(DocumentCategory category) {
    switch (category) {
        case DocumentCategory::PrimaryNotice: return "AVIS";
        case DocumentCategory::Rules: return "RC";
        case DocumentCategory::Specification: return "CPS";
        case DocumentCategory::Addendum: return "ANNEXE";
        case DocumentCategory::PriceSchedule: return "BPDE";
        case DocumentCategory::CommitmentForm: return "AE";
        case DocumentCategory::CostBreakdown: return "DSH";
        case DocumentCategory::GeneralAdminClauses: return "CCAG";
        case DocumentCategory::TechnicalClauses: return "CCTP";
        case DocumentCategory::QuantitySchedule: return "BQ";
        case DocumentCategory::EstimatedQuantities: return "DQE";
        case DocumentCategory::Other: return "OTHER";
        case DocumentCategory::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

/** @brief Parses an upper-case wire label. Returns nullopt for anything not in the table. */
inline std::optional<DocumentCategory> ParseCategoryLabel(const std::string& label) {
    for (DocumentCategory category : kAllCategories) {
        if (CategoryToLabel(category) == label) return category;
    }
    return std::nullopt;
}

} // namespace tenderlens::domain
