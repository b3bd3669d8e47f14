/**
 * @file CandidateSelector.hpp
 * @brief Picks the one file to extract for a category.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "domain/DocumentRecords.hpp"

namespace tenderlens::application {

/**
 * @class CandidateSelector
 * @brief Language-aware choice among files of one category.
 *
 * French versions beat neutral ones, which beat Arabic-only ones; ties go
 * to the earliest file in bundle order.
 */
class CandidateSelector {
public:
    /** A notice citing more distinct references than this lists several tenders. */
    static constexpr std::size_t kMaxNoticeReferences = 3;

    static bool IsFrench(const std::string& filename, const std::string& sampleText);
    static bool IsArabic(const std::string& filename, const std::string& sampleText);

    /** @brief First candidate of the best language tier; nullopt for an empty list. */
    static std::optional<domain::ClassificationRecord> SelectBest(
        const std::vector<domain::ClassificationRecord>& candidates);

    /**
     * @brief True when the notice sample reads like a compilation of several tenders.
     * @param tenderReference Only used in the log line.
     */
    static bool IsMultiTenderNotice(const std::string& sampleText,
                                    const std::optional<std::string>& tenderReference = std::nullopt);

    /** @brief Distinct reference-number-shaped substrings in @p text. */
    static std::size_t CountDistinctReferences(const std::string& text);
};

} // namespace tenderlens::application
