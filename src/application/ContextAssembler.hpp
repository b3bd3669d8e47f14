/**
 * @file ContextAssembler.hpp
 * @brief Builds the multi-document context used for deep analysis.
 */

#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/DocumentRecords.hpp"

namespace tenderlens::application {

/**
 * @struct ContextBundle
 * @brief Labeled document excerpts, in deep-analysis order.
 */
struct ContextBundle {
    struct Section {
        domain::DocumentCategory category;
        std::string filename;
        std::string text;  ///< Already capped.
    };

    std::vector<Section> sections;
    std::optional<std::string> websiteContact;

    /** @brief Renders every section, then the contact block, capped at the total limit. */
    std::string render() const;

    bool isEmpty() const { return sections.empty(); }
};

/**
 * @class ContextAssembler
 * @brief Orders extracted documents annex first, notice last.
 */
class ContextAssembler {
public:
    static constexpr std::size_t kSectionChars = 8000;
    static constexpr std::size_t kContextChars = 30000;

    static const std::array<domain::DocumentCategory, 4>& DeepOrder();

    /**
     * @brief Collects the documents that have text.
     * @return nullopt when none of the extractions carries any text.
     */
    static std::optional<ContextBundle> Assemble(
        const std::map<domain::DocumentCategory, domain::ExtractionRecord>& extractions,
        const std::optional<std::string>& websiteContact = std::nullopt);
};

} // namespace tenderlens::application
