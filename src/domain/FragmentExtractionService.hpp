/**
 * @file FragmentExtractionService.hpp
 * @brief Port for turning one document's text into a partial metadata record.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/TenderMetadata.hpp"

namespace tenderlens::domain {

class FragmentExtractionService {
public:
    virtual ~FragmentExtractionService() = default;

    /**
     * @brief Extracts whatever fields @p text supports.
     * @param sourceLabel Provenance attached to every value in the fragment.
     * @return nullopt when the text is too thin or the collaborator failed.
     */
    virtual std::optional<MetadataRecord> extractFragment(const std::string& text,
                                                          const SourceDocument& sourceLabel) = 0;
};

} // namespace tenderlens::domain
