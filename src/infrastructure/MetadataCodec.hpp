/**
 * @file MetadataCodec.hpp
 * @brief JSON <-> typed record conversion at the AI and persistence boundaries.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/DocumentRecords.hpp"
#include "domain/TenderMetadata.hpp"

namespace tenderlens::infrastructure {

/**
 * @class MetadataCodec
 * @brief Validates untrusted JSON into MetadataRecord shapes.
 *
 * Tracked values on the wire look like
 * {"value": ..., "source_document": "AVIS", "source_date": "..."}.
 * Bare scalars are accepted and attributed to the fragment's source.
 */
class MetadataCodec {
public:
    /**
     * @param defaultSource Provenance for values that do not name one (or name an unknown one).
     * @param issues Receives one line per dropped or coerced key.
     */
    static domain::MetadataRecord FromJson(const nlohmann::json& j,
                                           const domain::SourceDocument& defaultSource,
                                           std::vector<std::string>& issues);

    static nlohmann::json ToJson(const domain::MetadataRecord& record);
    static nlohmann::json ToJson(const domain::TrackedValue& value);
    static nlohmann::json ToJson(const domain::ClassificationRecord& record);
    static nlohmann::json ToJson(const domain::ExtractionRecord& record, bool includeText = true);

    /** @brief Strips a Markdown code fence (```json ... ``` or ``` ... ```) if present. */
    static std::string StripCodeFence(const std::string& response);
};

} // namespace tenderlens::infrastructure
