/**
 * @file CompletenessOracle.hpp
 * @brief Decides whether a metadata record still needs documents.
 */

#pragma once
#include <string>
#include <vector>

#include "domain/TenderMetadata.hpp"

namespace tenderlens::application {

/**
 * @class CompletenessOracle
 * @brief Pure check of a record against the required field set.
 */
class CompletenessOracle {
public:
    /** @brief Required fields in reporting order. */
    static const std::vector<std::string>& RequiredFields();

    /** @brief Required fields that are absent or hold no usable value. An empty record misses all. */
    static std::vector<std::string> MissingFields(const domain::MetadataRecord& record);

    static bool IsComplete(const domain::MetadataRecord& record) { return MissingFields(record).empty(); }

    /** @brief Missing-ness of a single stored field value. */
    static bool IsMissing(const domain::FieldValue& value);
};

} // namespace tenderlens::application
