/**
 * @file MetadataMerger.hpp
 * @brief Field-level fusion of two metadata records.
 */

#pragma once
#include "domain/TenderMetadata.hpp"

namespace tenderlens::application {

/**
 * @class MetadataMerger
 * @brief Fills the gaps of a base record from a fallback record.
 *
 * A value already present in the base is never replaced. Each field shape
 * has its own rule; values taken from the fallback keep the fallback's
 * provenance. Applying the same fallback twice changes nothing.
 */
class MetadataMerger {
public:
    /** @brief Merged record. An empty base yields @p fallback, an empty fallback yields @p base. */
    static domain::MetadataRecord Merge(const domain::MetadataRecord& base, const domain::MetadataRecord& fallback);

    static domain::SubmissionDeadline MergeDeadline(const domain::SubmissionDeadline& base,
                                                    const domain::SubmissionDeadline& fallback);
    static domain::KeywordBuckets MergeKeywords(const domain::KeywordBuckets& base,
                                                const domain::KeywordBuckets& fallback);

    /** @brief Never invents lots: a non-empty base keeps its length. */
    static domain::LotList MergeLots(const domain::LotList& base, const domain::LotList& fallback);
};

} // namespace tenderlens::application
