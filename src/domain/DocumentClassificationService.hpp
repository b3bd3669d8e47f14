/**
 * @file DocumentClassificationService.hpp
 * @brief Port for the last-resort external classifier.
 */

#pragma once
#include <string>
#include "domain/DocumentCategory.hpp"

namespace tenderlens::domain {

class DocumentClassificationService {
public:
    virtual ~DocumentClassificationService() = default;

    /** @return The category for the sample. Unknown on failure, Other for unrecognised answers. */
    virtual DocumentCategory classify(const std::string& sampleText, const std::string& filename, bool isScanned) = 0;
};

} // namespace tenderlens::domain
