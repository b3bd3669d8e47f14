/**
 * @file TenderDirectoryScanner.hpp
 * @brief Loads tender bundles from a directory tree.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "domain/RawFile.hpp"
#include "domain/TenderMetadata.hpp"

namespace tenderlens::infrastructure {

/**
 * @struct TenderSource
 * @brief Everything the pipeline needs for one tender.
 */
struct TenderSource {
    std::string id;    ///< Directory name.
    std::string path;
    domain::TenderBundle bundle;
    std::optional<std::string> reference;
    std::optional<domain::MetadataRecord> websiteMetadata;  ///< Already-structured page data.
    std::optional<std::string> websiteText;                 ///< Raw page text, to be structured.
    std::optional<std::string> websiteContact;              ///< Raw contact block for deep context.
    std::optional<std::string> sourceDate;
};

/**
 * @class TenderDirectoryScanner
 * @brief One sub-directory of the root per tender.
 *
 * Every regular file below the tender directory becomes a bundle entry named
 * by its path relative to that directory. An optional @c tender.json manifest
 * supplies what the download layer knew about the tender:
 * @code
 * { "reference": "12/2024", "source_date": "2024-05-02",
 *   "website_metadata": { ...fragment JSON... },
 *   "website_text": "...", "website_contact": "..." }
 * @endcode
 */
class TenderDirectoryScanner {
public:
    static constexpr const char* kManifestName = "tender.json";

    explicit TenderDirectoryScanner(const std::string& rootPath);

    /** @brief Tender directories under the root, sorted by name. */
    std::vector<std::string> listTenders() const;

    /** @brief Loads one tender directory; nullopt when it cannot be read. */
    static std::optional<TenderSource> Load(const std::string& tenderPath);

private:
    std::string m_rootPath;
};

} // namespace tenderlens::infrastructure
