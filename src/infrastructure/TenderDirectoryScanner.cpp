/**
 * @file TenderDirectoryScanner.cpp
 * @brief Implementation of the TenderDirectoryScanner.
 */

#include "infrastructure/TenderDirectoryScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "infrastructure/MetadataCodec.hpp"

namespace fs = std::filesystem;

namespace tenderlens::infrastructure {

namespace {

std::optional<std::string> ReadBinary(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) return j.at(key).get<std::string>();
    return std::nullopt;
}

void ReadManifest(const fs::path& manifestPath, TenderSource& source) {
    auto raw = ReadBinary(manifestPath);
    if (!raw) {
        std::cerr << "[TenderDirectoryScanner] Cannot read " << manifestPath << std::endl;
        return;
    }

    try {
        auto j = nlohmann::json::parse(*raw);
        source.reference = OptionalString(j, "reference");
        source.sourceDate = OptionalString(j, "source_date");
        source.websiteText = OptionalString(j, "website_text");
        source.websiteContact = OptionalString(j, "website_contact");

        if (j.contains("website_metadata") && j.at("website_metadata").is_object()) {
            std::vector<std::string> issues;
            auto record = MetadataCodec::FromJson(j.at("website_metadata"), domain::WebsiteSource{}, issues);
            for (const auto& issue : issues) {
                std::cerr << "[TenderDirectoryScanner] " << source.id << " website_metadata: " << issue << std::endl;
            }
            if (source.sourceDate) record.stampSourceDate(*source.sourceDate);
            if (!record.empty()) source.websiteMetadata = std::move(record);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[TenderDirectoryScanner] Invalid manifest " << manifestPath << ": " << e.what() << std::endl;
    }
}

} // namespace

TenderDirectoryScanner::TenderDirectoryScanner(const std::string& rootPath)
    : m_rootPath(rootPath) {}

std::vector<std::string> TenderDirectoryScanner::listTenders() const {
    std::vector<std::string> tenders;
    std::error_code ec;
    if (!fs::is_directory(m_rootPath, ec)) {
        return tenders;
    }

    for (const auto& entry : fs::directory_iterator(m_rootPath, ec)) {
        if (entry.is_directory() && entry.path().filename().string().rfind('.', 0) != 0) {
            tenders.push_back(entry.path().string());
        }
    }
    std::sort(tenders.begin(), tenders.end());
    return tenders;
}

std::optional<TenderSource> TenderDirectoryScanner::Load(const std::string& tenderPath) {
    std::error_code ec;
    const fs::path root(tenderPath);
    if (!fs::is_directory(root, ec)) {
        std::cerr << "[TenderDirectoryScanner] Not a directory: " << tenderPath << std::endl;
        return std::nullopt;
    }

    TenderSource source;
    source.id = root.filename().string();
    source.path = tenderPath;

    // Sorted so that bundle order (and therefore candidate tie-breaking) is reproducible.
    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file()) files.push_back(it->path());
    }
    if (ec) {
        std::cerr << "[TenderDirectoryScanner] Error walking " << tenderPath << ": " << ec.message() << std::endl;
        return std::nullopt;
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        const std::string relative = fs::relative(file, root).generic_string();
        if (relative == kManifestName) {
            ReadManifest(file, source);
            continue;
        }
        auto bytes = ReadBinary(file);
        if (!bytes) {
            std::cerr << "[TenderDirectoryScanner] Cannot read " << file << std::endl;
            continue;
        }
        source.bundle.add(relative, std::move(*bytes));
    }

    if (!source.reference) source.reference = source.id;
    return source;
}

} // namespace tenderlens::infrastructure
