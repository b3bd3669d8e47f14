/**
 * @file RawFile.hpp
 * @brief Immutable file entry of a tender bundle, and the bundle itself.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace tenderlens::domain {

/**
 * @class RawFile
 * @brief One file of a tender bundle as handed over by the download layer.
 */
class RawFile {
public:
    std::string filename;  ///< Name inside the bundle (may contain '/' for nested archives).
    std::string bytes;     ///< Raw content, binary safe.
    std::size_t size = 0;  ///< Byte count of @ref bytes.
    std::string mime;      ///< Derived from the extension.

    RawFile() = default;
    RawFile(std::string name, std::string content)
        : filename(std::move(name)), bytes(std::move(content)) {
        size = bytes.size();
        mime = MimeForExtension(extension());
    }

    /** @brief Lower-case extension without the dot, empty when the name has none. */
    std::string extension() const {
        const auto dot = filename.find_last_of('.');
        if (dot == std::string::npos) return {};
        std::string ext = filename.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
        return ext;
    }

    /** @brief Name without any leading directory components. */
    std::string basename() const {
        const auto slash = filename.find_last_of("/\\");
        return slash == std::string::npos ? filename : filename.substr(slash + 1);
    }

    static std::string MimeForExtension(const std::string& ext) {
        if (ext == "pdf") return "application/pdf";
        if (ext == "docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
        if (ext == "doc") return "application/msword";
        if (ext == "xlsx") return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
        if (ext == "xls") return "application/vnd.ms-excel";
        if (ext == "txt") return "text/plain";
        return "application/octet-stream";
    }
};

/**
 * @class TenderBundle
 * @brief Flat filename -> bytes mapping for one tender, in caller order.
 *
 * Iteration order is insertion order; candidate selection relies on it being stable.
 */
class TenderBundle {
public:
    /** @brief Adds a file. A second entry with the same name replaces the first in place. */
    void add(const std::string& filename, std::string bytes) {
        for (auto& file : m_files) {
            if (file.filename == filename) {
                file = RawFile(filename, std::move(bytes));
                return;
            }
        }
        m_files.emplace_back(filename, std::move(bytes));
    }

    const RawFile* find(const std::string& filename) const {
        for (const auto& file : m_files) {
            if (file.filename == filename) return &file;
        }
        return nullptr;
    }

    const std::vector<RawFile>& files() const { return m_files; }
    bool empty() const { return m_files.empty(); }
    std::size_t size() const { return m_files.size(); }

private:
    std::vector<RawFile> m_files;
};

} // namespace tenderlens::domain
