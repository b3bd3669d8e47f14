/**
 * @file OfficeReaders.hpp
 * @brief In-memory readers for Word and Excel documents.
 *
 * OOXML (.docx/.xlsx) is unzipped with miniz and walked with tinyxml2.
 * Legacy BIFF workbooks (.xls) go through libxls.
 * All readers throw ExtractionError(ParseFailure) on malformed input.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tenderlens::infrastructure {

/** @brief One worksheet as a grid of display strings. */
struct SheetTable {
    std::string name;
    std::vector<std::vector<std::string>> rows;
};

class DocxReader {
public:
    /** @brief Body paragraphs in order, appended until the running length exceeds @p charBudget. */
    static std::string ReadSample(const std::string& bytes, std::size_t charBudget = 1000);

    /** @brief Body paragraphs joined by newlines, followed by one " | " line per table row. */
    static std::string ReadFull(const std::string& bytes);
};

class XlsxReader {
public:
    /**
     * @brief Reads sheets in workbook order.
     * @param maxSheets Stop after this many sheets (nullopt = all).
     * @param maxRows Per sheet, stop after this many non-empty rows (nullopt = all).
     *
     * Empty rows are skipped; missing cells inside a row are padded so that
     * columns stay aligned.
     */
    static std::vector<SheetTable> ReadSheets(const std::string& bytes,
                                              std::optional<std::size_t> maxSheets = std::nullopt,
                                              std::optional<std::size_t> maxRows = std::nullopt);
};

class XlsReader {
public:
    static std::vector<SheetTable> ReadSheets(const std::string& bytes,
                                              std::optional<std::size_t> maxSheets = std::nullopt,
                                              std::optional<std::size_t> maxRows = std::nullopt);

    /** @brief Renders a sheet as a fixed-width text table, columns padded to their widest cell. */
    static std::string RenderAligned(const SheetTable& sheet);
};

} // namespace tenderlens::infrastructure
