#include "infrastructure/OfficeReaders.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>

extern "C" {
#include <miniz.h>
}
#include <tinyxml2.h>
#include <xls.h>

#include "domain/ExtractionError.hpp"
#include "infrastructure/TextUtils.hpp"

namespace tenderlens::infrastructure {

using domain::ExtractionError;
using domain::ExtractionErrorKind;

namespace {

/**
 * Read-only zip view over a byte buffer. The buffer is copied so the
 * archive stays valid independently of the caller's string.
 */
class OoxmlArchive {
public:
    explicit OoxmlArchive(const std::string& bytes) : m_storage(bytes) {
        std::memset(&m_archive, 0, sizeof(m_archive));
        if (m_storage.empty() ||
            !mz_zip_reader_init_mem(&m_archive, m_storage.data(), m_storage.size(), 0)) {
            throw ExtractionError(ExtractionErrorKind::ParseFailure, "not a zip container");
        }
        m_open = true;
    }

    ~OoxmlArchive() {
        if (m_open) mz_zip_reader_end(&m_archive);
    }

    OoxmlArchive(const OoxmlArchive&) = delete;
    OoxmlArchive& operator=(const OoxmlArchive&) = delete;

    std::optional<std::string> entry(const std::string& name) const {
        const int index = mz_zip_reader_locate_file(&m_archive, name.c_str(), nullptr, 0);
        if (index < 0) return std::nullopt;
        size_t outSize = 0;
        void* ptr = mz_zip_reader_extract_to_heap(&m_archive, static_cast<mz_uint>(index), &outSize, 0);
        if (!ptr) return std::nullopt;
        std::string data(static_cast<const char*>(ptr), outSize);
        mz_free(ptr);
        return data;
    }

    std::vector<std::string> entriesWithPrefix(const std::string& prefix) const {
        std::vector<std::string> names;
        const mz_uint count = mz_zip_reader_get_num_files(&m_archive);
        for (mz_uint i = 0; i < count; ++i) {
            mz_zip_archive_file_stat stat;
            if (!mz_zip_reader_file_stat(&m_archive, i, &stat)) continue;
            std::string name = stat.m_filename;
            if (name.compare(0, prefix.size(), prefix) == 0) names.push_back(name);
        }
        return names;
    }

private:
    std::string m_storage;
    mutable mz_zip_archive m_archive;
    bool m_open = false;
};

void ParseXml(tinyxml2::XMLDocument& doc, const std::string& xml, const std::string& part) {
    if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "malformed XML in " + part);
    }
}

bool NameIs(const tinyxml2::XMLElement* element, const char* name) {
    return element && std::strcmp(element->Name(), name) == 0;
}

// ---------------------------------------------------------------- DOCX

void CollectRunText(const tinyxml2::XMLElement* node, std::string& out) {
    for (auto child = node->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (NameIs(child, "w:t")) {
            if (const char* text = child->GetText()) out += text;
        } else if (NameIs(child, "w:tab")) {
            out += '\t';
        } else if (NameIs(child, "w:br") || NameIs(child, "w:cr")) {
            out += '\n';
        } else if (NameIs(child, "w:p") || NameIs(child, "w:tbl")) {
            // Nested blocks (text boxes) belong to their own paragraph.
            continue;
        } else {
            CollectRunText(child, out);
        }
    }
}

std::string ParagraphText(const tinyxml2::XMLElement* paragraph) {
    std::string text;
    CollectRunText(paragraph, text);
    return text;
}

std::string CellText(const tinyxml2::XMLElement* cell) {
    std::vector<std::string> paragraphs;
    for (auto p = cell->FirstChildElement("w:p"); p; p = p->NextSiblingElement("w:p")) {
        paragraphs.push_back(ParagraphText(p));
    }
    return TextUtils::Join(paragraphs, "\n");
}

const tinyxml2::XMLElement* DocumentBody(tinyxml2::XMLDocument& doc, const OoxmlArchive& archive) {
    auto xml = archive.entry("word/document.xml");
    if (!xml) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "word/document.xml missing");
    }
    ParseXml(doc, *xml, "word/document.xml");
    const auto* root = doc.RootElement();
    const auto* body = root ? root->FirstChildElement("w:body") : nullptr;
    if (!body) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "document has no body");
    }
    return body;
}

// ---------------------------------------------------------------- XLSX

std::string InlineText(const tinyxml2::XMLElement* element) {
    std::string text;
    for (auto child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        if (NameIs(child, "t")) {
            if (const char* value = child->GetText()) text += value;
        } else if (!NameIs(child, "rPh")) {
            text += InlineText(child);
        }
    }
    return text;
}

std::vector<std::string> SharedStrings(const OoxmlArchive& archive) {
    std::vector<std::string> values;
    auto xml = archive.entry("xl/sharedStrings.xml");
    if (!xml) return values;
    tinyxml2::XMLDocument doc;
    ParseXml(doc, *xml, "xl/sharedStrings.xml");
    const auto* root = doc.RootElement();
    for (auto si = root ? root->FirstChildElement("si") : nullptr; si; si = si->NextSiblingElement("si")) {
        values.push_back(InlineText(si));
    }
    return values;
}

constexpr int kMaxColumnLetters = 3;
constexpr int kMaxColumns = 16384;  // "XFD"

/**
 * "AB12" -> 27 (0-based column index 27). Returns -1 when there is no reference.
 * @throws ExtractionError(ParseFailure) for columns beyond XFD.
 */
int ColumnIndex(const char* reference) {
    if (!reference) return -1;
    int column = 0;
    int letters = 0;
    for (const char* p = reference; *p && std::isalpha(static_cast<unsigned char>(*p)); ++p) {
        if (++letters > kMaxColumnLetters) {
            throw ExtractionError(ExtractionErrorKind::ParseFailure,
                                  std::string("cell reference out of range: ") + reference);
        }
        column = column * 26 + (std::toupper(static_cast<unsigned char>(*p)) - 'A' + 1);
    }
    if (column > kMaxColumns) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure,
                              std::string("cell reference out of range: ") + reference);
    }
    return letters ? column - 1 : -1;
}

std::string CellValue(const tinyxml2::XMLElement* cell, const std::vector<std::string>& shared) {
    const char* type = cell->Attribute("t");
    if (type && std::strcmp(type, "inlineStr") == 0) {
        const auto* is = cell->FirstChildElement("is");
        return is ? InlineText(is) : std::string();
    }
    const auto* v = cell->FirstChildElement("v");
    if (!v || !v->GetText()) return {};
    const std::string raw = v->GetText();
    if (type && std::strcmp(type, "s") == 0) {
        const int idx = v->IntText(-1);
        if (idx >= 0 && idx < static_cast<int>(shared.size())) return shared[idx];
        return raw;
    }
    if (type && std::strcmp(type, "b") == 0) {
        return raw == "1" ? "TRUE" : "FALSE";
    }
    return raw;
}

/** Sheet name -> part path, in workbook order, resolved through the workbook relationships. */
std::vector<std::pair<std::string, std::string>> SheetParts(const OoxmlArchive& archive) {
    std::vector<std::pair<std::string, std::string>> parts;

    auto workbookXml = archive.entry("xl/workbook.xml");
    auto relsXml = archive.entry("xl/_rels/workbook.xml.rels");
    if (workbookXml && relsXml) {
        std::map<std::string, std::string> targets;
        tinyxml2::XMLDocument rels;
        ParseXml(rels, *relsXml, "xl/_rels/workbook.xml.rels");
        const auto* relsRoot = rels.RootElement();
        for (auto rel = relsRoot ? relsRoot->FirstChildElement("Relationship") : nullptr; rel;
             rel = rel->NextSiblingElement("Relationship")) {
            const char* id = rel->Attribute("Id");
            const char* target = rel->Attribute("Target");
            if (!id || !target) continue;
            std::string path = target;
            if (!path.empty() && path[0] == '/') path = path.substr(1);
            else path = "xl/" + path;
            targets[id] = path;
        }

        tinyxml2::XMLDocument workbook;
        ParseXml(workbook, *workbookXml, "xl/workbook.xml");
        const auto* root = workbook.RootElement();
        const auto* sheets = root ? root->FirstChildElement("sheets") : nullptr;
        for (auto sheet = sheets ? sheets->FirstChildElement("sheet") : nullptr; sheet;
             sheet = sheet->NextSiblingElement("sheet")) {
            const char* name = sheet->Attribute("name");
            const char* rid = sheet->Attribute("r:id");
            if (!name || !rid) continue;
            auto it = targets.find(rid);
            if (it != targets.end()) parts.emplace_back(name, it->second);
        }
    }

    if (parts.empty()) {
        auto names = archive.entriesWithPrefix("xl/worksheets/sheet");
        std::sort(names.begin(), names.end());
        int index = 1;
        for (const auto& name : names) {
            parts.emplace_back("Sheet" + std::to_string(index++), name);
        }
    }
    return parts;
}

bool RowHasContent(const std::vector<std::string>& row) {
    return std::any_of(row.begin(), row.end(), [](const std::string& cell) { return !cell.empty(); });
}

void PadToWidestRow(SheetTable& sheet) {
    std::size_t width = 0;
    for (const auto& row : sheet.rows) width = std::max(width, row.size());
    for (auto& row : sheet.rows) row.resize(width);
}

// ---------------------------------------------------------------- XLS

struct XlsWorkbookCloser {
    void operator()(xls::xlsWorkBook* wb) const {
        if (wb) xls::xls_close_WB(wb);
    }
};

struct XlsWorksheetCloser {
    void operator()(xls::xlsWorkSheet* ws) const {
        if (ws) xls::xls_close_WS(ws);
    }
};

std::string XlsCellText(const xls::xlsCell* cell) {
    if (!cell || cell->isHidden) return {};
    if (cell->str) return std::string(cell->str);

    switch (cell->id) {
        case XLS_RECORD_BOOLERR:
            return cell->d != 0.0 ? "TRUE" : "FALSE";
        case XLS_RECORD_NUMBER:
        case XLS_RECORD_RK:
        case XLS_RECORD_FORMULA:
        case XLS_RECORD_FORMULA_ALT:
            if (std::isfinite(cell->d)) {
                std::ostringstream oss;
                oss << std::setprecision(15) << cell->d;
                return oss.str();
            }
            break;
        default:
            break;
    }
    return {};
}

} // namespace

std::string DocxReader::ReadSample(const std::string& bytes, std::size_t charBudget) {
    OoxmlArchive archive(bytes);
    tinyxml2::XMLDocument doc;
    const auto* body = DocumentBody(doc, archive);

    std::vector<std::string> parts;
    std::size_t count = 0;
    for (auto p = body->FirstChildElement("w:p"); p; p = p->NextSiblingElement("w:p")) {
        std::string text = ParagraphText(p);
        count += TextUtils::Utf8Length(text);
        parts.push_back(std::move(text));
        if (count > charBudget) break;
    }
    return TextUtils::Join(parts, "\n");
}

std::string DocxReader::ReadFull(const std::string& bytes) {
    OoxmlArchive archive(bytes);
    tinyxml2::XMLDocument doc;
    const auto* body = DocumentBody(doc, archive);

    std::vector<std::string> lines;
    for (auto p = body->FirstChildElement("w:p"); p; p = p->NextSiblingElement("w:p")) {
        lines.push_back(ParagraphText(p));
    }
    for (auto table = body->FirstChildElement("w:tbl"); table; table = table->NextSiblingElement("w:tbl")) {
        for (auto row = table->FirstChildElement("w:tr"); row; row = row->NextSiblingElement("w:tr")) {
            std::vector<std::string> cells;
            for (auto cell = row->FirstChildElement("w:tc"); cell; cell = cell->NextSiblingElement("w:tc")) {
                cells.push_back(CellText(cell));
            }
            lines.push_back(TextUtils::Join(cells, " | "));
        }
    }
    return TextUtils::Join(lines, "\n");
}

std::vector<SheetTable> XlsxReader::ReadSheets(const std::string& bytes,
                                               std::optional<std::size_t> maxSheets,
                                               std::optional<std::size_t> maxRows) {
    OoxmlArchive archive(bytes);
    const auto shared = SharedStrings(archive);
    const auto parts = SheetParts(archive);
    if (parts.empty()) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "workbook has no worksheets");
    }

    std::vector<SheetTable> sheets;
    for (const auto& [name, part] : parts) {
        if (maxSheets && sheets.size() >= *maxSheets) break;

        SheetTable sheet;
        sheet.name = name;

        auto xml = archive.entry(part);
        if (!xml) {
            throw ExtractionError(ExtractionErrorKind::ParseFailure, part + " missing");
        }
        tinyxml2::XMLDocument doc;
        ParseXml(doc, *xml, part);
        const auto* root = doc.RootElement();
        const auto* data = root ? root->FirstChildElement("sheetData") : nullptr;

        for (auto row = data ? data->FirstChildElement("row") : nullptr; row; row = row->NextSiblingElement("row")) {
            std::vector<std::string> cells;
            for (auto cell = row->FirstChildElement("c"); cell; cell = cell->NextSiblingElement("c")) {
                int column = ColumnIndex(cell->Attribute("r"));
                if (column < 0) column = static_cast<int>(cells.size());
                if (static_cast<std::size_t>(column) >= cells.size()) cells.resize(column + 1);
                cells[column] = CellValue(cell, shared);
            }
            if (!RowHasContent(cells)) continue;
            sheet.rows.push_back(std::move(cells));
            if (maxRows && sheet.rows.size() >= *maxRows) break;
        }

        PadToWidestRow(sheet);
        sheets.push_back(std::move(sheet));
    }
    return sheets;
}

std::vector<SheetTable> XlsReader::ReadSheets(const std::string& bytes,
                                              std::optional<std::size_t> maxSheets,
                                              std::optional<std::size_t> maxRows) {
    xls::xls_error_t err = xls::LIBXLS_OK;
    std::unique_ptr<xls::xlsWorkBook, XlsWorkbookCloser> wb(
        xls::xls_open_buffer(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), "UTF-8", &err));
    if (!wb) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure,
                              std::string("libxls: ") + xls::xls_getError(err));
    }

    std::vector<SheetTable> sheets;
    for (xls::DWORD i = 0; i < wb->sheets.count; ++i) {
        if (maxSheets && sheets.size() >= *maxSheets) break;

        std::unique_ptr<xls::xlsWorkSheet, XlsWorksheetCloser> ws(xls::xls_getWorkSheet(wb.get(), static_cast<int>(i)));
        if (!ws || xls::xls_parseWorkSheet(ws.get()) != xls::LIBXLS_OK) {
            throw ExtractionError(ExtractionErrorKind::ParseFailure, "libxls could not parse sheet " + std::to_string(i + 1));
        }

        SheetTable sheet;
        const char* name = wb->sheets.sheet[i].name;
        sheet.name = name ? name : "Sheet" + std::to_string(i + 1);

        for (int r = 0; r <= ws->rows.lastrow; ++r) {
            std::vector<std::string> cells;
            for (int c = 0; c <= ws->rows.lastcol; ++c) {
                cells.push_back(XlsCellText(xls::xls_cell(ws.get(), static_cast<xls::WORD>(r), static_cast<xls::WORD>(c))));
            }
            while (!cells.empty() && cells.back().empty()) cells.pop_back();
            if (!RowHasContent(cells)) continue;
            sheet.rows.push_back(std::move(cells));
            if (maxRows && sheet.rows.size() >= *maxRows) break;
        }

        PadToWidestRow(sheet);
        sheets.push_back(std::move(sheet));
    }
    return sheets;
}

std::string XlsReader::RenderAligned(const SheetTable& sheet) {
    std::vector<std::size_t> widths;
    for (const auto& row : sheet.rows) {
        if (row.size() > widths.size()) widths.resize(row.size(), 0);
        for (std::size_t c = 0; c < row.size(); ++c) {
            widths[c] = std::max(widths[c], TextUtils::Utf8Length(row[c]));
        }
    }

    std::vector<std::string> lines;
    for (const auto& row : sheet.rows) {
        std::string line;
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) line += "  ";
            line += row[c];
            line.append(widths[c] - TextUtils::Utf8Length(row[c]), ' ');
        }
        line.erase(line.find_last_not_of(' ') + 1);
        lines.push_back(line);
    }
    return TextUtils::Join(lines, "\n");
}

} // namespace tenderlens::infrastructure
