#include <cassert>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <miniz.h>

#include "domain/ExtractionError.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/ConversionPool.hpp"
#include "infrastructure/LegacyDocReader.hpp"
#include "infrastructure/OfficeReaders.hpp"

using namespace tenderlens;
using domain::DocumentCategory;
using domain::RawFile;
using infrastructure::ContentExtractor;

namespace {

// Builds an in-memory zip container from (part name, content) pairs.
std::string MakeZip(const std::vector<std::pair<std::string, std::string>>& entries) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    bool ok = mz_zip_writer_init_heap(&zip, 0, 0);
    assert(ok && "zip writer init");
    for (const auto& [name, content] : entries) {
        ok = mz_zip_writer_add_mem(&zip, name.c_str(), content.data(), content.size(), MZ_DEFAULT_COMPRESSION);
        assert(ok && "zip add entry");
    }
    void* buffer = nullptr;
    size_t size = 0;
    ok = mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size);
    assert(ok && "zip finalize");
    std::string bytes(static_cast<const char*>(buffer), size);
    mz_free(buffer);
    mz_zip_writer_end(&zip);
    return bytes;
}

std::string MakeDocx() {
    const std::string document =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)"
        R"(<w:p><w:r><w:t>Règlement de consultation</w:t></w:r></w:p>)"
        R"(<w:p><w:r><w:t xml:space="preserve">Article 1 </w:t></w:r><w:r><w:t>Objet</w:t></w:r></w:p>)"
        R"(<w:tbl><w:tr><w:tc><w:p><w:r><w:t>Lot</w:t></w:r></w:p></w:tc>)"
        R"(<w:tc><w:p><w:r><w:t>Montant</w:t></w:r></w:p></w:tc></w:tr></w:tbl>)"
        R"(</w:body></w:document>)";
    return MakeZip({{"word/document.xml", document}});
}

std::string MakeXlsx() {
    const std::string sheet =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)"
        R"(<row r="1"><c r="A1" t="inlineStr"><is><t>Designation</t></is></c><c r="C1" t="s"><v>0</v></c></row>)"
        R"(<row r="2"></row>)"
        R"(<row r="3"><c r="A3" t="inlineStr"><is><t>Bordure</t></is></c><c r="B3"><v>12.5</v></c></row>)"
        R"(</sheetData></worksheet>)";
    const std::string shared =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><si><t>Prix</t></si></sst>)";
    return MakeZip({{"xl/worksheets/sheet1.xml", sheet}, {"xl/sharedStrings.xml", shared}});
}

std::shared_ptr<ContentExtractor> MakeExtractor() {
    return std::make_shared<ContentExtractor>(infrastructure::PipelineSettings{}, nullptr);
}

// Single blank A4 page with a correct cross-reference table.
std::string MakeBlankPdf() {
    const std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] /Resources << >> >>",
    };
    std::string pdf = "%PDF-1.4\n";
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const std::size_t xref = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (std::size_t offset : offsets) {
        char entry[32];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return pdf;
}

} // namespace

void TestScannedThreshold() {
    std::cout << "[Test] Scanned threshold..." << std::endl;
    assert(ContentExtractor::LooksScanned(""));
    assert(ContentExtractor::LooksScanned(std::string(99, 'a')));
    assert(!ContentExtractor::LooksScanned(std::string(100, 'a')));
    assert(ContentExtractor::LooksScanned("   " + std::string(99, 'a') + "\n\n  "));

    // Code points, not bytes.
    std::string accented;
    for (int i = 0; i < 60; ++i) accented += "é";
    assert(ContentExtractor::LooksScanned(accented));
    std::cout << "[PASS] Scanned threshold." << std::endl;
}

void TestPlainText() {
    std::cout << "[Test] Plain text files..." << std::endl;
    auto extractor = MakeExtractor();
    RawFile file("notes.txt", "Avis de consultation\nLigne 2");
    auto sample = extractor->extractSample(file);
    assert(sample.text == "Avis de consultation\nLigne 2");
    assert(!sample.isScanned);

    auto record = extractor->extractFull(file, false, DocumentCategory::PrimaryNotice);
    assert(record.success);
    assert(record.fullText == "Avis de consultation\nLigne 2");
    assert(record.category == DocumentCategory::PrimaryNotice);
    assert(record.method == domain::ExtractionMethod::Digital);
    assert(record.mime == "text/plain");
    assert(record.size == file.size);

    // Sample is capped on a UTF-8 boundary.
    std::string longText = "x";
    for (int i = 0; i < 1500; ++i) longText += "é";
    auto capped = extractor->extractSample(RawFile("long.txt", longText));
    assert(capped.text.size() <= 2000);
    assert(capped.text.size() % 2 == 1 && "No split multi-byte sequence");
    std::cout << "[PASS] Plain text." << std::endl;
}

void TestUnsupported() {
    std::cout << "[Test] Unsupported formats..." << std::endl;
    auto extractor = MakeExtractor();
    bool threw = false;
    try {
        extractor->extractSample(RawFile("plan.dwg", "..."));
    } catch (const domain::ExtractionError& e) {
        threw = true;
        assert(e.kind() == domain::ExtractionErrorKind::UnsupportedFormat);
    }
    assert(threw);

    auto record = extractor->extractFull(RawFile("plan.dwg", "..."), false, DocumentCategory::Other);
    assert(!record.success);
    assert(record.error && *record.error == "UnsupportedFormat: Unsupported file type: dwg");
    assert(!ContentExtractor::IsSupportedExtension("odt"));
    assert(ContentExtractor::IsSupportedExtension("xls"));
    std::cout << "[PASS] Unsupported." << std::endl;
}

void TestDocx() {
    std::cout << "[Test] Word documents..." << std::endl;
    auto extractor = MakeExtractor();
    RawFile file("rc.docx", MakeDocx());

    auto sample = extractor->extractSample(file);
    assert(sample.text.find("Règlement de consultation") == 0);

    auto record = extractor->extractFull(file, false, DocumentCategory::Rules);
    assert(record.success);
    assert(record.fullText == "Règlement de consultation\nArticle 1 Objet\nLot | Montant");

    auto broken = extractor->extractFull(RawFile("broken.docx", "PK not really"), false, DocumentCategory::Rules);
    assert(!broken.success);
    assert(broken.error && broken.error->rfind("ParseFailure: ", 0) == 0);
    assert(broken.fullText.empty());
    std::cout << "[PASS] Word documents." << std::endl;
}

void TestXlsx() {
    std::cout << "[Test] Workbooks..." << std::endl;
    const std::string bytes = MakeXlsx();
    auto sheets = infrastructure::XlsxReader::ReadSheets(bytes);
    assert(sheets.size() == 1);
    assert(sheets[0].name == "Sheet1");
    assert(sheets[0].rows.size() == 2 && "Empty rows are skipped");
    assert(sheets[0].rows[0] == (std::vector<std::string>{"Designation", "", "Prix"}));
    assert(sheets[0].rows[1] == (std::vector<std::string>{"Bordure", "12.5", ""}));

    auto extractor = MakeExtractor();
    auto record = extractor->extractFull(RawFile("bpde.xlsx", bytes), false, DocumentCategory::PriceSchedule);
    assert(record.success);
    assert(record.fullText == "=== Sheet: Sheet1 ===\nDesignation |  | Prix\nBordure | 12.5 | ");

    auto sample = extractor->extractSample(RawFile("bpde.xlsx", bytes));
    assert(sample.text == "Designation |  | Prix\nBordure | 12.5 | ");
    std::cout << "[PASS] Workbooks." << std::endl;
}

std::string MakeXlsxWithCell(const std::string& reference) {
    const std::string sheet =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
        R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>)"
        R"(<row r="1"><c r=")" + reference + R"(" t="inlineStr"><is><t>Total</t></is></c></row>)"
        R"(</sheetData></worksheet>)";
    return MakeZip({{"xl/worksheets/sheet1.xml", sheet}});
}

void TestXlsxCellReferenceBounds() {
    std::cout << "[Test] Workbook cell reference bounds..." << std::endl;
    auto last = infrastructure::XlsxReader::ReadSheets(MakeXlsxWithCell("XFD1"));
    assert(last.size() == 1 && last[0].rows.size() == 1);
    assert(last[0].rows[0].size() == 16384);
    assert(last[0].rows[0].back() == "Total");

    for (const std::string reference : {"XFE1", "ZZZZZZZ1"}) {
        bool threw = false;
        try {
            infrastructure::XlsxReader::ReadSheets(MakeXlsxWithCell(reference));
        } catch (const domain::ExtractionError& e) {
            threw = e.kind() == domain::ExtractionErrorKind::ParseFailure;
        }
        assert(threw);
    }

    auto extractor = MakeExtractor();
    auto record = extractor->extractFull(RawFile("dqe.xlsx", MakeXlsxWithCell("ZZZZZZZ1")), false,
                                         DocumentCategory::EstimatedQuantities);
    assert(!record.success);
    assert(record.fullText.rfind("[EXCEL EXTRACTION FAILED: ", 0) == 0);
    std::cout << "[PASS] Cell reference bounds." << std::endl;
}

void TestOcrFailureSentinel() {
    std::cout << "[Test] OCR failure sentinel..." << std::endl;
    // A stopped pool rejects recognition jobs with a plain runtime_error.
    auto pool = std::make_shared<infrastructure::ConversionPool>(1, "StoppedPool");
    pool->stop();
    ContentExtractor extractor(infrastructure::PipelineSettings{}, pool);

    auto record = extractor.extractFull(RawFile("avis_scan.pdf", MakeBlankPdf()), true, DocumentCategory::PrimaryNotice);
    assert(!record.success);
    assert(record.method == domain::ExtractionMethod::OCR);
    assert(record.fullText.rfind("[OCR FAILED: ", 0) == 0);
    assert(record.fullText.find("submit after stop") != std::string::npos);
    assert(record.pageCount == 0);
    assert(record.error && record.error->rfind("ConversionFailure: ", 0) == 0);
    std::cout << "[PASS] OCR failure sentinel." << std::endl;
}

void TestAlignedRendering() {
    std::cout << "[Test] Aligned sheet rendering..." << std::endl;
    infrastructure::SheetTable sheet;
    sheet.name = "Feuil1";
    sheet.rows = {{"Lot", "Prix"}, {"1", "1200"}};
    const std::string rendered = infrastructure::XlsReader::RenderAligned(sheet);
    assert(rendered.find("Lot") == 0);
    assert(rendered.find("1200") != std::string::npos);
    std::cout << "[PASS] Aligned rendering." << std::endl;
}

void TestLegacyDocScrape() {
    std::cout << "[Test] Legacy Word scraping..." << std::endl;
    std::string bytes("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1", 8);
    bytes += std::string(64, '\0');
    bytes += "Cahier des prescriptions speciales relatif aux travaux de voirie";
    bytes += std::string(16, '\x01');
    bytes += "Article premier: objet du marche et consistance des prestations";
    bytes += std::string(32, '\0');

    auto scraped = infrastructure::LegacyDocReader::ScrapePrintableRuns(bytes, infrastructure::LegacyDocReader::Mode::Full);
    assert(scraped.has_value());
    assert(scraped->find("Cahier des prescriptions speciales") != std::string::npos);

    assert(!infrastructure::LegacyDocReader::ScrapePrintableRuns(std::string(200, '\0'),
                                                                  infrastructure::LegacyDocReader::Mode::Full));

    auto extractor = MakeExtractor();
    auto record = extractor->extractFull(RawFile("cps.doc", bytes), false, DocumentCategory::Specification);
    assert(record.success);
    assert(record.fullText.find("prescriptions") != std::string::npos);
    std::cout << "[PASS] Legacy Word." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Content Extractor Test..." << std::endl;
    TestScannedThreshold();
    TestPlainText();
    TestUnsupported();
    TestDocx();
    TestXlsx();
    TestXlsxCellReferenceBounds();
    TestOcrFailureSentinel();
    TestAlignedRendering();
    TestLegacyDocScrape();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
