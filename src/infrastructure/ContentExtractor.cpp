/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"

#include <algorithm>
#include <future>
#include <iostream>

#include "domain/ExtractionError.hpp"
#include "infrastructure/LegacyDocReader.hpp"
#include "infrastructure/OfficeReaders.hpp"
#include "infrastructure/PdfReader.hpp"
#include "infrastructure/TextUtils.hpp"

namespace tenderlens::infrastructure {

using domain::ExtractionError;
using domain::ExtractionErrorKind;
using domain::ExtractionMethod;
using domain::ExtractionRecord;
using domain::RawFile;

namespace {

constexpr std::size_t kTextSampleBytes = 2000;
constexpr std::size_t kSpreadsheetSampleRows = 21;
constexpr const char* kDocFailedSentinel = "[.DOC EXTRACTION FAILED - Install antiword for better support]";

/** Cuts @p bytes at @p limit without splitting a UTF-8 sequence. */
std::string Utf8SafeHead(const std::string& bytes, std::size_t limit) {
    if (bytes.size() <= limit) return bytes;
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(bytes[cut]) & 0xC0) == 0x80) --cut;
    return bytes.substr(0, cut);
}

std::string RenderRows(const SheetTable& sheet) {
    std::vector<std::string> lines;
    for (const auto& row : sheet.rows) lines.push_back(TextUtils::Join(row, " | "));
    return TextUtils::Join(lines, "\n");
}

void Fail(ExtractionRecord& record, ExtractionErrorKind kind, const std::string& message) {
    record.success = false;
    record.error = ExtractionError::Describe(kind, message);
}

} // namespace

ContentExtractor::ContentExtractor(PipelineSettings settings, std::shared_ptr<ConversionPool> pool)
    : m_settings(std::move(settings)),
      m_pool(std::move(pool)),
      m_ocr(m_settings.ocr.language, m_settings.ocr.tessdataPath) {}

bool ContentExtractor::IsSupportedExtension(const std::string& ext) {
    return ext == "pdf" || ext == "docx" || ext == "doc" || ext == "xlsx" || ext == "xls" || ext == "txt";
}

bool ContentExtractor::LooksScanned(const std::string& digitalText) {
    return TextUtils::Utf8Length(TextUtils::Trim(digitalText)) < kScannedThreshold;
}

template <typename F>
auto ContentExtractor::runConversion(F&& job) const -> decltype(job()) {
    if (!m_pool) return job();
    return m_pool->submit(std::forward<F>(job)).get();
}

// ------------------------------------------------------------------ sampling

ContentExtractor::Sample ContentExtractor::extractSample(const RawFile& file) const {
    const std::string ext = file.extension();
    Sample sample;

    if (ext == "pdf") {
        sample.text = samplePdf(file.bytes, sample.isScanned);
    } else if (ext == "docx") {
        sample.text = DocxReader::ReadSample(file.bytes);
    } else if (ext == "doc") {
        sample.text = sampleLegacyDoc(file.bytes);
    } else if (ext == "xlsx" || ext == "xls") {
        sample.text = sampleSpreadsheet(file.bytes);
    } else if (ext == "txt") {
        sample.text = TextUtils::SanitizeUtf8(Utf8SafeHead(file.bytes, kTextSampleBytes));
    } else {
        throw ExtractionError(ExtractionErrorKind::UnsupportedFormat, "Unsupported file type: " + ext);
    }
    return sample;
}

std::string ContentExtractor::samplePdf(const std::string& bytes, bool& isScanned) const {
    std::unique_ptr<PdfReader> pdf;
    try {
        pdf = std::make_unique<PdfReader>(bytes);
    } catch (const ExtractionError& e) {
        std::cerr << "[ContentExtractor] PDF scan check failed, treating as scanned: " << e.describe() << std::endl;
        isScanned = true;
        return {};
    }
    if (pdf->pageCount() == 0) {
        isScanned = true;
        return {};
    }

    std::string digital = pdf->pageText(0);
    isScanned = LooksScanned(digital);
    if (!isScanned) return digital;

    try {
        auto pages = ocrPages(*pdf, 1);
        std::string ocrText = pages.empty() ? std::string() : TextUtils::Trim(pages.front());
        if (!ocrText.empty()) return ocrText;
    } catch (const ExtractionError& e) {
        std::cerr << "[ContentExtractor] First-page OCR failed: " << e.describe() << std::endl;
    }
    return digital;
}

std::string ContentExtractor::sampleSpreadsheet(const std::string& bytes) const {
    std::vector<SheetTable> sheets;
    try {
        sheets = XlsxReader::ReadSheets(bytes, 1, kSpreadsheetSampleRows);
    } catch (const ExtractionError&) {
        sheets = XlsReader::ReadSheets(bytes, 1, kSpreadsheetSampleRows);
    }
    return sheets.empty() ? std::string() : RenderRows(sheets.front());
}

std::string ContentExtractor::sampleLegacyDoc(const std::string& bytes) const {
    const int timeout = m_settings.legacyDoc.sampleTimeoutSeconds;
    std::string failure;
    auto converted = runConversion([&bytes, timeout, &failure]() {
        return LegacyDocReader::RunConverter(bytes, timeout, failure);
    });
    if (converted) return TextUtils::Utf8Prefix(*converted, 1000);

    std::cout << "[ContentExtractor] Converter unavailable for sample (" << failure << "), scraping text runs" << std::endl;
    auto scraped = LegacyDocReader::ScrapePrintableRuns(bytes, LegacyDocReader::Mode::Sample);
    return scraped ? *scraped : std::string();
}

// ------------------------------------------------------------------ full extraction

ExtractionRecord ContentExtractor::extractFull(const RawFile& file, bool isScanned,
                                               domain::DocumentCategory category) const {
    ExtractionRecord record;
    record.filename = file.filename;
    record.category = category;
    record.size = file.size;
    record.mime = file.mime;
    record.method = ExtractionMethod::Digital;
    record.success = true;

    const std::string ext = file.extension();
    try {
        if (ext == "pdf") {
            if (isScanned) extractPdfOcr(file.bytes, record);
            else extractPdfDigital(file.bytes, record);
        } else if (ext == "docx") {
            record.fullText = DocxReader::ReadFull(file.bytes);
        } else if (ext == "doc") {
            extractLegacyDoc(file.bytes, record);
        } else if (ext == "xlsx" || ext == "xls") {
            extractSpreadsheet(file.bytes, record);
        } else if (ext == "txt") {
            record.fullText = TextUtils::SanitizeUtf8(file.bytes);
        } else {
            Fail(record, ExtractionErrorKind::UnsupportedFormat, "Unsupported file type: " + ext);
        }
    } catch (const ExtractionError& e) {
        record.fullText.clear();
        record.success = false;
        record.error = e.describe();
    } catch (const std::exception& e) {
        record.fullText.clear();
        Fail(record, ExtractionErrorKind::ParseFailure, e.what());
    }

    if (!record.success) {
        std::cerr << "[ContentExtractor] " << file.filename << ": " << record.error.value_or("unknown error") << std::endl;
    } else {
        std::cout << "[ContentExtractor] " << file.filename << ": " << TextUtils::Utf8Length(record.fullText)
                  << " chars via " << domain::MethodToLabel(record.method) << std::endl;
    }
    return record;
}

void ContentExtractor::extractPdfDigital(const std::string& bytes, ExtractionRecord& record) const {
    PdfReader pdf(bytes);
    const int pages = pdf.pageCount();
    std::vector<std::string> parts;
    parts.reserve(pages);
    for (int i = 0; i < pages; ++i) parts.push_back(pdf.pageText(i));
    record.fullText = TextUtils::Join(parts, "\n\n");
    record.pageCount = pages;
}

void ContentExtractor::extractPdfOcr(const std::string& bytes, ExtractionRecord& record) const {
    record.method = ExtractionMethod::OCR;
    try {
        PdfReader pdf(bytes);
        const int pages = pdf.pageCount();
        if (pages == 0) {
            throw ExtractionError(ExtractionErrorKind::ConversionFailure, "No images extracted");
        }

        std::cout << "[ContentExtractor] OCR of " << pages << " page(s) at " << m_settings.ocr.dpi << " dpi" << std::endl;
        auto texts = ocrPages(pdf, pages);
        std::vector<std::string> parts;
        parts.reserve(texts.size());
        for (std::size_t i = 0; i < texts.size(); ++i) {
            parts.push_back("--- Page " + std::to_string(i + 1) + " ---\n" + texts[i]);
        }
        record.fullText = TextUtils::Trim(TextUtils::Join(parts, "\n\n"));
        record.pageCount = pages;
    } catch (const std::exception& e) {
        // Pool and future failures surface here too. The sentinel stays on the record
        // so the failure is visible downstream.
        record.fullText = std::string("[OCR FAILED: ") + e.what() + "]";
        record.pageCount = 0;
        record.success = false;
        record.error = ExtractionError::Describe(ExtractionErrorKind::ConversionFailure, e.what());
    }
}

std::vector<std::string> ContentExtractor::ocrPages(const PdfReader& pdf, int count) const {
    std::vector<std::string> texts;
    texts.reserve(count);
    const int dpi = m_settings.ocr.dpi;
    const int batch = m_pool ? static_cast<int>(std::max<std::size_t>(m_pool->size(), 1)) : 1;

    // Rendering stays on this thread (poppler documents are not shared across threads);
    // recognition fans out. Batching bounds the number of page rasters held at once.
    for (int start = 0; start < count; start += batch) {
        const int end = std::min(count, start + batch);
        std::vector<std::future<std::string>> pending;
        for (int i = start; i < end; ++i) {
            auto image = std::make_shared<PageImage>(pdf.renderPage(i, dpi));
            if (m_pool) {
                pending.push_back(m_pool->submit([this, image]() { return m_ocr.recognize(*image); }));
            } else {
                texts.push_back(m_ocr.recognize(*image));
            }
        }
        for (auto& future : pending) texts.push_back(future.get());
    }
    return texts;
}

void ContentExtractor::extractSpreadsheet(const std::string& bytes, ExtractionRecord& record) const {
    std::vector<std::string> lines;
    try {
        for (const auto& sheet : XlsxReader::ReadSheets(bytes)) {
            lines.push_back("=== Sheet: " + sheet.name + " ===");
            for (const auto& row : sheet.rows) lines.push_back(TextUtils::Join(row, " | "));
        }
        record.fullText = TextUtils::Join(lines, "\n");
        return;
    } catch (const ExtractionError& e) {
        std::cout << "[ContentExtractor] Structured workbook read failed (" << e.describe() << "), trying libxls" << std::endl;
    }

    try {
        lines.clear();
        for (const auto& sheet : XlsReader::ReadSheets(bytes)) {
            lines.push_back("=== Sheet: " + sheet.name + " ===");
            lines.push_back(XlsReader::RenderAligned(sheet));
        }
        record.fullText = TextUtils::Join(lines, "\n");
    } catch (const ExtractionError& e) {
        record.fullText = std::string("[EXCEL EXTRACTION FAILED: ") + e.what() + "]";
        Fail(record, ExtractionErrorKind::ParseFailure, e.what());
    }
}

void ContentExtractor::extractLegacyDoc(const std::string& bytes, ExtractionRecord& record) const {
    const int timeout = m_settings.legacyDoc.fullTimeoutSeconds;
    std::string failure;
    auto converted = runConversion([&bytes, timeout, &failure]() {
        return LegacyDocReader::RunConverter(bytes, timeout, failure);
    });
    if (converted) {
        record.fullText = *converted;
        return;
    }

    if (auto scraped = LegacyDocReader::ScrapePrintableRuns(bytes, LegacyDocReader::Mode::Full)) {
        std::cout << "[ContentExtractor] Converter failed (" << failure << "), kept scraped text runs" << std::endl;
        record.fullText = *scraped;
        return;
    }

    record.fullText = kDocFailedSentinel;
    Fail(record, ExtractionErrorKind::ConversionFailure, failure);
}

} // namespace tenderlens::infrastructure
