#include "infrastructure/PdfReader.hpp"

#include <cstring>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page.h>
#include <poppler/cpp/poppler-page-renderer.h>

#include "domain/ExtractionError.hpp"

namespace tenderlens::infrastructure {

using domain::ExtractionError;
using domain::ExtractionErrorKind;

PdfReader::PdfReader(const std::string& bytes) : m_data(bytes.begin(), bytes.end()) {
    if (m_data.empty()) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "empty PDF");
    }
    m_document.reset(poppler::document::load_from_raw_data(m_data.data(), static_cast<int>(m_data.size())));
    if (!m_document) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "unreadable PDF");
    }
    if (m_document->is_locked()) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "PDF is password protected");
    }
}

PdfReader::~PdfReader() = default;

int PdfReader::pageCount() const {
    return m_document->pages();
}

std::string PdfReader::pageText(int index) const {
    std::unique_ptr<poppler::page> page(m_document->create_page(index));
    if (!page) {
        throw ExtractionError(ExtractionErrorKind::ParseFailure, "cannot open page " + std::to_string(index + 1));
    }
    poppler::byte_array utf8 = page->text().to_utf8();
    return std::string(utf8.begin(), utf8.end());
}

PageImage PdfReader::renderPage(int index, int dpi) const {
    std::unique_ptr<poppler::page> page(m_document->create_page(index));
    if (!page) {
        throw ExtractionError(ExtractionErrorKind::ConversionFailure, "cannot open page " + std::to_string(index + 1));
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_gray8);

    poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
    if (!rendered.is_valid()) {
        throw ExtractionError(ExtractionErrorKind::ConversionFailure, "failed to render page " + std::to_string(index + 1));
    }

    PageImage image;
    image.width = rendered.width();
    image.height = rendered.height();
    image.bytesPerLine = rendered.bytes_per_row();
    image.pixels.resize(static_cast<std::size_t>(image.bytesPerLine) * image.height);
    std::memcpy(image.pixels.data(), rendered.const_data(), image.pixels.size());
    return image;
}

} // namespace tenderlens::infrastructure
