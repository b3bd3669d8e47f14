/**
 * @file ExtractionError.hpp
 * @brief Error taxonomy for per-file reading and conversion.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace tenderlens::domain {

enum class ExtractionErrorKind {
    UnsupportedFormat,
    ConversionFailure,
    ParseFailure,
    ClassificationAmbiguous  ///< Logged only; resolves to Unknown, never an error record.
};

inline std::string ErrorKindToString(ExtractionErrorKind kind) {
    switch (kind) {
        case ExtractionErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ExtractionErrorKind::ConversionFailure: return "ConversionFailure";
        case ExtractionErrorKind::ParseFailure: return "ParseFailure";
        case ExtractionErrorKind::ClassificationAmbiguous: return "ClassificationAmbiguous";
    }
    return "ParseFailure";
}

/**
 * @class ExtractionError
 * @brief Thrown by format readers; caught at file scope and turned into a failed record.
 */
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(ExtractionErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ExtractionErrorKind kind() const { return m_kind; }

    /** @brief "<Kind>: <message>", the form stored on failed records. */
    std::string describe() const { return Describe(m_kind, what()); }

    static std::string Describe(ExtractionErrorKind kind, const std::string& message) {
        return ErrorKindToString(kind) + ": " + message;
    }

private:
    ExtractionErrorKind m_kind;
};

} // namespace tenderlens::domain
