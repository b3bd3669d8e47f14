#include "domain/TenderMetadata.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

namespace tenderlens::domain {

std::string SourceDocumentToLabel(const SourceDocument& source) {
    if (std::holds_alternative<WebsiteSource>(source)) return "WEBSITE";
    return CategoryToLabel(std::get<DocumentCategory>(source));
}

std::optional<SourceDocument> ParseSourceDocument(const std::string& label) {
    if (label == "WEBSITE") return SourceDocument{WebsiteSource{}};
    if (auto category = ParseCategoryLabel(label)) return SourceDocument{*category};
    return std::nullopt;
}

bool IsBlankScalar(const std::optional<Scalar>& value) {
    if (!value) return true;
    if (const auto* text = std::get_if<std::string>(&*value)) {
        for (unsigned char c : *text) {
            if (!std::isspace(c)) return false;
        }
        return true;
    }
    return false;
}

std::string ScalarToString(const Scalar& value) {
    if (const auto* text = std::get_if<std::string>(&value)) return *text;
    if (const auto* flag = std::get_if<bool>(&value)) return *flag ? "true" : "false";

    const double number = std::get<double>(value);
    if (std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
    }
    std::ostringstream out;
    out << number;
    return out.str();
}

namespace fields {
const std::vector<std::string>& TrackedScalarFields() {
    static const std::vector<std::string> kFields = {
        kReference, kTenderType, kIssuingInstitution, kExecutionLocation,
        kFolderOpeningLocation, kSubject, kTotalEstimatedValue
    };
    return kFields;
}
} // namespace fields

void MetadataRecord::stampSourceDate(const std::string& sourceDate) {
    for (auto& [name, field] : m_fields) {
        if (auto* tracked = std::get_if<TrackedValue>(&field)) {
            tracked->sourceDate = sourceDate;
        } else if (auto* deadline = std::get_if<SubmissionDeadline>(&field)) {
            if (deadline->date) deadline->date->sourceDate = sourceDate;
            if (deadline->time) deadline->time->sourceDate = sourceDate;
        }
    }
}

} // namespace tenderlens::domain
