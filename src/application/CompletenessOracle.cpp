#include "application/CompletenessOracle.hpp"

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using namespace domain;

const std::vector<std::string>& CompletenessOracle::RequiredFields() {
    static const std::vector<std::string> kRequired = {
        fields::kReference, fields::kSubject, fields::kSubmissionDeadline, fields::kIssuingInstitution,
    };
    return kRequired;
}

bool CompletenessOracle::IsMissing(const FieldValue& value) {
    if (const auto* tracked = std::get_if<TrackedValue>(&value)) {
        return tracked->isMissing();
    }
    if (const auto* deadline = std::get_if<SubmissionDeadline>(&value)) {
        return !deadline->date || deadline->date->isMissing();
    }
    if (const auto* opaque = std::get_if<OpaqueField>(&value)) {
        if (opaque->raw.is_null()) return true;
        if (opaque->raw.is_string()) return infrastructure::TextUtils::IsBlank(opaque->raw.get<std::string>());
        return false;
    }
    // Lots and keyword buckets are never required.
    return false;
}

std::vector<std::string> CompletenessOracle::MissingFields(const MetadataRecord& record) {
    std::vector<std::string> missing;
    for (const auto& name : RequiredFields()) {
        const FieldValue* value = record.find(name);
        if (!value || IsMissing(*value)) missing.push_back(name);
    }
    return missing;
}

} // namespace tenderlens::application
