/**
 * @file TenderMetadata.hpp
 * @brief Typed metadata record built up from document fragments.
 *
 * Each field keeps the document it came from so that downstream review can see
 * which part of the dossier supplied a value.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/DocumentCategory.hpp"

namespace tenderlens::domain {

using Scalar = std::variant<std::string, double, bool>;

/** @brief Provenance tag for values scraped from the consultation web page. */
struct WebsiteSource {
    bool operator==(const WebsiteSource&) const { return true; }
    bool operator!=(const WebsiteSource&) const { return false; }
};

using SourceDocument = std::variant<WebsiteSource, DocumentCategory>;

std::string SourceDocumentToLabel(const SourceDocument& source);
std::optional<SourceDocument> ParseSourceDocument(const std::string& label);

/** @brief True when the scalar is absent or a string holding only whitespace. */
bool IsBlankScalar(const std::optional<Scalar>& value);

/** @brief Renders a scalar the way it would be shown to a reviewer. */
std::string ScalarToString(const Scalar& value);

/**
 * @struct TrackedValue
 * @brief A scalar plus the document that supplied it.
 */
struct TrackedValue {
    std::optional<Scalar> value;
    SourceDocument sourceDocument = WebsiteSource{};
    std::optional<std::string> sourceDate;

    bool isMissing() const { return IsBlankScalar(value); }

    bool operator==(const TrackedValue& other) const {
        return value == other.value && sourceDocument == other.sourceDocument && sourceDate == other.sourceDate;
    }
    bool operator!=(const TrackedValue& other) const { return !(*this == other); }
};

/** @brief Submission deadline. Only the date half is required for completeness. */
struct SubmissionDeadline {
    std::optional<TrackedValue> date;
    std::optional<TrackedValue> time;

    bool operator==(const SubmissionDeadline& other) const { return date == other.date && time == other.time; }
    bool operator!=(const SubmissionDeadline& other) const { return !(*this == other); }
};

struct Lot {
    std::optional<Scalar> lotNumber;
    std::optional<Scalar> lotSubject;
    std::optional<Scalar> lotEstimatedValue;
    std::optional<Scalar> cautionProvisoire;

    bool operator==(const Lot& other) const {
        return lotNumber == other.lotNumber && lotSubject == other.lotSubject &&
               lotEstimatedValue == other.lotEstimatedValue && cautionProvisoire == other.cautionProvisoire;
    }
    bool operator!=(const Lot& other) const { return !(*this == other); }
};

using LotList = std::vector<Lot>;

struct KeywordBuckets {
    std::vector<std::string> fr;
    std::vector<std::string> eng;
    std::vector<std::string> ar;

    bool operator==(const KeywordBuckets& other) const { return fr == other.fr && eng == other.eng && ar == other.ar; }
    bool operator!=(const KeywordBuckets& other) const { return !(*this == other); }
};

/** @brief Value of a key the schema does not model, carried through untouched. */
struct OpaqueField {
    nlohmann::json raw;

    bool operator==(const OpaqueField& other) const { return raw == other.raw; }
    bool operator!=(const OpaqueField& other) const { return !(*this == other); }
};

using FieldValue = std::variant<TrackedValue, SubmissionDeadline, LotList, KeywordBuckets, OpaqueField>;

/** @brief Wire names of the fields the pipeline understands. */
namespace fields {
inline constexpr const char* kReference = "reference_tender";
inline constexpr const char* kTenderType = "tender_type";
inline constexpr const char* kIssuingInstitution = "issuing_institution";
inline constexpr const char* kExecutionLocation = "execution_location";
inline constexpr const char* kFolderOpeningLocation = "folder_opening_location";
inline constexpr const char* kSubject = "subject";
inline constexpr const char* kTotalEstimatedValue = "total_estimated_value";
inline constexpr const char* kSubmissionDeadline = "submission_deadline";
inline constexpr const char* kLots = "lots";
inline constexpr const char* kKeywords = "keywords";

/** @brief Fields stored as a single TrackedValue. */
const std::vector<std::string>& TrackedScalarFields();
} // namespace fields

/**
 * @class MetadataRecord
 * @brief Named fields, each holding one of the shapes in @ref FieldValue.
 */
class MetadataRecord {
public:
    bool empty() const { return m_fields.empty(); }
    bool has(const std::string& name) const { return m_fields.count(name) > 0; }

    const FieldValue* find(const std::string& name) const {
        auto it = m_fields.find(name);
        return it == m_fields.end() ? nullptr : &it->second;
    }

    template <typename T>
    const T* get(const std::string& name) const {
        const FieldValue* field = find(name);
        return field ? std::get_if<T>(field) : nullptr;
    }

    void set(const std::string& name, FieldValue value) { m_fields[name] = std::move(value); }
    void erase(const std::string& name) { m_fields.erase(name); }

    const std::map<std::string, FieldValue>& fields() const { return m_fields; }

    /** @brief Sets @p sourceDate on every TrackedValue (deadline halves included). */
    void stampSourceDate(const std::string& sourceDate);

    bool operator==(const MetadataRecord& other) const { return m_fields == other.m_fields; }
    bool operator!=(const MetadataRecord& other) const { return !(*this == other); }

private:
    std::map<std::string, FieldValue> m_fields;
};

} // namespace tenderlens::domain
