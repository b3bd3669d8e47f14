#include "infrastructure/MetadataCodec.hpp"

#include <algorithm>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::infrastructure {

using namespace domain;
using nlohmann::json;

namespace {

bool IsTrackedField(const std::string& key) {
    const auto& names = fields::TrackedScalarFields();
    return std::find(names.begin(), names.end(), key) != names.end();
}

/** null -> nullopt (ok); array/object -> false. */
bool ParseScalar(const json& j, std::optional<Scalar>& out) {
    if (j.is_null()) { out.reset(); return true; }
    if (j.is_string()) { out = Scalar{j.get<std::string>()}; return true; }
    if (j.is_boolean()) { out = Scalar{j.get<bool>()}; return true; }
    if (j.is_number()) { out = Scalar{j.get<double>()}; return true; }
    return false;
}

json ScalarToJson(const std::optional<Scalar>& value) {
    if (!value) return nullptr;
    if (const auto* s = std::get_if<std::string>(&*value)) return *s;
    if (const auto* b = std::get_if<bool>(&*value)) return *b;
    return std::get<double>(*value);
}

bool ParseTracked(const json& j, const SourceDocument& defaultSource, TrackedValue& out) {
    out = TrackedValue{};
    out.sourceDocument = defaultSource;

    if (!j.is_object()) {
        return ParseScalar(j, out.value);
    }
    if (j.contains("value") && !ParseScalar(j.at("value"), out.value)) {
        return false;
    }
    if (j.contains("source_document") && j.at("source_document").is_string()) {
        if (auto parsed = ParseSourceDocument(j.at("source_document").get<std::string>())) {
            out.sourceDocument = *parsed;
        }
    }
    if (j.contains("source_date") && j.at("source_date").is_string()) {
        out.sourceDate = j.at("source_date").get<std::string>();
    }
    return true;
}

bool ParseDeadline(const json& j, const SourceDocument& defaultSource, SubmissionDeadline& out,
                   std::vector<std::string>& issues) {
    out = SubmissionDeadline{};
    if (j.is_object() && (j.contains("date") || j.contains("time"))) {
        for (const char* half : {"date", "time"}) {
            if (!j.contains(half) || j.at(half).is_null()) continue;
            TrackedValue tracked;
            if (!ParseTracked(j.at(half), defaultSource, tracked)) {
                issues.push_back(std::string("submission_deadline.") + half + ": not a scalar, dropped");
                continue;
            }
            if (std::string(half) == "date") out.date = tracked;
            else out.time = tracked;
        }
        return true;
    }

    // A single tracked value (or a bare scalar) is the date half.
    TrackedValue tracked;
    if (!ParseTracked(j, defaultSource, tracked)) return false;
    out.date = tracked;
    return true;
}

bool ParseLots(const json& j, LotList& out, std::vector<std::string>& issues) {
    if (!j.is_array()) return false;
    out.clear();
    for (std::size_t i = 0; i < j.size(); ++i) {
        const json& item = j.at(i);
        if (!item.is_object()) {
            issues.push_back("lots[" + std::to_string(i) + "]: not an object, dropped");
            continue;
        }
        Lot lot;
        auto read = [&](const char* key, std::optional<Scalar>& target) {
            if (!item.contains(key)) return;
            const json& raw = item.at(key);
            // Some answers wrap lot values like tracked fields.
            const json& value = (raw.is_object() && raw.contains("value")) ? raw.at("value") : raw;
            if (!ParseScalar(value, target)) {
                issues.push_back("lots[" + std::to_string(i) + "]." + key + ": not a scalar, dropped");
                target.reset();
            }
        };
        read("lot_number", lot.lotNumber);
        read("lot_subject", lot.lotSubject);
        read("lot_estimated_value", lot.lotEstimatedValue);
        read("caution_provisoire", lot.cautionProvisoire);
        out.push_back(std::move(lot));
    }
    return true;
}

bool ParseKeywords(const json& j, KeywordBuckets& out) {
    if (!j.is_object()) return false;
    out = KeywordBuckets{};
    auto read = [&](const char* key, std::vector<std::string>& bucket) {
        if (!j.contains(key) || !j.at(key).is_array()) return;
        for (const auto& word : j.at(key)) {
            if (word.is_string()) bucket.push_back(word.get<std::string>());
        }
    };
    read("keywords_fr", out.fr);
    read("keywords_eng", out.eng);
    read("keywords_ar", out.ar);
    return true;
}

} // namespace

MetadataRecord MetadataCodec::FromJson(const json& j, const SourceDocument& defaultSource,
                                       std::vector<std::string>& issues) {
    MetadataRecord record;
    if (!j.is_object()) {
        issues.push_back("fragment is not a JSON object");
        return record;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (IsTrackedField(key)) {
            TrackedValue tracked;
            if (ParseTracked(value, defaultSource, tracked)) record.set(key, tracked);
            else issues.push_back(key + ": expected a tracked value, dropped");
        } else if (key == fields::kSubmissionDeadline) {
            SubmissionDeadline deadline;
            if (ParseDeadline(value, defaultSource, deadline, issues)) record.set(key, deadline);
            else issues.push_back(key + ": expected {date, time}, dropped");
        } else if (key == fields::kLots) {
            if (value.is_null()) continue;
            LotList lots;
            if (ParseLots(value, lots, issues)) record.set(key, lots);
            else issues.push_back(key + ": expected a list, dropped");
        } else if (key == fields::kKeywords) {
            if (value.is_null()) continue;
            KeywordBuckets keywords;
            if (ParseKeywords(value, keywords)) record.set(key, keywords);
            else issues.push_back(key + ": expected language buckets, dropped");
        } else {
            record.set(key, OpaqueField{value});
        }
    }
    return record;
}

json MetadataCodec::ToJson(const TrackedValue& value) {
    return json{
        {"value", ScalarToJson(value.value)},
        {"source_document", SourceDocumentToLabel(value.sourceDocument)},
        {"source_date", value.sourceDate ? json(*value.sourceDate) : json(nullptr)}
    };
}

json MetadataCodec::ToJson(const MetadataRecord& record) {
    json out = json::object();
    for (const auto& [name, field] : record.fields()) {
        if (const auto* tracked = std::get_if<TrackedValue>(&field)) {
            out[name] = ToJson(*tracked);
        } else if (const auto* deadline = std::get_if<SubmissionDeadline>(&field)) {
            out[name] = json{
                {"date", deadline->date ? ToJson(*deadline->date) : json(nullptr)},
                {"time", deadline->time ? ToJson(*deadline->time) : json(nullptr)}
            };
        } else if (const auto* lots = std::get_if<LotList>(&field)) {
            json list = json::array();
            for (const auto& lot : *lots) {
                list.push_back(json{
                    {"lot_number", ScalarToJson(lot.lotNumber)},
                    {"lot_subject", ScalarToJson(lot.lotSubject)},
                    {"lot_estimated_value", ScalarToJson(lot.lotEstimatedValue)},
                    {"caution_provisoire", ScalarToJson(lot.cautionProvisoire)}
                });
            }
            out[name] = list;
        } else if (const auto* keywords = std::get_if<KeywordBuckets>(&field)) {
            out[name] = json{
                {"keywords_fr", keywords->fr},
                {"keywords_eng", keywords->eng},
                {"keywords_ar", keywords->ar}
            };
        } else {
            out[name] = std::get<OpaqueField>(field).raw;
        }
    }
    return out;
}

json MetadataCodec::ToJson(const ClassificationRecord& record) {
    // sample text is deliberately absent: it never leaves the pipeline.
    return json{
        {"filename", record.filename},
        {"category", CategoryToLabel(record.category)},
        {"is_scanned", record.isScanned},
        {"mime", record.mime},
        {"size", record.size},
        {"success", record.success},
        {"error", record.error ? json(*record.error) : json(nullptr)}
    };
}

json MetadataCodec::ToJson(const ExtractionRecord& record, bool includeText) {
    json out{
        {"filename", record.filename},
        {"category", CategoryToLabel(record.category)},
        {"page_count", record.pageCount ? json(*record.pageCount) : json(nullptr)},
        {"method", MethodToLabel(record.method)},
        {"size", record.size},
        {"mime", record.mime},
        {"success", record.success},
        {"error", record.error ? json(*record.error) : json(nullptr)},
        {"characters", TextUtils::Utf8Length(record.fullText)}
    };
    if (includeText) out["full_text"] = record.fullText;
    return out;
}

std::string MetadataCodec::StripCodeFence(const std::string& response) {
    auto between = [&](std::size_t open, std::size_t skip) {
        const std::size_t start = open + skip;
        const std::size_t close = response.find("```", start);
        return response.substr(start, close == std::string::npos ? std::string::npos : close - start);
    };

    const std::size_t jsonFence = response.find("```json");
    if (jsonFence != std::string::npos) return TextUtils::Trim(between(jsonFence, 7));
    const std::size_t fence = response.find("```");
    if (fence != std::string::npos) return TextUtils::Trim(between(fence, 3));
    return TextUtils::Trim(response);
}

} // namespace tenderlens::infrastructure
