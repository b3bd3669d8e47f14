/**
 * @file MetadataMerger.cpp
 * @brief Implementation of MetadataMerger.
 */

#include "application/MetadataMerger.hpp"

#include <map>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::application {

using namespace domain;
using infrastructure::TextUtils;

namespace {

std::optional<TrackedValue> MergeTracked(const std::optional<TrackedValue>& base,
                                         const std::optional<TrackedValue>& fallback) {
    if ((!base || base->isMissing()) && fallback) return fallback;
    return base;
}

// Lot numbers only pair up when both sides wrote them as text.
std::optional<std::string> LotKey(const Lot& lot) {
    if (!lot.lotNumber) return std::nullopt;
    const auto* text = std::get_if<std::string>(&*lot.lotNumber);
    if (!text) return std::nullopt;
    std::string key = TextUtils::Trim(*text);
    if (key.empty()) return std::nullopt;
    return key;
}

void FillBlank(std::optional<Scalar>& target, const std::optional<Scalar>& source) {
    if (IsBlankScalar(target)) target = source;
}

void FillLot(Lot& target, const Lot& source) {
    FillBlank(target.lotSubject, source.lotSubject);
    FillBlank(target.lotEstimatedValue, source.lotEstimatedValue);
    FillBlank(target.cautionProvisoire, source.cautionProvisoire);
    FillBlank(target.lotNumber, source.lotNumber);
}

} // namespace

SubmissionDeadline MetadataMerger::MergeDeadline(const SubmissionDeadline& base, const SubmissionDeadline& fallback) {
    SubmissionDeadline merged;
    merged.date = MergeTracked(base.date, fallback.date);
    merged.time = MergeTracked(base.time, fallback.time);
    return merged;
}

KeywordBuckets MetadataMerger::MergeKeywords(const KeywordBuckets& base, const KeywordBuckets& fallback) {
    KeywordBuckets merged;
    merged.fr = base.fr.empty() ? fallback.fr : base.fr;
    merged.eng = base.eng.empty() ? fallback.eng : base.eng;
    merged.ar = base.ar.empty() ? fallback.ar : base.ar;
    return merged;
}

LotList MetadataMerger::MergeLots(const LotList& base, const LotList& fallback) {
    if (base.empty()) return fallback;
    if (fallback.empty()) return base;

    std::map<std::string, const Lot*> byNumber;
    for (const auto& lot : fallback) {
        if (auto key = LotKey(lot)) byNumber.emplace(*key, &lot);
    }

    LotList merged;
    merged.reserve(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        Lot out = base[i];

        const Lot* match = nullptr;
        auto key = LotKey(out);
        if (key && byNumber.count(*key)) {
            match = byNumber.at(*key);
        } else if (i < fallback.size()) {
            match = &fallback[i];
        }

        if (match) {
            FillLot(out, *match);
            // A number taken from a positional match must resolve to the same lot on a later merge.
            if (!key) {
                auto filled = LotKey(out);
                auto indexed = filled ? byNumber.find(*filled) : byNumber.end();
                if (indexed != byNumber.end() && indexed->second != match) FillLot(out, *indexed->second);
            }
        }
        merged.push_back(std::move(out));
    }
    return merged;
}

MetadataRecord MetadataMerger::Merge(const MetadataRecord& base, const MetadataRecord& fallback) {
    if (base.empty()) return fallback;
    if (fallback.empty()) return base;

    MetadataRecord out = base;

    for (const auto& [name, fallbackValue] : fallback.fields()) {
        const FieldValue* baseValue = base.find(name);
        if (!baseValue) {
            out.set(name, fallbackValue);
            continue;
        }

        // Same shape on both sides: apply the shape's rule. A shape mismatch keeps the base.
        if (const auto* baseTracked = std::get_if<TrackedValue>(baseValue)) {
            const auto* fallbackTracked = std::get_if<TrackedValue>(&fallbackValue);
            if (fallbackTracked && baseTracked->isMissing()) out.set(name, *fallbackTracked);
        } else if (const auto* baseDeadline = std::get_if<SubmissionDeadline>(baseValue)) {
            if (const auto* fallbackDeadline = std::get_if<SubmissionDeadline>(&fallbackValue)) {
                out.set(name, MergeDeadline(*baseDeadline, *fallbackDeadline));
            }
        } else if (const auto* baseKeywords = std::get_if<KeywordBuckets>(baseValue)) {
            if (const auto* fallbackKeywords = std::get_if<KeywordBuckets>(&fallbackValue)) {
                out.set(name, MergeKeywords(*baseKeywords, *fallbackKeywords));
            }
        } else if (const auto* baseLots = std::get_if<LotList>(baseValue)) {
            if (const auto* fallbackLots = std::get_if<LotList>(&fallbackValue)) {
                out.set(name, MergeLots(*baseLots, *fallbackLots));
            }
        }
    }
    return out;
}

} // namespace tenderlens::application
