/**
 * @file CategoryHeuristics.hpp
 * @brief Filename and keyword rules that assign a document category.
 */

#pragma once
#include <string>
#include "domain/DocumentCategory.hpp"

namespace tenderlens::application {

/**
 * @class CategoryHeuristics
 * @brief Deterministic, side-effect free category rules.
 *
 * Filename rules run first and win; content keywords are only consulted for
 * AVIS, RC, CPS and ANNEXE. The tables are ordered and the order is part of
 * the behaviour: the first rule that matches decides.
 */
class CategoryHeuristics {
public:
    /** @brief Category from the lower-cased basename, Unknown when no rule matches. */
    static domain::DocumentCategory FromFilename(const std::string& filename);

    /** @brief Category from keywords found in @p text, Unknown when none is found. */
    static domain::DocumentCategory FromContent(const std::string& text);

    /** @brief FromFilename, then FromContent. */
    static domain::DocumentCategory Classify(const std::string& filename, const std::string& text);

    /** @brief Basename of @p filename (both separators), lower-cased. */
    static std::string NormalizedBasename(const std::string& filename);
};

} // namespace tenderlens::application
