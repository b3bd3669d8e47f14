/**
 * @file LegacyDocReader.hpp
 * @brief Text recovery from binary Word 97-2003 documents.
 */

#pragma once
#include <optional>
#include <string>

namespace tenderlens::infrastructure {

/**
 * @class LegacyDocReader
 * @brief antiword first, printable-run scraping second.
 */
class LegacyDocReader {
public:
    enum class Mode {
        Sample,  ///< Letters and whitespace only; accept above 50 chars, keep 1000.
        Full     ///< Also digits and .,;:-() ; accept above 100 chars.
    };

    /**
     * @brief Runs antiword on a temp copy of @p bytes under a hard wall-clock limit.
     * @param failure Receives the reason when nullopt is returned.
     * @return stdout when the converter exits 0 with non-blank output.
     */
    static std::optional<std::string> RunConverter(const std::string& bytes, int timeoutSeconds, std::string& failure);

    /**
     * @brief Joins runs of at least 4 allowed characters, trying UTF-8, Latin-1 and CP1252 in turn.
     * @return The first decoding whose cleaned text clears the threshold for @p mode.
     */
    static std::optional<std::string> ScrapePrintableRuns(const std::string& bytes, Mode mode);

    static bool HasConverter();

private:
    static std::string RunCommand(const std::string& cmd, int& exitCode);
    static bool HasTool(const std::string& tool);
    static std::string GetTempFilePath(const std::string& suffix);
};

} // namespace tenderlens::infrastructure
