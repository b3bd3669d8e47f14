// TextUtils Header
#pragma once
#include <string>
#include <vector>

namespace tenderlens::infrastructure {

/**
 * @class TextUtils
 * @brief UTF-8 helpers shared by the readers and the heuristics.
 *
 * Lengths are counted in code points, never bytes.
 */
class TextUtils {
public:
    static std::size_t Utf8Length(const std::string& text);
    /** @brief First @p maxChars code points of @p text. */
    static std::string Utf8Prefix(const std::string& text, std::size_t maxChars);

    static std::string Trim(const std::string& text);
    static bool IsBlank(const std::string& text);

    /** @brief Lower-cases ASCII and the Latin-1 supplement (À-Þ). Other scripts pass through. */
    static std::string ToLower(const std::string& text);

    /** @brief Decodes permissively; every invalid sequence becomes U+FFFD. */
    static std::string SanitizeUtf8(const std::string& bytes);
    static std::string Latin1ToUtf8(const std::string& bytes);
    static std::string Cp1252ToUtf8(const std::string& bytes);

    static std::u32string DecodeUtf8(const std::string& text);
    static std::string EncodeUtf8(const std::u32string& codePoints);
    static void AppendUtf8(std::string& out, char32_t codePoint);

    /** @brief Code points in the Arabic block U+0600-U+06FF. */
    static std::size_t CountArabicLetters(const std::string& text);
    /** @brief ASCII letters a-z, A-Z. */
    static std::size_t CountLatinLetters(const std::string& text);

    static std::vector<std::string> SplitWords(const std::string& text);
    /** @brief First @p count whitespace-separated words joined by single spaces. */
    static std::string FirstWords(const std::string& text, std::size_t count);

    static std::string Join(const std::vector<std::string>& parts, const std::string& separator);
};

} // namespace tenderlens::infrastructure
