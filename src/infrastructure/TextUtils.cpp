#include "infrastructure/TextUtils.hpp"

#include <cctype>
#include <sstream>

namespace tenderlens::infrastructure {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// CP1252 differs from Latin-1 only in 0x80-0x9F. Undefined slots map to U+FFFD.
constexpr char32_t kCp1252High[32] = {
    0x20AC, 0xFFFD, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0xFFFD, 0x017D, 0xFFFD,
    0xFFFD, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0xFFFD, 0x017E, 0x0178
};

/**
 * Decodes one sequence starting at @p i. Returns the code point and advances @p i;
 * on an invalid sequence returns U+FFFD and advances by one byte.
 */
char32_t DecodeOne(const std::string& s, std::size_t& i, bool& valid) {
    const auto lead = static_cast<unsigned char>(s[i]);
    valid = true;
    if (lead < 0x80) {
        ++i;
        return lead;
    }

    std::size_t extra = 0;
    char32_t cp = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1F; minimum = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0F; minimum = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07; minimum = 0x10000; }
    else {
        valid = false;
        ++i;
        return kReplacement;
    }

    if (i + extra >= s.size()) {
        valid = false;
        ++i;
        return kReplacement;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(s[i + k]);
        if ((cont & 0xC0) != 0x80) {
            valid = false;
            ++i;
            return kReplacement;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        valid = false;
        ++i;
        return kReplacement;
    }
    i += extra + 1;
    return cp;
}

} // namespace

std::size_t TextUtils::Utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string TextUtils::Utf8Prefix(const std::string& text, std::size_t maxChars) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == maxChars) return text.substr(0, i);
            ++seen;
        }
    }
    return text;
}

std::string TextUtils::Trim(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    const auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    const auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

bool TextUtils::IsBlank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::string TextUtils::ToLower(const std::string& text) {
    std::string out = text;
    for (std::size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        if (c < 0x80) {
            out[i] = static_cast<char>(std::tolower(c));
        } else if (c == 0xC3 && i + 1 < out.size()) {
            // U+00C0..U+00DE map to U+00E0..U+00FE, except U+00D7 (multiplication sign).
            const auto next = static_cast<unsigned char>(out[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                out[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return out;
}

std::string TextUtils::SanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    bool valid = true;
    while (i < bytes.size()) {
        AppendUtf8(out, DecodeOne(bytes, i, valid));
    }
    return out;
}

std::string TextUtils::Latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) AppendUtf8(out, c);
    return out;
}

std::string TextUtils::Cp1252ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        if (c >= 0x80 && c <= 0x9F) AppendUtf8(out, kCp1252High[c - 0x80]);
        else AppendUtf8(out, c);
    }
    return out;
}

std::u32string TextUtils::DecodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    bool valid = true;
    while (i < text.size()) out.push_back(DecodeOne(text, i, valid));
    return out;
}

std::string TextUtils::EncodeUtf8(const std::u32string& codePoints) {
    std::string out;
    out.reserve(codePoints.size());
    for (char32_t cp : codePoints) AppendUtf8(out, cp);
    return out;
}

void TextUtils::AppendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::size_t TextUtils::CountArabicLetters(const std::string& text) {
    std::size_t count = 0;
    for (char32_t cp : DecodeUtf8(text)) {
        if (cp >= 0x0600 && cp <= 0x06FF) ++count;
    }
    return count;
}

std::size_t TextUtils::CountLatinLetters(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) ++count;
    }
    return count;
}

std::vector<std::string> TextUtils::SplitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}

std::string TextUtils::FirstWords(const std::string& text, std::size_t count) {
    auto words = SplitWords(text);
    if (words.size() > count) words.resize(count);
    return Join(words, " ");
}

std::string TextUtils::Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

} // namespace tenderlens::infrastructure
