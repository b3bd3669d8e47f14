#include "infrastructure/LegacyDocReader.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/wait.h>

#include "infrastructure/TextUtils.hpp"

namespace tenderlens::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr int kNotFoundExitCode = 127;

bool IsRunSpace(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v' ||
           cp == 0x85 || cp == 0xA0;
}

bool IsRunChar(char32_t cp, LegacyDocReader::Mode mode) {
    if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z')) return true;
    if (cp >= 0xC0 && cp <= 0xFF) return true;
    if (IsRunSpace(cp)) return true;
    if (mode == LegacyDocReader::Mode::Full) {
        if (cp >= U'0' && cp <= U'9') return true;
        switch (cp) {
            case U'.': case U',': case U';': case U':': case U'-': case U'(': case U')':
                return true;
            default:
                break;
        }
    }
    return false;
}

/** Decodes like errors='ignore': invalid UTF-8 bytes vanish instead of splitting runs. */
std::u32string DecodeIgnoringErrors(const std::string& bytes) {
    std::u32string out;
    for (char32_t cp : TextUtils::DecodeUtf8(bytes)) {
        if (cp != 0xFFFD) out.push_back(cp);
    }
    return out;
}

std::string CollapseRuns(const std::u32string& decoded, LegacyDocReader::Mode mode) {
    std::u32string joined;
    std::u32string run;
    auto flush = [&]() {
        if (run.size() >= 4) {
            if (!joined.empty()) joined.push_back(U' ');
            joined += run;
        }
        run.clear();
    };
    for (char32_t cp : decoded) {
        if (IsRunChar(cp, mode)) run.push_back(cp);
        else flush();
    }
    flush();

    // Collapse whitespace and trim.
    std::u32string collapsed;
    bool pendingSpace = false;
    for (char32_t cp : joined) {
        if (IsRunSpace(cp)) {
            pendingSpace = !collapsed.empty();
            continue;
        }
        if (pendingSpace) collapsed.push_back(U' ');
        pendingSpace = false;
        collapsed.push_back(cp);
    }
    return TextUtils::EncodeUtf8(collapsed);
}

} // namespace

std::string LegacyDocReader::RunCommand(const std::string& cmd, int& exitCode) {
    std::string output;
    exitCode = -1;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return output;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
    }
    return output;
}

bool LegacyDocReader::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

bool LegacyDocReader::HasConverter() {
    static const bool available = HasTool("antiword") && HasTool("timeout");
    return available;
}

std::string LegacyDocReader::GetTempFilePath(const std::string& suffix) {
    static std::atomic<unsigned long> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "tenderlens_" + std::to_string(now) + "_" + std::to_string(counter++) + suffix;
    return (fs::temp_directory_path() / name).string();
}

std::optional<std::string> LegacyDocReader::RunConverter(const std::string& bytes, int timeoutSeconds, std::string& failure) {
    if (!HasConverter()) {
        failure = "antiword not installed";
        return std::nullopt;
    }

    const std::string tempPath = GetTempFilePath(".doc");
    {
        std::ofstream out(tempPath, std::ios::binary);
        if (!out.is_open()) {
            failure = "cannot write temp file " + tempPath;
            return std::nullopt;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (out.fail()) {
            failure = "cannot write temp file " + tempPath;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return std::nullopt;
        }
    }

    const std::string cmd = "timeout --kill-after=5 " + std::to_string(timeoutSeconds) +
                            " antiword \"" + tempPath + "\" 2>/dev/null";
    int exitCode = -1;
    std::string output = RunCommand(cmd, exitCode);

    std::error_code ec;
    fs::remove(tempPath, ec);

    if (exitCode == kTimeoutExitCode) {
        failure = "antiword timed out after " + std::to_string(timeoutSeconds) + "s";
        return std::nullopt;
    }
    if (exitCode == kNotFoundExitCode) {
        failure = "antiword not found";
        return std::nullopt;
    }
    if (exitCode != 0) {
        failure = "antiword exited with code " + std::to_string(exitCode);
        return std::nullopt;
    }
    if (TextUtils::IsBlank(output)) {
        failure = "antiword produced no text";
        return std::nullopt;
    }
    return TextUtils::SanitizeUtf8(output);
}

std::optional<std::string> LegacyDocReader::ScrapePrintableRuns(const std::string& bytes, Mode mode) {
    const std::size_t threshold = mode == Mode::Sample ? 50 : 100;

    const std::u32string decodings[] = {
        DecodeIgnoringErrors(bytes),
        TextUtils::DecodeUtf8(TextUtils::Latin1ToUtf8(bytes)),
        TextUtils::DecodeUtf8(TextUtils::Cp1252ToUtf8(bytes)),
    };

    for (const auto& decoded : decodings) {
        std::string text = CollapseRuns(decoded, mode);
        if (TextUtils::Utf8Length(text) > threshold) {
            if (mode == Mode::Sample) return TextUtils::Utf8Prefix(text, 1000);
            return text;
        }
    }
    return std::nullopt;
}

} // namespace tenderlens::infrastructure
