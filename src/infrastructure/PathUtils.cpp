#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace tenderlens::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "tenderlens" / "settings.json";
}

fs::path PathUtils::ResolveSettingsPath(const std::string& explicitPath) {
    if (!explicitPath.empty()) return fs::path(explicitPath);

    std::error_code ec;
    fs::path local = fs::current_path(ec) / "settings.json";
    if (!ec && fs::exists(local, ec)) return local;
    return GetDefaultSettingsPath();
}

std::string PathUtils::SanitizeFileComponent(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out += (std::isalnum(c) || c == '.' || c == '_' || c == '-') ? static_cast<char>(c) : '_';
    }
    if (out.empty() || out == "." || out == "..") out = "_";
    return out;
}

} // namespace tenderlens::infrastructure
