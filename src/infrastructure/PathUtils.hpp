// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace tenderlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/tenderlens/settings.json (or ~/.config/...). */
    static std::filesystem::path GetDefaultSettingsPath();

    /**
     * @brief Settings file to use: @p explicitPath when given, else ./settings.json
     * when present, else the per-user default. The result may not exist.
     */
    static std::filesystem::path ResolveSettingsPath(const std::string& explicitPath);

    /** @brief Keeps [A-Za-z0-9._-], replaces everything else with '_'. */
    static std::string SanitizeFileComponent(const std::string& name);
};

} // namespace tenderlens::infrastructure
