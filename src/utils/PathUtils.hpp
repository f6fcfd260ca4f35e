#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace collector::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) return fs::path(xdg);
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getCollectorPath() {
        return getAppDataPath() / "Collector";
    }

    static fs::path getConfigPath() {
        return getCollectorPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getCollectorPath() / "logs";
    }

    /**
     * Join an item key below a destination root.
     * Returns an empty path when the key would escape the root
     * (absolute key or a ".." component).
     */
    static fs::path resolveBelow(const fs::path& root, const std::string& relativeKey) {
        fs::path rel = fs::path(relativeKey).lexically_normal();
        if (rel.empty() || rel.is_absolute() || rel.has_root_name()) {
            return {};
        }
        for (const auto& part : rel) {
            if (part == "..") {
                return {};
            }
        }
        return root / rel;
    }
};

} // namespace collector::utils
