#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace filegate::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDir = "FileGate";

fs::path XdgOr(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}
}

fs::path PathUtils::GetDataHome() {
    return XdgOr("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgOr("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return XdgOr("XDG_CACHE_HOME", ".cache");
}

// Directories are created by the components that write into them.
fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / kAppDir / "settings.json";
}

fs::path PathUtils::GetQuarantineDir() {
    return GetDataHome() / kAppDir / "quarantine";
}

fs::path PathUtils::GetArtifactDir() {
    return GetDataHome() / kAppDir / "artifacts";
}

fs::path PathUtils::GetStorageDir() {
    return GetDataHome() / kAppDir / "storage";
}

fs::path PathUtils::GetWorkDir() {
    return GetCacheHome() / kAppDir / "work";
}

fs::path PathUtils::GetAuditLog() {
    return GetDataHome() / kAppDir / "audit.jsonl";
}

} // namespace filegate::infrastructure
