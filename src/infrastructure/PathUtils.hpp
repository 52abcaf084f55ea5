// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace filegate::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    static std::filesystem::path GetSettingsFile();
    static std::filesystem::path GetQuarantineDir();
    static std::filesystem::path GetArtifactDir();
    static std::filesystem::path GetStorageDir();
    static std::filesystem::path GetWorkDir();
    static std::filesystem::path GetAuditLog();
};

} // namespace filegate::infrastructure
