/**
 * @file CandidateFile.hpp
 * @brief Domain entity representing an untrusted upload awaiting a decision.
 */

#pragma once
#include <string>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace filegate::domain {

/**
 * @class CandidateFile
 * @brief Read-only byte source plus the metadata the uploader claimed for it.
 *
 * Every field except @ref path is caller supplied and therefore untrusted.
 */
class CandidateFile {
public:
    std::string path;              ///< Location of the bytes on disk.
    std::string claimedName;       ///< Filename as uploaded.
    std::string claimedExtension;  ///< Lowercase, without the dot.
    std::uint64_t declaredSize;    ///< Size the uploader announced.
    std::string declaredMimeType;  ///< Informational only.

    CandidateFile() : declaredSize(0) {}

    /** @brief Builds a candidate deriving name and extension from the path. */
    static CandidateFile FromPath(const std::string& filePath, const std::string& name = "") {
        CandidateFile c;
        c.path = filePath;
        c.claimedName = name.empty() ? std::filesystem::path(filePath).filename().string() : name;
        c.claimedExtension = ExtensionOf(c.claimedName);
        std::error_code ec;
        auto size = std::filesystem::file_size(filePath, ec);
        c.declaredSize = ec ? 0 : static_cast<std::uint64_t>(size);
        return c;
    }

    static std::string ExtensionOf(const std::string& filename) {
        std::string ext = std::filesystem::path(filename).extension().string();
        if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
        return ext;
    }
};

} // namespace filegate::domain
