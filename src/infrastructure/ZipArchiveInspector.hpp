/**
 * @file ZipArchiveInspector.hpp
 * @brief Metadata-only inspection of ZIP-family containers.
 */

#pragma once
#include <string>
#include "domain/ArchiveManifest.hpp"
#include "domain/ScanConfig.hpp"

namespace filegate::infrastructure {

/**
 * @class ZipArchiveInspector
 * @brief Walks the central directory without decompressing any entry body.
 *
 * Time and memory are bounded by MAX_ENTRIES regardless of what the
 * archive claims about its contents.
 */
class ZipArchiveInspector {
public:
    /**
     * @brief Builds the manifest and checks it against @p limits.
     * @return The manifest, or the first structural violation found.
     */
    static domain::ArchiveInspection Inspect(const std::string& path, const domain::ArchiveLimits& limits);
};

} // namespace filegate::infrastructure
