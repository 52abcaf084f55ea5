/**
 * @file ArchiveDisarmer.hpp
 * @brief Repacks ZIP archives without executable, unsafe or un-disarmable entries.
 */

#pragma once
#include <string>
#include <cstdint>
#include <functional>
#include "domain/DisarmResult.hpp"
#include "domain/FileFormat.hpp"
#include "domain/ScanConfig.hpp"
#include "domain/CancellationToken.hpp"

namespace filegate::infrastructure {

/**
 * @class ArchiveDisarmer
 * @brief Extracts entries into a private work area, filters them by content and repacks.
 */
class ArchiveDisarmer {
public:
    /**
     * @struct Budget
     * @brief Extraction allowance shared by an archive and everything nested in it.
     */
    struct Budget {
        std::uint64_t remainingBytes = 0;
        std::size_t remainingEntries = 0;

        static Budget FromLimits(const domain::ArchiveLimits& limits) {
            Budget b;
            b.remainingBytes = limits.maxTotalUncompressed;
            b.remainingEntries = limits.maxEntries;
            return b;
        }
    };

    /// Disarms an extracted nested entry of @p format into the given output path at @p depth.
    using NestedDisarm = std::function<domain::DisarmResult(const std::string& entryPath,
                                                            domain::FileFormat format,
                                                            const std::string& outputPath,
                                                            int depth)>;

    /**
     * @brief Writes a filtered copy of @p inputPath to @p outputPath.
     * @param depth Nesting level of this archive; 0 for the candidate itself.
     * @param budget Decremented by every extracted byte and entry.
     * @param nested Called for nested documents and archives.
     * @param cancel Checked before each entry.
     */
    static domain::DisarmResult Disarm(const std::string& inputPath, const std::string& outputPath,
                                       const domain::ArchiveLimits& limits, const std::string& workDir,
                                       int depth, Budget& budget, const NestedDisarm& nested,
                                       const domain::CancellationToken& cancel);
};

} // namespace filegate::infrastructure
