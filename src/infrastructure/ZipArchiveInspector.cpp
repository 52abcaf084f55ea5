/**
 * @file ZipArchiveInspector.cpp
 * @brief Implementation of ZipArchiveInspector.
 */

#include "infrastructure/ZipArchiveInspector.hpp"
#include "infrastructure/ZipHandle.hpp"
#include <zip.h>
#include <iostream>
#include <sstream>

namespace filegate::infrastructure {

using domain::ArchiveError;
using domain::ArchiveInspection;

domain::ArchiveInspection ZipArchiveInspector::Inspect(const std::string& path, const domain::ArchiveLimits& limits) {
    std::string openError;
    ZipHandle archive = ZipHandle::Open(path, ZIP_RDONLY | ZIP_CHECKCONS, openError);
    if (!archive) {
        return ArchiveInspection::Failure(ArchiveError::Kind::Malformed, "Cannot open archive: " + openError);
    }

    zip_int64_t count = zip_get_num_entries(archive.get(), 0);
    if (count < 0) {
        return ArchiveInspection::Failure(ArchiveError::Kind::Malformed, "Unreadable central directory");
    }
    // Count first: bounds everything that follows.
    if (static_cast<std::uint64_t>(count) > limits.maxEntries) {
        std::stringstream ss;
        ss << count << " entries exceed the limit of " << limits.maxEntries;
        return ArchiveInspection::Failure(ArchiveError::Kind::TooManyEntries, ss.str());
    }

    domain::ArchiveManifest manifest;
    manifest.entries.reserve(static_cast<std::size_t>(count));

    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(i), 0, &st) != 0) {
            return ArchiveInspection::Failure(ArchiveError::Kind::Malformed,
                                              "Cannot stat entry " + std::to_string(i));
        }
        if (!(st.valid & ZIP_STAT_NAME) || !(st.valid & ZIP_STAT_SIZE) || !(st.valid & ZIP_STAT_COMP_SIZE)) {
            return ArchiveInspection::Failure(ArchiveError::Kind::Malformed,
                                              "Incomplete directory record for entry " + std::to_string(i));
        }

        domain::ArchiveEntry entry;
        entry.name = st.name;
        entry.compressedSize = st.comp_size;
        entry.uncompressedSize = st.size;
        entry.kind = ZipHandle::EntryKindAt(archive.get(), static_cast<zip_uint64_t>(i), entry.name);

        if (entry.uncompressedSize > limits.maxTotalUncompressed) {
            return ArchiveInspection::Failure(ArchiveError::Kind::EntrySizeExceeded,
                                              "Entry '" + entry.name + "' declares " +
                                              std::to_string(entry.uncompressedSize) + " bytes");
        }
        if (manifest.totalUncompressed > limits.maxTotalUncompressed - entry.uncompressedSize) {
            return ArchiveInspection::Failure(ArchiveError::Kind::TotalSizeExceeded,
                                              "Declared uncompressed total exceeds " +
                                              std::to_string(limits.maxTotalUncompressed) + " bytes");
        }
        manifest.totalUncompressed += entry.uncompressedSize;
        manifest.totalCompressed += entry.compressedSize;
        manifest.entries.push_back(std::move(entry));
    }

    if (manifest.expansionRatio() > limits.maxExpansionRatio) {
        std::stringstream ss;
        ss << "Expansion ratio " << manifest.expansionRatio() << " exceeds " << limits.maxExpansionRatio;
        return ArchiveInspection::Failure(ArchiveError::Kind::ExpansionRatioExceeded, ss.str());
    }

    return ArchiveInspection::Success(std::move(manifest));
}

} // namespace filegate::infrastructure
