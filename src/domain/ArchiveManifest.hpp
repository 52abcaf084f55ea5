/**
 * @file ArchiveManifest.hpp
 * @brief Metadata-only view of a container's entries.
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace filegate::domain {

enum class EntryKind {
    File,
    Directory,
    Symlink
};

struct ArchiveEntry {
    std::string name;
    std::uint64_t compressedSize = 0;
    std::uint64_t uncompressedSize = 0;
    EntryKind kind = EntryKind::File;
};

/**
 * @struct ArchiveManifest
 * @brief Ordered entries as declared by the central directory, plus totals.
 */
struct ArchiveManifest {
    std::vector<ArchiveEntry> entries;
    std::uint64_t totalCompressed = 0;
    std::uint64_t totalUncompressed = 0;

    std::size_t entryCount() const { return entries.size(); }

    double expansionRatio() const {
        std::uint64_t denom = totalCompressed == 0 ? 1 : totalCompressed;
        return static_cast<double>(totalUncompressed) / static_cast<double>(denom);
    }
};

/**
 * @struct ArchiveError
 * @brief Structural reason an archive was refused.
 */
struct ArchiveError {
    enum class Kind {
        Malformed,
        TooManyEntries,
        TotalSizeExceeded,
        EntrySizeExceeded,
        ExpansionRatioExceeded
    };
    Kind kind = Kind::Malformed;
    std::string detail;

    /** @brief True for every kind except Malformed. */
    bool isBomb() const { return kind != Kind::Malformed; }

    static std::string KindToString(Kind k) {
        switch (k) {
            case Kind::Malformed: return "malformed";
            case Kind::TooManyEntries: return "too-many-entries";
            case Kind::TotalSizeExceeded: return "total-size-exceeded";
            case Kind::EntrySizeExceeded: return "entry-size-exceeded";
            case Kind::ExpansionRatioExceeded: return "expansion-ratio-exceeded";
        }
        return "malformed";
    }
};

/**
 * @struct ArchiveInspection
 * @brief Either a manifest or the error that stopped inspection.
 */
struct ArchiveInspection {
    std::optional<ArchiveManifest> manifest;
    std::optional<ArchiveError> error;

    bool ok() const { return manifest.has_value() && !error.has_value(); }

    static ArchiveInspection Success(ArchiveManifest m) {
        ArchiveInspection r;
        r.manifest = std::move(m);
        return r;
    }

    static ArchiveInspection Failure(ArchiveError::Kind kind, std::string detail) {
        ArchiveInspection r;
        r.error = ArchiveError{kind, std::move(detail)};
        return r;
    }
};

} // namespace filegate::domain
