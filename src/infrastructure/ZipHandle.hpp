/**
 * @file ZipHandle.hpp
 * @brief RAII ownership of a libzip archive plus bounded entry reads.
 */

#pragma once
#include <string>
#include <cstdint>
#include <zip.h>
#include "domain/ArchiveManifest.hpp"

namespace filegate::infrastructure {

/**
 * @class ZipHandle
 * @brief Owns a zip_t. Changes are written only by commit(); otherwise they are discarded.
 */
class ZipHandle {
public:
    ZipHandle() = default;
    explicit ZipHandle(zip_t* archive) : m_archive(archive) {}
    ~ZipHandle();

    ZipHandle(const ZipHandle&) = delete;
    ZipHandle& operator=(const ZipHandle&) = delete;
    ZipHandle(ZipHandle&& other) noexcept;
    ZipHandle& operator=(ZipHandle&& other) noexcept;

    /** @brief Opens @p path with libzip @p flags; @p error receives libzip's message on failure. */
    static ZipHandle Open(const std::string& path, int flags, std::string& error);

    zip_t* get() const { return m_archive; }
    explicit operator bool() const { return m_archive != nullptr; }

    /**
     * @brief Writes pending changes (zip_close).
     * @return False with @p error set if libzip could not rewrite the archive.
     */
    bool commit(std::string& error);

    /** @brief Classifies entry @p index from its name and Unix mode bits. */
    static domain::EntryKind EntryKindAt(zip_t* archive, zip_uint64_t index, const std::string& name);

    /** @brief Rejects absolute paths, drive prefixes and any ".." component. */
    static bool IsUnsafeEntryName(const std::string& name);

    enum class ReadStatus { Ok, LimitExceeded, Failed };

    /**
     * @brief Decompresses entry @p index into @p out, stopping once @p maxBytes is passed.
     * The limit counts actual bytes, not the size the directory declares.
     */
    static ReadStatus ReadEntry(zip_t* archive, zip_uint64_t index, std::uint64_t maxBytes,
                                std::string& out, std::string& error);

    /** @brief Decompresses only the first @p windowBytes of entry @p index. */
    static bool ReadPrefix(zip_t* archive, zip_uint64_t index, std::size_t windowBytes,
                           std::string& out, std::string& error);

    /** @brief Same as ReadEntry but streams into @p destPath; @p written receives the byte count. */
    static ReadStatus ExtractEntry(zip_t* archive, zip_uint64_t index, std::uint64_t maxBytes,
                                   const std::string& destPath, std::uint64_t& written, std::string& error);

private:
    zip_t* m_archive = nullptr;
};

} // namespace filegate::infrastructure
