/**
 * @file ZipHandle.cpp
 * @brief Implementation of ZipHandle.
 */

#include "infrastructure/ZipHandle.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <sys/stat.h>

namespace filegate::infrastructure {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

struct ZipFileCloser {
    void operator()(zip_file_t* f) const { if (f) zip_fclose(f); }
};

template <typename Sink>
ZipHandle::ReadStatus Drain(zip_t* archive, zip_uint64_t index, std::uint64_t maxBytes,
                            std::uint64_t& total, std::string& error, Sink sink) {
    std::unique_ptr<zip_file_t, ZipFileCloser> file(zip_fopen_index(archive, index, 0));
    if (!file) {
        error = zip_strerror(archive);
        return ZipHandle::ReadStatus::Failed;
    }

    std::vector<char> chunk(kChunkSize);
    total = 0;
    while (true) {
        zip_int64_t n = zip_fread(file.get(), chunk.data(), chunk.size());
        if (n < 0) {
            error = zip_file_strerror(file.get());
            return ZipHandle::ReadStatus::Failed;
        }
        if (n == 0) break;
        total += static_cast<std::uint64_t>(n);
        if (total > maxBytes) {
            error = "Entry " + std::to_string(index) + " exceeds the extraction ceiling";
            return ZipHandle::ReadStatus::LimitExceeded;
        }
        if (!sink(chunk.data(), static_cast<std::size_t>(n))) {
            error = "Write failed while extracting entry " + std::to_string(index);
            return ZipHandle::ReadStatus::Failed;
        }
    }
    return ZipHandle::ReadStatus::Ok;
}

} // namespace

ZipHandle::~ZipHandle() {
    if (m_archive) {
        zip_discard(m_archive);
    }
}

ZipHandle::ZipHandle(ZipHandle&& other) noexcept : m_archive(other.m_archive) {
    other.m_archive = nullptr;
}

ZipHandle& ZipHandle::operator=(ZipHandle&& other) noexcept {
    if (this != &other) {
        if (m_archive) zip_discard(m_archive);
        m_archive = other.m_archive;
        other.m_archive = nullptr;
    }
    return *this;
}

ZipHandle ZipHandle::Open(const std::string& path, int flags, std::string& error) {
    int code = 0;
    zip_t* archive = zip_open(path.c_str(), flags, &code);
    if (!archive) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, code);
        error = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        return ZipHandle();
    }
    return ZipHandle(archive);
}

bool ZipHandle::commit(std::string& error) {
    if (!m_archive) {
        error = "Archive is not open";
        return false;
    }
    if (zip_close(m_archive) != 0) {
        error = zip_strerror(m_archive);
        zip_discard(m_archive);
        m_archive = nullptr;
        return false;
    }
    m_archive = nullptr;
    return true;
}

domain::EntryKind ZipHandle::EntryKindAt(zip_t* archive, zip_uint64_t index, const std::string& name) {
    zip_uint8_t opsys = 0;
    zip_uint32_t attributes = 0;
    if (zip_file_get_external_attributes(archive, index, 0, &opsys, &attributes) == 0 &&
        opsys == ZIP_OPSYS_UNIX) {
        auto mode = static_cast<mode_t>(attributes >> 16);
        if (S_ISLNK(mode)) return domain::EntryKind::Symlink;
        if (S_ISDIR(mode)) return domain::EntryKind::Directory;
    }
    if (!name.empty() && name.back() == '/') return domain::EntryKind::Directory;
    return domain::EntryKind::File;
}

bool ZipHandle::IsUnsafeEntryName(const std::string& name) {
    if (name.empty()) return true;
    if (name.front() == '/' || name.front() == '\\') return true;
    if (name.size() >= 2 && name[1] == ':') return true;

    std::size_t start = 0;
    while (start <= name.size()) {
        std::size_t end = name.find_first_of("/\\", start);
        if (end == std::string::npos) end = name.size();
        if (name.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }
    return false;
}

ZipHandle::ReadStatus ZipHandle::ReadEntry(zip_t* archive, zip_uint64_t index, std::uint64_t maxBytes,
                                           std::string& out, std::string& error) {
    out.clear();
    std::uint64_t total = 0;
    return Drain(archive, index, maxBytes, total, error, [&out](const char* data, std::size_t n) {
        out.append(data, n);
        return true;
    });
}

bool ZipHandle::ReadPrefix(zip_t* archive, zip_uint64_t index, std::size_t windowBytes,
                           std::string& out, std::string& error) {
    std::unique_ptr<zip_file_t, ZipFileCloser> file(zip_fopen_index(archive, index, 0));
    if (!file) {
        error = zip_strerror(archive);
        return false;
    }
    out.assign(windowBytes, '\0');
    std::size_t filled = 0;
    while (filled < windowBytes) {
        zip_int64_t n = zip_fread(file.get(), &out[filled], windowBytes - filled);
        if (n < 0) {
            error = zip_file_strerror(file.get());
            return false;
        }
        if (n == 0) break;
        filled += static_cast<std::size_t>(n);
    }
    out.resize(filled);
    return true;
}

ZipHandle::ReadStatus ZipHandle::ExtractEntry(zip_t* archive, zip_uint64_t index, std::uint64_t maxBytes,
                                              const std::string& destPath, std::uint64_t& written,
                                              std::string& error) {
    std::ofstream dest(destPath, std::ios::binary | std::ios::trunc);
    if (!dest.is_open()) {
        error = "Cannot create " + destPath;
        return ReadStatus::Failed;
    }
    return Drain(archive, index, maxBytes, written, error, [&dest](const char* data, std::size_t n) {
        dest.write(data, static_cast<std::streamsize>(n));
        return static_cast<bool>(dest);
    });
}

} // namespace filegate::infrastructure
