/**
 * @file ScopedWorkArea.hpp
 * @brief Scoped ownership of temporary directories and produced files.
 */

#pragma once
#include <string>
#include <filesystem>

namespace filegate::infrastructure {

/**
 * @class ScopedWorkArea
 * @brief Creates a unique private directory and removes it with everything inside on destruction.
 */
class ScopedWorkArea {
public:
    /**
     * @param baseDir Parent directory; the system temp directory when empty.
     * @param tag Short prefix for the directory name.
     */
    ScopedWorkArea(const std::string& baseDir, const std::string& tag);
    ~ScopedWorkArea();

    ScopedWorkArea(const ScopedWorkArea&) = delete;
    ScopedWorkArea& operator=(const ScopedWorkArea&) = delete;

    /** @brief False if the directory could not be created. */
    bool valid() const { return !m_path.empty(); }

    const std::filesystem::path& path() const { return m_path; }

    /** @brief Path for a new file inside the area. Names are generated, never taken from input. */
    std::filesystem::path file(const std::string& suffix);

private:
    std::filesystem::path m_path;
    unsigned m_counter = 0;
};

/**
 * @class ScopedArtifact
 * @brief Deletes a produced file unless ownership is released to the caller.
 */
class ScopedArtifact {
public:
    ScopedArtifact() = default;
    explicit ScopedArtifact(std::string path) : m_path(std::move(path)) {}
    ~ScopedArtifact() { reset(); }

    ScopedArtifact(const ScopedArtifact&) = delete;
    ScopedArtifact& operator=(const ScopedArtifact&) = delete;
    ScopedArtifact(ScopedArtifact&& other) noexcept : m_path(std::move(other.m_path)) { other.m_path.clear(); }
    ScopedArtifact& operator=(ScopedArtifact&& other) noexcept;

    const std::string& path() const { return m_path; }
    bool empty() const { return m_path.empty(); }

    /** @brief Hands the file to the caller; it will no longer be deleted. */
    std::string release();

    /** @brief Deletes the file now. */
    void reset();

private:
    std::string m_path;
};

/** @brief Unique file path under @p dir built from a timestamp and counter. */
std::filesystem::path UniquePath(const std::filesystem::path& dir, const std::string& stem, const std::string& suffix);

/**
 * @brief Moves @p from to @p to, falling back to copy and remove across filesystems.
 * @return False with @p error set if @p to was not written; @p from is then left in place.
 */
bool MoveFile(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error);

} // namespace filegate::infrastructure
