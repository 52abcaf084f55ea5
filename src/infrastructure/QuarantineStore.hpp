/**
 * @file QuarantineStore.hpp
 * @brief Isolation directory for candidates that could not be neutralized.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/CandidateFile.hpp"
#include "domain/Verdict.hpp"

namespace filegate::infrastructure {

/**
 * @class QuarantineStore
 * @brief Moves candidates out of reach under a content-independent key.
 *
 * Files land at `<dir>/<sha256(original path)>.bin` next to a JSON sidecar
 * describing why they were isolated. A path quarantined again gets
 * `<key>-1`, `<key>-2`, ... so earlier copies are kept. Quarantined files are never executed
 * or opened again by FileGate.
 */
class QuarantineStore {
public:
    explicit QuarantineStore(std::string directory);

    /**
     * @brief Moves @p candidate into the store.
     * @param reason Reason code recorded in the sidecar.
     * @param detail Free-form explanation recorded in the sidecar.
     * @return Handle to the isolated copy, or nullopt if the move failed
     *         (the original is then left untouched).
     */
    std::optional<domain::QuarantineHandle> quarantine(const domain::CandidateFile& candidate,
                                                       domain::ReasonCode reason,
                                                       const std::string& detail);

    /** @brief Key under which @p originalPath is stored. */
    static std::string KeyFor(const std::string& originalPath);

    const std::string& directory() const { return m_directory; }

private:
    static constexpr int kMaxSlotsPerKey = 10000;

    std::optional<std::string> NextFreeKey(const std::string& key) const;

    std::string m_directory;
};

} // namespace filegate::infrastructure
