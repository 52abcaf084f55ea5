/**
 * @file FormatClassifier.hpp
 * @brief Content-based format detection over a bounded leading window.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Classification.hpp"
#include "domain/ScanConfig.hpp"

namespace filegate::infrastructure {

/**
 * @class FormatClassifier
 * @brief Maps magic-byte prefixes to canonical formats. Never reads past the window.
 */
class FormatClassifier {
public:
    /**
     * @brief Reads at most @p windowBytes from the start of @p path.
     * @return The prefix, or nullopt if the file cannot be opened.
     */
    static std::optional<std::string> ReadPrefix(const std::string& path, std::size_t windowBytes);

    /** @brief Detects the format of @p prefix alone. Unknown is a valid answer. */
    static domain::FileFormat Detect(const std::string& prefix, double* confidence = nullptr);

    /**
     * @brief Full classification including the extension and MIME cross-checks.
     * @param prefix Leading bytes of the candidate.
     * @param claimedExtension Lowercase extension without dot.
     * @param declaredMimeType Uploader's MIME claim (may be empty).
     * @param config Supplies the per-extension expected-format table.
     */
    static domain::Classification Classify(const std::string& prefix,
                                           const std::string& claimedExtension,
                                           const std::string& declaredMimeType,
                                           const domain::ScanConfig& config);

    /** @brief Formats that must never be admitted from inside an archive. */
    static bool IsExecutable(domain::FileFormat format) {
        return format == domain::FileFormat::Executable;
    }

private:
    static bool LooksLikeText(const std::string& prefix);
    static bool LooksLikeOfficeOpenXml(const std::string& prefix);
};

} // namespace filegate::infrastructure
