/**
 * @file PdfDisarmer.hpp
 * @brief Neutralizes script and automation objects in PDF documents.
 */

#pragma once
#include <string>
#include <map>
#include <cstdint>
#include "domain/DisarmResult.hpp"

namespace filegate::infrastructure {

/**
 * @class PdfDisarmer
 * @brief Rewrites active PDF names in place so that readers no longer recognize them.
 *
 * Each active name token is replaced by its lower-cased decoded spelling,
 * padded with spaces to the original width. File length and every object
 * offset stay identical, so the cross-reference table and the page content
 * streams are preserved byte for byte.
 */
class PdfDisarmer {
public:
    struct Options {
        bool normalizeWithQpdf = true;
        std::uint64_t maxInflatedBytes = 64ULL * 1024 * 1024;
        std::string workDir;
    };

    /**
     * @struct Inspection
     * @brief Active content found in a PDF body.
     */
    struct Inspection {
        std::map<std::string, int> activeNames;   ///< Decoded name -> occurrences outside object streams.
        int hiddenInObjectStreams = 0;            ///< Active names inside compressed object streams.
        bool encrypted = false;
        bool wellFormed = true;
        std::string problem;

        /** @brief Number of /JavaScript and /JS names: script objects still reachable. */
        int scriptObjectCount() const;
        bool clean() const { return activeNames.empty() && hiddenInObjectStreams == 0; }
    };

    /** @brief Inspects a PDF held in memory without changing it. */
    static Inspection Inspect(const std::string& data, std::uint64_t maxInflatedBytes);

    /**
     * @brief Writes a neutralized copy of @p inputPath to @p outputPath.
     *
     * When nothing active is present no file is written and the result is a
     * pass-through. Any state where active content might survive is a failure.
     */
    static domain::DisarmResult Disarm(const std::string& inputPath, const std::string& outputPath,
                                       const Options& options);

private:
    static domain::DisarmResult DisarmOnce(const std::string& inputPath, const std::string& outputPath,
                                           const Options& options, bool allowNormalization);
    static domain::DisarmResult NormalizeAndDisarm(const std::string& inputPath, const std::string& outputPath,
                                                   const Options& options);
};

} // namespace filegate::infrastructure
