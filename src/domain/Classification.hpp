/**
 * @file Classification.hpp
 * @brief Result of content-based format detection.
 */

#pragma once
#include "domain/FileFormat.hpp"

namespace filegate::domain {

/**
 * @struct Classification
 * @brief Produced once per candidate, immutable thereafter.
 */
struct Classification {
    FileFormat detectedFormat = FileFormat::Unknown;
    double confidence = 0.0;       ///< In [0, 1].
    bool extensionMatch = false;   ///< Claimed extension expects the detected format.
    bool mimeMismatch = false;     ///< Declared MIME disagrees; recorded, never decisive.
};

} // namespace filegate::domain
