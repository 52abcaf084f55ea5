/**
 * @file ArtifactSink.hpp
 * @brief Interface for the storage collaborator that receives admitted files.
 */

#pragma once
#include <string>
#include <optional>
#include "domain/Verdict.hpp"

namespace filegate::domain {

/**
 * @class ArtifactSink
 * @brief Persists admitted artifacts. Access control is the sink's own concern.
 */
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    /**
     * @brief Takes ownership of @p artifactPath together with its verdict.
     * @return Storage reference, or nullopt if persisting failed.
     */
    virtual std::optional<std::string> store(const std::string& artifactPath, const Verdict& verdict) = 0;
};

} // namespace filegate::domain
