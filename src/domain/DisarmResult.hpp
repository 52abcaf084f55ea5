/**
 * @file DisarmResult.hpp
 * @brief Outcome of a neutralization attempt.
 */

#pragma once
#include <string>
#include <set>
#include <optional>

namespace filegate::domain {

enum class NeutralizationAction {
    RemovedJavaScript,
    RemovedAutomaticAction,
    RemovedLaunchAction,
    RemovedEmbeddedFile,
    RemovedRichMedia,
    RemovedXfaForm,
    RemovedFormSubmission,
    NormalizedObjectStreams,
    RemovedMacroProject,
    RemovedActiveXControl,
    RemovedEmbeddedObject,
    DowngradedMacroContentType,
    RemovedExecutableEntry,
    RemovedUnsafeEntryPath,
    RemovedSymlinkEntry,
    DisarmedNestedEntry
};

inline std::string ActionToString(NeutralizationAction a) {
    switch (a) {
        case NeutralizationAction::RemovedJavaScript: return "removed-javascript";
        case NeutralizationAction::RemovedAutomaticAction: return "removed-automatic-action";
        case NeutralizationAction::RemovedLaunchAction: return "removed-launch-action";
        case NeutralizationAction::RemovedEmbeddedFile: return "removed-embedded-file";
        case NeutralizationAction::RemovedRichMedia: return "removed-rich-media";
        case NeutralizationAction::RemovedXfaForm: return "removed-xfa-form";
        case NeutralizationAction::RemovedFormSubmission: return "removed-form-submission";
        case NeutralizationAction::NormalizedObjectStreams: return "normalized-object-streams";
        case NeutralizationAction::RemovedMacroProject: return "removed-macro-project";
        case NeutralizationAction::RemovedActiveXControl: return "removed-activex-control";
        case NeutralizationAction::RemovedEmbeddedObject: return "removed-embedded-object";
        case NeutralizationAction::DowngradedMacroContentType: return "downgraded-macro-content-type";
        case NeutralizationAction::RemovedExecutableEntry: return "removed-executable-entry";
        case NeutralizationAction::RemovedUnsafeEntryPath: return "removed-unsafe-entry-path";
        case NeutralizationAction::RemovedSymlinkEntry: return "removed-symlink-entry";
        case NeutralizationAction::DisarmedNestedEntry: return "disarmed-nested-entry";
    }
    return "unknown";
}

/**
 * @struct DisarmResult
 * @brief What a strategy did to one file.
 *
 * When @ref neutralizedArtifact is set it names a newly written file; the
 * original at @ref originalRef is never modified.
 */
struct DisarmResult {
    std::string originalRef;
    std::optional<std::string> neutralizedArtifact;
    std::set<NeutralizationAction> actions;
    bool success = false;
    std::string detail;

    static DisarmResult PassThrough(const std::string& original) {
        DisarmResult r;
        r.originalRef = original;
        r.success = true;
        return r;
    }

    static DisarmResult Failed(const std::string& original, const std::string& why) {
        DisarmResult r;
        r.originalRef = original;
        r.success = false;
        r.detail = why;
        return r;
    }
};

} // namespace filegate::domain
