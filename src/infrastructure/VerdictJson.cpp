#include "infrastructure/VerdictJson.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace filegate::infrastructure {

using json = nlohmann::json;

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

json ScanOutcomeToJson(const domain::ScanOutcome& outcome) {
    json j;
    if (auto* inf = std::get_if<domain::scan::Infected>(&outcome)) {
        j["status"] = "infected";
        j["signature"] = inf->signatureName;
    } else if (auto* un = std::get_if<domain::scan::ScanUnavailable>(&outcome)) {
        j["status"] = "unavailable";
        j["reason"] = un->reason;
    } else {
        j["status"] = "clean";
    }
    return j;
}

json VerdictToJson(const domain::Verdict& v) {
    json j;
    j["decision"] = domain::DecisionToString(v.decision);
    j["reason"] = domain::ReasonToString(v.reason);
    j["detail"] = v.detail;
    j["candidate"] = v.candidateName;
    j["decided_at"] = FormatTimestamp(v.decidedAt);
    j["scanner_unavailable"] = v.scannerUnavailable;

    j["classification"] = {
        {"format", domain::FormatToString(v.classification.detectedFormat)},
        {"confidence", v.classification.confidence},
        {"extension_match", v.classification.extensionMatch},
        {"mime_mismatch", v.classification.mimeMismatch}
    };

    if (v.archive) {
        j["archive"] = {
            {"entries", v.archive->entryCount()},
            {"total_compressed", v.archive->totalCompressed},
            {"total_uncompressed", v.archive->totalUncompressed},
            {"expansion_ratio", v.archive->expansionRatio()}
        };
    } else {
        j["archive"] = nullptr;
    }
    j["pre_scan"] = v.preScan ? ScanOutcomeToJson(*v.preScan) : json(nullptr);
    j["post_scan"] = v.postScan ? ScanOutcomeToJson(*v.postScan) : json(nullptr);

    if (v.disarm) {
        json actions = json::array();
        for (auto action : v.disarm->actions) {
            actions.push_back(domain::ActionToString(action));
        }
        j["disarm"] = {
            {"success", v.disarm->success},
            {"actions", actions},
            {"detail", v.disarm->detail}
        };
    } else {
        j["disarm"] = nullptr;
    }

    if (v.quarantined) {
        j["quarantine"] = {{"id", v.quarantined->id}, {"location", v.quarantined->location}};
    } else {
        j["quarantine"] = nullptr;
    }
    j["stored_artifact"] = v.storedArtifact ? json(*v.storedArtifact) : json(nullptr);
    return j;
}

} // namespace filegate::infrastructure
