/**
 * @file VerdictJson.hpp
 * @brief JSON rendering of verdicts for the CLI, storage sidecars and the audit trail.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Verdict.hpp"

namespace filegate::infrastructure {

/** @brief ISO-8601 UTC rendering of a time point. */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json ScanOutcomeToJson(const domain::ScanOutcome& outcome);

/**
 * @brief Full verdict as a JSON object.
 *
 * The archive manifest is summarized (counts and totals), never listed entry by entry.
 */
nlohmann::json VerdictToJson(const domain::Verdict& verdict);

} // namespace filegate::infrastructure
