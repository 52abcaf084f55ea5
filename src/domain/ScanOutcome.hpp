/**
 * @file ScanOutcome.hpp
 * @brief Tagged result of a signature scan.
 */

#pragma once
#include <string>
#include <variant>

namespace filegate::domain {

namespace scan {

struct Clean {};

struct Infected {
    std::string signatureName;
};

/** @brief The scanner could not give an answer. Never equivalent to Clean. */
struct ScanUnavailable {
    std::string reason;
};

} // namespace scan

using ScanOutcome = std::variant<scan::Clean, scan::Infected, scan::ScanUnavailable>;

inline bool IsClean(const ScanOutcome& o) { return std::holds_alternative<scan::Clean>(o); }
inline bool IsInfected(const ScanOutcome& o) { return std::holds_alternative<scan::Infected>(o); }
inline bool IsUnavailable(const ScanOutcome& o) { return std::holds_alternative<scan::ScanUnavailable>(o); }

inline std::string DescribeOutcome(const ScanOutcome& o) {
    if (auto* inf = std::get_if<scan::Infected>(&o)) {
        return "infected:" + inf->signatureName;
    }
    if (auto* un = std::get_if<scan::ScanUnavailable>(&o)) {
        return "unavailable:" + un->reason;
    }
    return "clean";
}

} // namespace filegate::domain
