#pragma once
#include "../core/Severity.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <variant>

namespace compliance_gate {

// Dockle JSON in any of the layouts seen in the wild:
//   [ { "level": "WARN", "details": [ { "level": "INFO" } ] } ]
//   { "summary": {...}, "details": [ { "code": "...", "level": "FATAL" } ] }
//   { "level": "PASS" }
class HardeningSummarizer {
public:
    struct FindingList { const nlohmann::json* items; };
    // At least one of the two pointers is set.
    struct Assessment { const nlohmann::json* details; const nlohmann::json* level; };
    struct Unrecognized {};
    using Schema = std::variant<FindingList, Assessment, Unrecognized>;

    static Schema decode(const nlohmann::json& data);

    // nullopt for an unrecognized layout; an empty histogram for a recognized layout without findings.
    static std::optional<HardeningSummary> summarize(const nlohmann::json& data);

    // "FATAL: 1, WARN: 2" (levels with a zero count omitted), or "no findings".
    static std::string format(const HardeningSummary& s);
};

}
