#pragma once
#include "../core/Severity.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <variant>

namespace compliance_gate {

// Trivy JSON: { "Results": [ { "Vulnerabilities": [ { "Severity": "HIGH", ... } ] } ] }
class VulnerabilitySummarizer {
public:
    struct ResultsDocument { const nlohmann::json* results; };
    struct Unrecognized {};
    using Schema = std::variant<ResultsDocument, Unrecognized>;

    static Schema decode(const nlohmann::json& data);

    // nullopt when the document shape is not recognized; never a zero summary in that case.
    static std::optional<VulnerabilitySummary> summarize(const nlohmann::json& data);

    // "Trivy FS: total 3, CRITICAL: 1, HIGH: 2, MEDIUM: 0, LOW: 0, UNKNOWN: 0"
    static std::string format(const std::string& label, const VulnerabilitySummary& s);
};

}
