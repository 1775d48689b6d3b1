#pragma once
#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace compliance_gate {

// Vulnerability severities, worst first. Order drives every rendered histogram.
enum class Severity { Critical=0, High=1, Medium=2, Low=3, Unknown=4 };

inline constexpr std::array<Severity,5> kAllSeverities = {
    Severity::Critical, Severity::High, Severity::Medium, Severity::Low, Severity::Unknown };

const char* severity_to_string(Severity s);

// Case-insensitive; anything unrecognized maps to Unknown.
Severity severity_from_string(const std::string& label);

struct VulnerabilitySummary {
    std::size_t total = 0; // always the sum of counts
    std::array<std::size_t,5> counts{};

    std::size_t count(Severity s) const { return counts[static_cast<size_t>(s)]; }
    void add(Severity s){ ++counts[static_cast<size_t>(s)]; ++total; }
};

// Level histogram of an image-hardening scan. Keys are uppercased level names.
struct HardeningSummary {
    std::map<std::string, std::size_t> counts;

    std::size_t count(const std::string& level) const {
        auto it = counts.find(level);
        return it == counts.end() ? 0 : it->second;
    }
};

}
