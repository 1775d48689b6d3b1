#include "NoCriticalVulnsControl.h"
#include "../summarizers/VulnerabilitySummarizer.h"

namespace compliance_gate {

ControlVerdict NoCriticalVulnsControl::evaluate(const Evidence& ev) const {
    const auto& set = ev.artifacts;
    std::string problems;
    if(!set.trivy_fs.found || !set.trivy_fs.parsed) problems = "Trivy FS scan missing or invalid";
    if(!set.trivy_image.found || !set.trivy_image.parsed){
        if(!problems.empty()) problems += "; ";
        problems += "Trivy image scan missing or invalid";
    }
    if(!problems.empty()) return { id(), ControlStatus::Fail, problems };

    if(!set.trivy_fs_summary || !set.trivy_image_summary){
        return { id(), ControlStatus::Fail, "Unable to interpret Trivy JSON structure to count vulnerabilities" };
    }

    std::size_t critical = set.trivy_fs_summary->count(Severity::Critical) + set.trivy_image_summary->count(Severity::Critical);
    std::string counts = VulnerabilitySummarizer::format("FS", *set.trivy_fs_summary) + "; "
                       + VulnerabilitySummarizer::format("Image", *set.trivy_image_summary);
    if(critical > 0) return { id(), ControlStatus::Fail, "CRITICAL vulnerabilities detected. " + counts };
    return { id(), ControlStatus::Pass, "No CRITICAL vulnerabilities in Trivy scans. " + counts };
}

}
