#include "ScanCoverageControl.h"
#include "../summarizers/VulnerabilitySummarizer.h"

namespace compliance_gate {

ControlVerdict ScanCoverageControl::evaluate(const Evidence& ev) const {
    const auto& fs = ev.artifacts.trivy_fs;
    const auto& image = ev.artifacts.trivy_image;

    std::string issues;
    for(const auto* a : { &fs, &image }){
        if(auto problem = describe_artifact_problem(*a)){
            if(!issues.empty()) issues += "; ";
            issues += *problem;
        }
    }
    if(!issues.empty()) return { id(), ControlStatus::Fail, issues };

    const auto& fs_summary = ev.artifacts.trivy_fs_summary;
    const auto& image_summary = ev.artifacts.trivy_image_summary;
    std::string fs_text = fs_summary ? VulnerabilitySummarizer::format("FS", *fs_summary)
                                     : "Trivy FS: summary unavailable (unexpected JSON structure)";
    std::string image_text = image_summary ? VulnerabilitySummarizer::format("Image", *image_summary)
                                           : "Trivy image: summary unavailable (unexpected JSON structure)";
    return { id(), ControlStatus::Pass,
             fs.name + " and " + image.name + " present and valid. " + fs_text + "; " + image_text };
}

}
