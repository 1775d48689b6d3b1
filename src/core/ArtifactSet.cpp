#include "ArtifactSet.h"
#include "Logging.h"
#include "../summarizers/HardeningSummarizer.h"
#include "../summarizers/VulnerabilitySummarizer.h"

namespace compliance_gate {

std::vector<std::string> ArtifactSet::artifact_names(){
    return { artifacts::kGitleaks, artifacts::kTrivyFs, artifacts::kTrivyImage, artifacts::kDockle, artifacts::kSbom };
}

static ArtifactReadResult take(std::vector<ArtifactReadResult>& reads, const std::string& name){
    for(auto& r : reads){
        if(r.name == name) return std::move(r);
    }
    ArtifactReadResult missing;
    missing.name = name;
    missing.error = "File not found";
    return missing;
}

ArtifactSet ArtifactSet::build(std::vector<ArtifactReadResult> reads){
    ArtifactSet s;
    s.gitleaks = take(reads, artifacts::kGitleaks);
    s.trivy_fs = take(reads, artifacts::kTrivyFs);
    s.trivy_image = take(reads, artifacts::kTrivyImage);
    s.dockle = take(reads, artifacts::kDockle);
    s.sbom = take(reads, artifacts::kSbom);

    auto& log = Logger::instance();
    if(s.gitleaks.parsed){
        s.secret_count = SecretCounter::count(*s.gitleaks.data);
        log.debug(s.secret_count->ok ? "gitleaks findings: " + std::to_string(s.secret_count->count) : "gitleaks: " + s.secret_count->error);
    }
    if(s.trivy_fs.parsed){
        s.trivy_fs_summary = VulnerabilitySummarizer::summarize(*s.trivy_fs.data);
        if(!s.trivy_fs_summary) log.debug("trivy-fs: unrecognized JSON structure");
    }
    if(s.trivy_image.parsed){
        s.trivy_image_summary = VulnerabilitySummarizer::summarize(*s.trivy_image.data);
        if(!s.trivy_image_summary) log.debug("trivy-image: unrecognized JSON structure");
    }
    if(s.dockle.parsed){
        s.dockle_summary = HardeningSummarizer::summarize(*s.dockle.data);
        log.debug(s.dockle_summary ? "dockle levels: " + HardeningSummarizer::format(*s.dockle_summary) : "dockle: unrecognized JSON structure");
    }
    return s;
}

}
