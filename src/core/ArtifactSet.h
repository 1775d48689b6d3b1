#pragma once
#include "Artifact.h"
#include "Severity.h"
#include "../summarizers/SecretCounter.h"
#include <optional>
#include <string>
#include <vector>

namespace compliance_gate {

// All scanner artifacts of one run plus what could be derived from them. Built once, read-only after.
struct ArtifactSet {
    ArtifactReadResult gitleaks;
    ArtifactReadResult trivy_fs;
    ArtifactReadResult trivy_image;
    ArtifactReadResult dockle;
    ArtifactReadResult sbom;

    // Set only for artifacts that parsed
    std::optional<SecretCounter::Result> secret_count;
    std::optional<VulnerabilitySummary> trivy_fs_summary;
    std::optional<VulnerabilitySummary> trivy_image_summary;
    std::optional<HardeningSummary> dockle_summary;

    // The five artifact names in read order
    static std::vector<std::string> artifact_names();

    // reads must hold one result per artifact_names() entry (matched by name); missing entries
    // are treated as not found.
    static ArtifactSet build(std::vector<ArtifactReadResult> reads);

    std::vector<const ArtifactReadResult*> all() const { return { &gitleaks, &trivy_fs, &trivy_image, &dockle, &sbom }; }
};

}
