#pragma once
#include "Artifact.h"
#include <string>
#include <utility>
#include <vector>

namespace compliance_gate {

// Loads scanner JSON from one directory. Never throws; every failure is captured in the result.
class ArtifactStore {
public:
    explicit ArtifactStore(std::string dir) : dir_(std::move(dir)) {}

    ArtifactReadResult read(const std::string& name) const;

    // Reads every name, concurrently when parallel is set. Results keep the order of names.
    // Returns only after all reads have finished.
    std::vector<ArtifactReadResult> read_all(const std::vector<std::string>& names, bool parallel) const;

    // Best-effort mkdir -p; false (and a logged warning) if the directory could not be created.
    bool ensure_directory() const;

    const std::string& directory() const { return dir_; }
private:
    std::string dir_;
};

}
