#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace compliance_gate {

// Scanner output file names inside the artifact directory
namespace artifacts {
inline constexpr const char* kGitleaks = "gitleaks.json";
inline constexpr const char* kTrivyFs = "trivy-fs.json";
inline constexpr const char* kTrivyImage = "trivy-image.json";
inline constexpr const char* kDockle = "dockle.json";
inline constexpr const char* kSbom = "sbom.json";
}

enum class ArtifactError { None, NotFound, Unreadable, InvalidEncoding };

// Outcome of loading one artifact. parsed implies found; data is set iff parsed.
struct ArtifactReadResult {
    std::string name;
    std::string path;
    bool found = false;
    bool parsed = false;
    std::optional<nlohmann::json> data;
    std::optional<std::string> error;
    ArtifactError kind = ArtifactError::NotFound;
    std::string sha256; // digest of the raw bytes when the file could be read
};

}
