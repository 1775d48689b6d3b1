#pragma once
#include <string>
#include "Logging.h"

namespace compliance_gate {

inline constexpr const char* kDefaultArtifactDir = "artifacts";
inline constexpr const char* kDefaultReportName = "compliance-report.md";
inline constexpr const char* kDefaultServerUrl = "https://github.com";

// Read-only CI metadata for the report's context block. Empty = not provided.
struct PipelineContext {
    std::string commit;      // GITHUB_SHA
    std::string ref;         // GITHUB_REF
    std::string repository;  // GITHUB_REPOSITORY
    std::string run_id;      // GITHUB_RUN_ID
    std::string server_url = kDefaultServerUrl; // GITHUB_SERVER_URL

    // "<server>/<repo>/actions/runs/<id>" when both repository and run id are known, else empty.
    std::string run_url() const;
};

struct Config {
    std::string artifact_dir = kDefaultArtifactDir; // ARTIFACT_DIR or --artifact-dir
    std::string report_name = kDefaultReportName;
    std::string summary_json_file; // optional machine-readable verdict export
    bool parallel_reads = true; // read artifacts concurrently
    bool console = true; // echo final document to stdout
    LogLevel log_level = LogLevel::Info;
    PipelineContext pipeline;
};

Config& config();
void set_config(const Config& c);

// Overlay ARTIFACT_DIR and GITHUB_* variables onto cfg. Unset or empty variables leave fields untouched.
void load_environment(Config& cfg);

}
