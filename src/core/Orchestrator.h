#pragma once
#include "ArtifactSet.h"
#include "Config.h"
#include "Control.h"
#include "ControlRegistry.h"
#include "ReportRenderer.h"
#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace compliance_gate {

struct RunOutcome {
    std::vector<ControlVerdict> verdicts; // final, SEC-06 reflects the real write
    ControlStatus overall = ControlStatus::Fail;
    std::string document;                 // final rendering, as sent to the console
    std::string report_path;
    bool report_written = false;
    bool summary_written = true;          // true when no JSON export was requested
    int exit_code = 1;
};

// One evaluation pass: read artifacts, evaluate controls, persist and echo the report.
class Orchestrator {
public:
    Orchestrator(const Config& cfg, std::ostream& console);

    RunOutcome run(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Truncating write; never throws.
    static WriteOutcome write_file(const std::string& path, const std::string& content);

private:
    bool write_summary_json(const RunOutcome& outcome, const ArtifactSet& set, const std::string& timestamp) const;

    const Config& cfg_;
    std::ostream& console_;
    ControlRegistry registry_;
    ReportRenderer renderer_;
};

}
