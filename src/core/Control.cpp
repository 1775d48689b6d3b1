#include "Control.h"
#include <algorithm>

namespace compliance_gate {

const char* status_to_string(ControlStatus s){
    return s == ControlStatus::Pass ? "PASS" : "FAIL";
}

ControlStatus overall_status(const std::vector<ControlVerdict>& verdicts){
    if(verdicts.empty()) return ControlStatus::Fail;
    bool all_pass = std::all_of(verdicts.begin(), verdicts.end(), [](const ControlVerdict& v){ return v.status == ControlStatus::Pass; });
    return all_pass ? ControlStatus::Pass : ControlStatus::Fail;
}

std::optional<std::string> describe_artifact_problem(const ArtifactReadResult& a){
    std::string err = a.error.value_or("unknown error");
    switch(a.kind){
        case ArtifactError::None:
            if(a.found && a.parsed) return std::nullopt;
            break;
        case ArtifactError::NotFound:
            return a.name + " not found";
        case ArtifactError::Unreadable:
            return a.name + " could not be read (" + err + ")";
        case ArtifactError::InvalidEncoding:
            return a.name + " is not valid JSON (" + err + ")";
    }
    // Inconsistent flags: never treat as usable evidence
    return a.name + " is not usable (" + err + ")";
}

}
