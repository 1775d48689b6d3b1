#include "Severity.h"
#include "Utils.h"

namespace compliance_gate {

const char* severity_to_string(Severity s){
    switch(s){
        case Severity::Critical: return "CRITICAL";
        case Severity::High: return "HIGH";
        case Severity::Medium: return "MEDIUM";
        case Severity::Low: return "LOW";
        case Severity::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

Severity severity_from_string(const std::string& label){
    std::string s = utils::to_upper(label);
    for(auto sev : kAllSeverities){ if(s == severity_to_string(sev)) return sev; }
    return Severity::Unknown;
}

}
