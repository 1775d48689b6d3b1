#include "ReportPersistedControl.h"

namespace compliance_gate {

ControlVerdict ReportPersistedControl::evaluate(const Evidence& ev) const {
    if(!ev.report_write) return { id(), ControlStatus::Fail, "Report not yet generated" };
    const auto& w = *ev.report_write;
    if(w.succeeded) return { id(), ControlStatus::Pass, "Report generated at " + w.path };
    std::string details = "Failed to generate report at " + w.path;
    if(!w.error.empty()) details += " (" + w.error + ")";
    return { id(), ControlStatus::Fail, details };
}

}
