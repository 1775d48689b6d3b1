#pragma once
#include "../core/Control.h"

namespace compliance_gate {

class NoCriticalVulnsControl : public Control {
public:
    std::string id() const override { return "SEC-04"; }
    std::string description() const override { return "No CRITICAL vulnerabilities across filesystem and image scans"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
