#pragma once
#include "../core/Control.h"

namespace compliance_gate {

// Both Trivy scans (filesystem and image) must be on disk and parse. Content is not judged here.
class ScanCoverageControl : public Control {
public:
    std::string id() const override { return "SEC-02"; }
    std::string description() const override { return "Filesystem and image vulnerability scans present"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
