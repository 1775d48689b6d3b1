#pragma once
#include "../core/Control.h"

namespace compliance_gate {

// Judged on Evidence::report_write; without a write outcome the report cannot be confirmed.
class ReportPersistedControl : public Control {
public:
    std::string id() const override { return "SEC-06"; }
    std::string description() const override { return "Compliance report written to the artifact directory"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
