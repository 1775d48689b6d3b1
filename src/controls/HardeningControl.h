#pragma once
#include "../core/Control.h"

namespace compliance_gate {

// Dockle image hardening. FATAL (also spelled FATL), ERROR and WARN findings fail the control.
// A valid document whose layout is not recognized passes with an explicit caveat.
class HardeningControl : public Control {
public:
    std::string id() const override { return "SEC-03"; }
    std::string description() const override { return "Container image hardening scan has no FATAL/ERROR/WARN findings"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
