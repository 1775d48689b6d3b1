#pragma once
#include "Control.h"
#include <vector>

namespace compliance_gate {

class ControlRegistry {
public:
    void register_control(ControlPtr control);
    // SEC-01 .. SEC-06 in report order
    void register_all_default();
    // One verdict per registered control, in registration order. A control that throws is
    // recorded as Fail rather than aborting the pass.
    std::vector<ControlVerdict> evaluate_all(const Evidence& ev) const;

    std::size_t size() const { return controls_.size(); }
private:
    std::vector<ControlPtr> controls_;
};

}
