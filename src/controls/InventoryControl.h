#pragma once
#include "../core/Control.h"

namespace compliance_gate {

// SBOM must exist and parse; its content is not inspected.
class InventoryControl : public Control {
public:
    std::string id() const override { return "SEC-05"; }
    std::string description() const override { return "Software bill of materials generated"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
