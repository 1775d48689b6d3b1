#pragma once
#include "../core/Control.h"

namespace compliance_gate {

class NoSecretsControl : public Control {
public:
    std::string id() const override { return "SEC-01"; }
    std::string description() const override { return "Secret scan present and reports zero findings"; }
    ControlVerdict evaluate(const Evidence& ev) const override;
};

}
