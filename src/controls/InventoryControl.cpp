#include "InventoryControl.h"

namespace compliance_gate {

ControlVerdict InventoryControl::evaluate(const Evidence& ev) const {
    const auto& a = ev.artifacts.sbom;
    if(auto problem = describe_artifact_problem(a)) return { id(), ControlStatus::Fail, *problem };
    return { id(), ControlStatus::Pass, a.name + " present and valid (SBOM generated)" };
}

}
