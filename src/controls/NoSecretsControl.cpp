#include "NoSecretsControl.h"

namespace compliance_gate {

ControlVerdict NoSecretsControl::evaluate(const Evidence& ev) const {
    const auto& a = ev.artifacts.gitleaks;
    if(auto problem = describe_artifact_problem(a)) return { id(), ControlStatus::Fail, *problem };

    const auto& count = ev.artifacts.secret_count;
    if(!count || !count->ok){
        std::string why = count ? count->error : "no finding count available";
        return { id(), ControlStatus::Fail, "Unable to determine findings in " + a.name + ": " + why };
    }
    if(count->count > 0){
        return { id(), ControlStatus::Fail, "Gitleaks detected " + std::to_string(count->count) + " potential secret(s)" };
    }
    return { id(), ControlStatus::Pass, "No secrets detected by Gitleaks (0 findings)" };
}

}
