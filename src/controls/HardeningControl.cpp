#include "HardeningControl.h"
#include "../summarizers/HardeningSummarizer.h"

namespace compliance_gate {

ControlVerdict HardeningControl::evaluate(const Evidence& ev) const {
    const auto& a = ev.artifacts.dockle;
    if(auto problem = describe_artifact_problem(a)) return { id(), ControlStatus::Fail, *problem };

    const auto& summary = ev.artifacts.dockle_summary;
    if(!summary){
        // TODO: confirm with the policy owner whether an unrecognized Dockle layout should fail instead
        return { id(), ControlStatus::Pass,
                 a.name + " present and valid (unable to infer finding levels; treating as informational)" };
    }

    std::size_t blocking = summary->count("FATAL") + summary->count("FATL")
                         + summary->count("ERROR") + summary->count("WARN");
    std::string text = HardeningSummarizer::format(*summary);
    if(blocking > 0) return { id(), ControlStatus::Fail, "Dockle reported hardening issues (" + text + ")" };
    return { id(), ControlStatus::Pass, "Dockle scan clean (" + text + ")" };
}

}
