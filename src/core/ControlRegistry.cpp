#include "ControlRegistry.h"
#include <exception>
#include "Logging.h"
#include "../controls/NoSecretsControl.h"
#include "../controls/ScanCoverageControl.h"
#include "../controls/HardeningControl.h"
#include "../controls/NoCriticalVulnsControl.h"
#include "../controls/InventoryControl.h"
#include "../controls/ReportPersistedControl.h"

namespace compliance_gate {

void ControlRegistry::register_control(ControlPtr control) {
    controls_.push_back(std::move(control));
}

void ControlRegistry::register_all_default() {
    register_control(std::make_unique<NoSecretsControl>());
    register_control(std::make_unique<ScanCoverageControl>());
    register_control(std::make_unique<HardeningControl>());
    register_control(std::make_unique<NoCriticalVulnsControl>());
    register_control(std::make_unique<InventoryControl>());
    register_control(std::make_unique<ReportPersistedControl>());
}

std::vector<ControlVerdict> ControlRegistry::evaluate_all(const Evidence& ev) const {
    std::vector<ControlVerdict> verdicts;
    verdicts.reserve(controls_.size());
    for(const auto& c : controls_) {
        ControlVerdict v;
        try {
            v = c->evaluate(ev);
        } catch(const std::exception& ex) {
            v.id = c->id();
            v.status = ControlStatus::Fail;
            v.details = std::string("Control evaluation error: ") + ex.what();
            Logger::instance().error(c->id() + ": " + ex.what());
        }
        Logger::instance().debug(v.id + " " + status_to_string(v.status) + ": " + v.details);
        verdicts.push_back(std::move(v));
    }
    return verdicts;
}

}
