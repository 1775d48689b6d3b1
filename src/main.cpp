#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/Orchestrator.h"
#include <exception>
#include <iostream>

using namespace compliance_gate;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    try {
        Config cfg;
        load_environment(cfg);

        ArgumentParser parser;
        if(!parser.parse(argc, argv, cfg)) return parser.exit_status();

        ConfigValidator validator;
        if(!validator.validate(cfg)) return 2;
        Logger::instance().set_level(cfg.log_level);
        set_config(cfg);

        Orchestrator orchestrator(config(), std::cout);
        RunOutcome outcome = orchestrator.run();
        return outcome.exit_code;
    } catch(const std::exception& ex) {
        Logger::instance().error(std::string("Unexpected error while generating compliance report: ") + ex.what());
    } catch(...) {
        Logger::instance().error("Unexpected non-standard exception while generating compliance report");
    }
    return 1;
}
