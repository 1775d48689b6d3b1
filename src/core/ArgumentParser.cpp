#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>

namespace compliance_gate {

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--artifact-dir", ArgKind::String, "Directory holding scanner JSON and the report (default $ARTIFACT_DIR or ./artifacts)",
            [](const std::string& v, Config& c){ c.artifact_dir = v; return true; }},
        {"--report-name", ArgKind::String, "Report file name inside the artifact directory",
            [](const std::string& v, Config& c){ c.report_name = v; return true; }},
        {"--summary-json", ArgKind::String, "Also write verdicts and artifact digests as JSON to FILE",
            [](const std::string& v, Config& c){ c.summary_json_file = v; return true; }},
        {"--sequential", ArgKind::None, "Read artifacts one at a time",
            [](const std::string&, Config& c){ c.parallel_reads = false; return true; }},
        {"--no-console", ArgKind::None, "Do not echo the report to stdout",
            [](const std::string&, Config& c){ c.console = false; return true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace",
            [](const std::string& v, Config& c){ return parse_log_level(v, c.log_level); }},
        {"--quiet", ArgKind::None, "Only log errors",
            [](const std::string&, Config& c){ c.log_level = LogLevel::Error; return true; }},
        {"--verbose", ArgKind::None, "Log debug detail",
            [](const std::string&, Config& c){ c.log_level = LogLevel::Debug; return true; }},
        {"--version", ArgKind::None, "Print version & exit", nullptr},
        {"--help", ArgKind::None, "Show this help", nullptr}
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_status_ = 0;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; print_help(); exit_status_ = 2; return false; }
        std::string val;
        if(spec->kind == ArgKind::String){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; exit_status_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){ std::cerr << "Invalid value for " << a << ": " << val << "\n"; exit_status_ = 2; return false; }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "compliance-gate options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind == ArgKind::String) name += " VALUE";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "Exit status: 0 all controls passed, 1 a control failed or the report was not written, 2 usage error\n";
}

void ArgumentParser::print_version(){
    std::cout << "compliance-gate " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
