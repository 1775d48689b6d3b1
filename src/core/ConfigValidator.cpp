#include "ConfigValidator.h"
#include "Utils.h"
#include <filesystem>
#include <iostream>

namespace compliance_gate {

bool ConfigValidator::validate(Config& cfg){
    cfg.artifact_dir = utils::trim(cfg.artifact_dir);
    if(cfg.artifact_dir.empty()){
        std::cerr << "Artifact directory must not be empty\n";
        return false;
    }

    if(!is_plain_file_name(cfg.report_name)){
        std::cerr << "Invalid --report-name value (must be a plain file name): " << cfg.report_name << "\n";
        return false;
    }

    // The JSON export must not clobber the Markdown report
    if(!cfg.summary_json_file.empty()){
        namespace fs = std::filesystem;
        fs::path report = fs::path(cfg.artifact_dir) / cfg.report_name;
        if(fs::path(cfg.summary_json_file).lexically_normal() == report.lexically_normal()){
            std::cerr << "--summary-json must not point at the report file: " << cfg.summary_json_file << "\n";
            return false;
        }
    }

    if(!cfg.pipeline.server_url.empty() && cfg.pipeline.server_url.find("://") == std::string::npos){
        std::cerr << "Ignoring GITHUB_SERVER_URL without a scheme: " << cfg.pipeline.server_url << "\n";
        cfg.pipeline.server_url = kDefaultServerUrl;
    }
    return true;
}

bool ConfigValidator::is_plain_file_name(const std::string& name){
    if(name.empty() || name=="." || name=="..") return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

}
