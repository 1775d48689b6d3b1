#include "Config.h"
#include "Utils.h"

namespace compliance_gate {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

std::string PipelineContext::run_url() const {
    if(run_id.empty() || repository.empty()) return "";
    std::string server = server_url.empty() ? std::string(kDefaultServerUrl) : server_url;
    while(!server.empty() && server.back()=='/') server.pop_back();
    return server + "/" + repository + "/actions/runs/" + run_id;
}

void load_environment(Config& cfg){
    using utils::env_value;
    if(auto v=env_value("ARTIFACT_DIR")) cfg.artifact_dir=v;
    if(auto v=env_value("GITHUB_SHA")) cfg.pipeline.commit=v;
    if(auto v=env_value("GITHUB_REF")) cfg.pipeline.ref=v;
    if(auto v=env_value("GITHUB_REPOSITORY")) cfg.pipeline.repository=v;
    if(auto v=env_value("GITHUB_RUN_ID")) cfg.pipeline.run_id=v;
    if(auto v=env_value("GITHUB_SERVER_URL")) cfg.pipeline.server_url=v;
}

}
