#include "Orchestrator.h"
#include "ArtifactStore.h"
#include "Logging.h"
#include "Utils.h"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
namespace compliance_gate {

Orchestrator::Orchestrator(const Config& cfg, std::ostream& console) : cfg_(cfg), console_(console) {
    registry_.register_all_default();
}

WriteOutcome Orchestrator::write_file(const std::string& path, const std::string& content){
    WriteOutcome w;
    w.path = path;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out){
        w.error = std::strerror(errno);
        return w;
    }
    out << content;
    out.flush();
    if(!out){
        w.error = "write failed";
        return w;
    }
    out.close();
    if(out.fail()){
        w.error = "close failed";
        return w;
    }
    w.succeeded = true;
    return w;
}

RunOutcome Orchestrator::run(std::chrono::system_clock::time_point now){
    auto& log = Logger::instance();
    const std::string timestamp = utils::time_to_iso(now);

    ArtifactStore store(cfg_.artifact_dir);
    store.ensure_directory();

    log.info("Reading scanner artifacts from " + store.directory());
    const ArtifactSet set = ArtifactSet::build(store.read_all(ArtifactSet::artifact_names(), cfg_.parallel_reads));

    RunOutcome outcome;
    outcome.report_path = (fs::path(cfg_.artifact_dir) / cfg_.report_name).string();

    // The persisted copy is rendered before its own write is known, so SEC-06 is judged on an
    // assumed success. SEC-06 is then re-evaluated by the same rule on the real outcome; on success
    // both renderings are byte-identical.
    WriteOutcome assumed;
    assumed.succeeded = true;
    assumed.path = outcome.report_path;
    const auto file_verdicts = registry_.evaluate_all(Evidence{ set, assumed });
    const std::string file_document = renderer_.render(file_verdicts, overall_status(file_verdicts), timestamp, cfg_.pipeline);

    WriteOutcome written = write_file(outcome.report_path, file_document);
    if(!written.succeeded){
        log.error("Failed to write compliance report to " + outcome.report_path + ": " + written.error);
    }
    outcome.report_written = written.succeeded;

    outcome.verdicts = registry_.evaluate_all(Evidence{ set, written });
    outcome.overall = overall_status(outcome.verdicts);
    outcome.document = renderer_.render(outcome.verdicts, outcome.overall, timestamp, cfg_.pipeline);

    if(cfg_.console){
        console_ << "\n=== Compliance Report ===\n\n";
        console_ << outcome.document << "\n";
        console_ << "\n=== End of Compliance Report ===\n\n";
        console_.flush();
    }

    outcome.exit_code = (outcome.report_written && outcome.overall == ControlStatus::Pass) ? 0 : 1;
    if(!cfg_.summary_json_file.empty()){
        outcome.summary_written = write_summary_json(outcome, set, timestamp);
        if(!outcome.summary_written) outcome.exit_code = 1;
    }

    log.info(std::string("Overall status: ") + status_to_string(outcome.overall));
    return outcome;
}

bool Orchestrator::write_summary_json(const RunOutcome& outcome, const ArtifactSet& set, const std::string& timestamp) const {
    nlohmann::json j;
    j["timestamp"] = timestamp;
    j["overall_status"] = status_to_string(outcome.overall);
    j["exit_code"] = outcome.exit_code;
    j["report_path"] = outcome.report_path;
    j["report_written"] = outcome.report_written;

    nlohmann::json controls = nlohmann::json::array();
    for(const auto& v : outcome.verdicts){
        controls.push_back({ {"id", v.id}, {"status", status_to_string(v.status)}, {"details", v.details} });
    }
    j["controls"] = std::move(controls);

    nlohmann::json arts = nlohmann::json::array();
    for(const auto* a : set.all()){
        nlohmann::json e;
        e["name"] = a->name;
        e["found"] = a->found;
        e["parsed"] = a->parsed;
        e["error"] = a->error ? nlohmann::json(*a->error) : nlohmann::json(nullptr);
        e["sha256"] = a->sha256.empty() ? nlohmann::json(nullptr) : nlohmann::json(a->sha256);
        arts.push_back(std::move(e));
    }
    j["artifacts"] = std::move(arts);

    WriteOutcome w = write_file(cfg_.summary_json_file, j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
    if(!w.succeeded){
        Logger::instance().error("Failed to write summary JSON to " + cfg_.summary_json_file + ": " + w.error);
        return false;
    }
    return true;
}

}
