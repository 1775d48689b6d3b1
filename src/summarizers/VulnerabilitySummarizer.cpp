#include "VulnerabilitySummarizer.h"
#include <sstream>

namespace compliance_gate {

VulnerabilitySummarizer::Schema VulnerabilitySummarizer::decode(const nlohmann::json& data){
    if(data.is_object()){
        auto it = data.find("Results");
        if(it != data.end() && it->is_array()) return ResultsDocument{ &*it };
    }
    return Unrecognized{};
}

std::optional<VulnerabilitySummary> VulnerabilitySummarizer::summarize(const nlohmann::json& data){
    auto schema = decode(data);
    const auto* doc = std::get_if<ResultsDocument>(&schema);
    if(!doc) return std::nullopt;

    VulnerabilitySummary s;
    for(const auto& result : *doc->results){
        if(!result.is_object()) continue;
        auto vit = result.find("Vulnerabilities");
        if(vit == result.end() || !vit->is_array()) continue;
        for(const auto& vuln : *vit){
            Severity sev = Severity::Unknown;
            if(vuln.is_object()){
                auto sit = vuln.find("Severity");
                if(sit != vuln.end() && sit->is_string()) sev = severity_from_string(sit->get<std::string>());
            }
            s.add(sev);
        }
    }
    return s;
}

std::string VulnerabilitySummarizer::format(const std::string& label, const VulnerabilitySummary& s){
    std::ostringstream os;
    os << "Trivy " << label << ": total " << s.total;
    for(auto sev : kAllSeverities) os << ", " << severity_to_string(sev) << ": " << s.count(sev);
    return os.str();
}

}
