#include "ReportRenderer.h"
#include <sstream>

namespace compliance_gate {
namespace {

std::string single_line(const std::string& text){
    std::string out;
    out.reserve(text.size());
    for(size_t i=0;i<text.size();++i){
        char c = text[i];
        if(c=='\r'){
            if(i+1<text.size() && text[i+1]=='\n') continue;
            out.push_back(' ');
        } else if(c=='\n'){
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

const std::string& or_na(const std::string& v){
    static const std::string na = ReportRenderer::kNotAvailable;
    return v.empty() ? na : v;
}

}

std::string ReportRenderer::escape_cell(const std::string& text){
    std::string flat = single_line(text);
    std::string out;
    out.reserve(flat.size());
    for(char c : flat){
        if(c=='|') out += "\\|";
        else out.push_back(c);
    }
    return out;
}

std::string ReportRenderer::render(const std::vector<ControlVerdict>& verdicts,
                                   ControlStatus overall,
                                   const std::string& timestamp,
                                   const PipelineContext& pipeline) const {
    std::ostringstream os;
    os << "# Compliance Report\n\n";
    os << "Generated at: `" << timestamp << "`\n\n";

    os << "## Pipeline Context\n\n";
    os << "- Commit: `" << or_na(pipeline.commit) << "`\n";
    os << "- Ref: `" << or_na(pipeline.ref) << "`\n";
    os << "- Repository: `" << or_na(pipeline.repository) << "`\n";
    os << "- Run URL: " << or_na(pipeline.run_url()) << "\n\n";

    os << "## Control Summary\n\n";
    os << "| Control | Status | Details |\n";
    os << "|---------|--------|---------|\n";
    for(const auto& v : verdicts){
        os << "| " << v.id << " | " << status_to_string(v.status) << " | " << escape_cell(v.details) << " |\n";
    }
    os << "\n";

    os << "## Overall Status\n\n";
    os << "**" << status_to_string(overall) << "**\n";

    bool header = false;
    for(const auto& v : verdicts){
        if(v.status != ControlStatus::Fail) continue;
        if(!header){ os << "\n### Failing Controls\n\n"; header = true; }
        os << "- " << v.id << ": " << single_line(v.details) << "\n";
    }
    return os.str();
}

}
