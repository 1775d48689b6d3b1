#pragma once
#include "Config.h"
#include "Control.h"
#include <string>
#include <vector>

namespace compliance_gate {

// Renders the Markdown compliance report. Pure: identical inputs give identical bytes.
class ReportRenderer {
public:
    static constexpr const char* kNotAvailable = "n/a";

    std::string render(const std::vector<ControlVerdict>& verdicts,
                       ControlStatus overall,
                       const std::string& timestamp,
                       const PipelineContext& pipeline) const;

    // Table cell text: '|' escaped, line breaks flattened to spaces.
    static std::string escape_cell(const std::string& text);
};

}
