#pragma once
#include "ArtifactSet.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace compliance_gate {

enum class ControlStatus { Pass, Fail };

const char* status_to_string(ControlStatus s);

struct ControlVerdict {
    std::string id;
    ControlStatus status = ControlStatus::Fail;
    std::string details; // single line
};

// Result of attempting to persist the report document.
struct WriteOutcome {
    bool succeeded = false;
    std::string path;
    std::string error;
};

// What a control may look at during one evaluation pass. report_write stays empty until a write
// outcome (assumed or actual) is known.
struct Evidence {
    const ArtifactSet& artifacts;
    std::optional<WriteOutcome> report_write;
};

class Control {
public:
    virtual ~Control() = default;
    virtual std::string id() const = 0;
    virtual std::string description() const = 0;
    // Must not throw; indeterminate evidence yields Fail.
    virtual ControlVerdict evaluate(const Evidence& ev) const = 0;
};

using ControlPtr = std::unique_ptr<Control>;

// Pass iff every verdict passed. An empty list has no evidence and is Fail.
ControlStatus overall_status(const std::vector<ControlVerdict>& verdicts);

// "<name> not found", "<name> is not valid JSON (...)", ... or nullopt when the artifact parsed.
std::optional<std::string> describe_artifact_problem(const ArtifactReadResult& a);

}
