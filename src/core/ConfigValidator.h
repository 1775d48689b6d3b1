#pragma once
#include "Config.h"
#include <string>

namespace compliance_gate {

// Post-parse normalization and validation. Problems are reported on stderr; false means usage error.
class ConfigValidator {
public:
    bool validate(Config& cfg);

    // A bare file name: non-empty, no directory separators, not "." or "..".
    static bool is_plain_file_name(const std::string& name);
};

}
