#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace compliance_gate {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the program should exit immediately (help, version, or a usage error);
    // exit_status() then tells which.
    bool parse(int argc, char** argv, Config& cfg);
    int exit_status() const { return exit_status_; }

    void print_help() const;
    static void print_version();

private:
    enum class ArgKind { None, String };
    struct FlagSpec { const char* name; ArgKind kind; const char* help; std::function<bool(const std::string&, Config&)> apply; }; // apply returns false on an invalid value
    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_status_ = 0;
};

}
