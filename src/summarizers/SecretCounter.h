#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <variant>

namespace compliance_gate {

// Number of findings in a Gitleaks report. Layouts are tried in priority order:
// a bare array, an object with one of the aliased arrays, an object with a numeric "total".
class SecretCounter {
public:
    struct BareList { std::size_t size; };
    struct AliasedList { std::string field; std::size_t size; };
    struct ReportedTotal { std::size_t total; };
    struct Unrecognized {};
    using Schema = std::variant<BareList, AliasedList, ReportedTotal, Unrecognized>;

    struct Result {
        bool ok = false;
        std::size_t count = 0;
        std::string error; // set when !ok
    };

    static constexpr const char* kAliases[] = {"findings", "Leaks", "leaks", "results"};

    static Schema decode(const nlohmann::json& data);
    static Result count(const nlohmann::json& data);
};

}
