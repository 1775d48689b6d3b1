#include "SecretCounter.h"
#include <cmath>

namespace compliance_gate {
namespace {

// A finding count must be a non-negative whole number; anything else is not a count.
bool as_count(const nlohmann::json& v, std::size_t& out){
    if(v.is_number_unsigned()){ out = v.get<std::size_t>(); return true; }
    if(v.is_number_integer()){
        auto n = v.get<long long>();
        if(n < 0) return false;
        out = static_cast<std::size_t>(n); return true;
    }
    if(v.is_number_float()){
        double d = v.get<double>();
        if(!std::isfinite(d) || d < 0 || std::floor(d) != d) return false;
        out = static_cast<std::size_t>(d); return true;
    }
    return false;
}

struct CountOf {
    std::size_t operator()(const SecretCounter::BareList& s) const { return s.size; }
    std::size_t operator()(const SecretCounter::AliasedList& s) const { return s.size; }
    std::size_t operator()(const SecretCounter::ReportedTotal& s) const { return s.total; }
    std::size_t operator()(const SecretCounter::Unrecognized&) const { return 0; }
};

}

SecretCounter::Schema SecretCounter::decode(const nlohmann::json& data){
    if(data.is_array()) return BareList{ data.size() };
    if(data.is_object()){
        for(const char* alias : kAliases){
            auto it = data.find(alias);
            if(it != data.end() && it->is_array()) return AliasedList{ alias, it->size() };
        }
        auto tit = data.find("total");
        std::size_t total = 0;
        if(tit != data.end() && as_count(*tit, total)) return ReportedTotal{ total };
    }
    return Unrecognized{};
}

SecretCounter::Result SecretCounter::count(const nlohmann::json& data){
    auto schema = decode(data);
    Result r;
    if(std::holds_alternative<Unrecognized>(schema)){
        r.error = "Unknown Gitleaks JSON structure (no findings array found)";
        return r;
    }
    r.ok = true;
    r.count = std::visit(CountOf{}, schema);
    return r;
}

}
