#include "HardeningSummarizer.h"
#include "../core/Utils.h"
#include <cmath>

namespace compliance_gate {
namespace {

// Normalized level name, or nullopt when the value carries no level.
std::optional<std::string> level_key(const nlohmann::json& v){
    if(v.is_string()){
        const auto& s = v.get_ref<const std::string&>();
        if(s.empty()) return std::nullopt;
        return utils::to_upper(s);
    }
    if(v.is_boolean()) return v.get<bool>() ? std::optional<std::string>("TRUE") : std::nullopt;
    if(v.is_number()){
        if(v.get<double>() == 0.0) return std::nullopt;
        if(v.is_number_float()){
            // 1.0 is reported as "1", like an integer level
            double d = v.get<double>();
            if(std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) return std::to_string(static_cast<long long>(d));
        }
        return utils::to_upper(v.dump());
    }
    return std::nullopt;
}

void bump_level_of(const nlohmann::json& entry, HardeningSummary& s){
    if(!entry.is_object()) return;
    auto it = entry.find("level");
    if(it == entry.end()) return;
    if(auto key = level_key(*it)) ++s.counts[*key];
}

void bump_details(const nlohmann::json& details, HardeningSummary& s){
    for(const auto& d : details) bump_level_of(d, s);
}

}

HardeningSummarizer::Schema HardeningSummarizer::decode(const nlohmann::json& data){
    if(data.is_array()) return FindingList{ &data };
    if(data.is_object()){
        const nlohmann::json* details = nullptr;
        const nlohmann::json* level = nullptr;
        auto dit = data.find("details");
        if(dit != data.end() && dit->is_array()) details = &*dit;
        auto lit = data.find("level");
        if(lit != data.end() && lit->is_primitive() && !lit->is_null()) level = &*lit;
        if(details || level) return Assessment{ details, level };
    }
    return Unrecognized{};
}

std::optional<HardeningSummary> HardeningSummarizer::summarize(const nlohmann::json& data){
    auto schema = decode(data);
    HardeningSummary s;
    if(const auto* list = std::get_if<FindingList>(&schema)){
        for(const auto& item : *list->items){
            bump_level_of(item, s);
            if(item.is_object()){
                auto dit = item.find("details");
                if(dit != item.end() && dit->is_array()) bump_details(*dit, s);
            }
        }
        return s;
    }
    if(const auto* doc = std::get_if<Assessment>(&schema)){
        if(doc->details) bump_details(*doc->details, s);
        if(doc->level){ if(auto key = level_key(*doc->level)) ++s.counts[*key]; }
        return s;
    }
    return std::nullopt;
}

std::string HardeningSummarizer::format(const HardeningSummary& s){
    std::string out;
    for(const auto& kv : s.counts){
        if(kv.second == 0) continue;
        if(!out.empty()) out += ", ";
        out += kv.first + ": " + std::to_string(kv.second);
    }
    return out.empty() ? "no findings" : out;
}

}
