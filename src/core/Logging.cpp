#include "Logging.h"
#include "Utils.h"
#include <iostream>

namespace compliance_gate {

Logger& Logger::instance(){ static Logger inst; return inst; }

void Logger::set_level(LogLevel lvl){ std::lock_guard<std::mutex> lock(mutex_); level_ = lvl; }

LogLevel Logger::level() const { std::lock_guard<std::mutex> lock(mutex_); return level_; }

void Logger::log(LogLevel lvl, const std::string& msg){
    std::lock_guard<std::mutex> lock(mutex_);
    if(static_cast<int>(lvl) > static_cast<int>(level_)) return;
    std::cerr << prefix(lvl) << msg << "\n";
}

const char* Logger::prefix(LogLevel lvl) const {
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = utils::to_lower(utils::trim(name));
    if(s=="error") { out = LogLevel::Error; return true; }
    if(s=="warn" || s=="warning") { out = LogLevel::Warn; return true; }
    if(s=="info") { out = LogLevel::Info; return true; }
    if(s=="debug") { out = LogLevel::Debug; return true; }
    if(s=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
