#include "ArtifactStore.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;
namespace compliance_gate {

ArtifactReadResult ArtifactStore::read(const std::string& name) const {
    ArtifactReadResult r;
    r.name = name;
    r.path = (fs::path(dir_) / name).string();

    std::error_code ec;
    auto st = fs::status(r.path, ec);
    if(st.type() == fs::file_type::not_found){
        r.error = "File not found";
        r.kind = ArtifactError::NotFound;
        Logger::instance().debug("artifact " + name + ": " + *r.error);
        return r;
    }
    // Anything else means something sits at the path, even if it cannot be inspected
    r.found = true;
    r.kind = ArtifactError::Unreadable;
    if(ec){
        r.error = "Read error: " + ec.message();
        Logger::instance().debug("artifact " + name + ": " + *r.error);
        return r;
    }
    if(fs::is_directory(st)){
        r.error = "Read error: is a directory";
        Logger::instance().debug("artifact " + name + ": " + *r.error);
        return r;
    }

    std::ifstream in(r.path, std::ios::binary);
    if(!in){
        r.error = std::string("Read error: ") + std::strerror(errno);
        Logger::instance().debug("artifact " + name + ": " + *r.error);
        return r;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if(in.bad()){
        r.error = "Read error: I/O failure while reading";
        Logger::instance().debug("artifact " + name + ": " + *r.error);
        return r;
    }
    r.sha256 = utils::sha256_hex(content);

    try {
        r.data = nlohmann::json::parse(content);
        r.parsed = true;
        r.kind = ArtifactError::None;
    } catch(const nlohmann::json::exception& ex){
        // parse_error, but also out_of_range for numbers that overflow a double
        r.error = std::string("Invalid JSON: ") + ex.what();
        r.kind = ArtifactError::InvalidEncoding;
    }
    Logger::instance().debug("artifact " + name + ": found" + (r.parsed ? ", valid JSON" : ", " + *r.error));
    return r;
}

std::vector<ArtifactReadResult> ArtifactStore::read_all(const std::vector<std::string>& names, bool parallel) const {
    std::vector<ArtifactReadResult> out;
    out.reserve(names.size());
    if(!parallel){
        for(const auto& n : names) out.push_back(read(n));
        return out;
    }
    std::vector<std::future<ArtifactReadResult>> pending;
    pending.reserve(names.size());
    try {
        for(const auto& n : names){
            pending.push_back(std::async(std::launch::async, [this, n]{ return read(n); }));
        }
    } catch(const std::system_error& ex){
        Logger::instance().warn(std::string("Could not start parallel reads, continuing sequentially: ") + ex.what());
    }
    for(size_t i=0;i<names.size();++i){
        out.push_back(i < pending.size() ? pending[i].get() : read(names[i]));
    }
    return out;
}

bool ArtifactStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if(ec){
        Logger::instance().warn("Failed to ensure directory " + dir_ + ": " + ec.message());
        return false;
    }
    return true;
}

}
