#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace compliance_gate {
namespace utils {

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\n\r");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    using namespace std::chrono;
    auto since = tp.time_since_epoch();
    auto secs = floor<seconds>(since);
    auto ms = duration_cast<milliseconds>(since - secs).count();
    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return os.str();
}

std::string sha256_hex(const std::string& data){
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) return "";
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
        && EVP_DigestFinal_ex(ctx, md, &mdlen) == 1;
    EVP_MD_CTX_free(ctx);
    if(!ok || mdlen != 32) return "";
    static const char* hx = "0123456789abcdef";
    std::string out; out.reserve(64);
    for(unsigned i=0;i<mdlen;i++){ out.push_back(hx[md[i]>>4]); out.push_back(hx[md[i]&0xF]); }
    return out;
}

const char* env_value(const char* key){
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

}
}
