#pragma once
#include <string>
#include <chrono>

namespace compliance_gate {
namespace utils {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

// UTC, millisecond precision: 2024-01-31T08:15:00.123Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);

// Lowercase hex SHA-256 of an in-memory buffer. Empty string if the digest could not be computed.
std::string sha256_hex(const std::string& data);

// Non-empty value of an environment variable, or nullptr.
const char* env_value(const char* key);

}
}
