#pragma once

#include <string>
#include <string_view>

namespace remedy {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;  // linked BLAKE3 library version
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string artifact_digest(std::string_view artifact);       // "art:"
std::string request_digest(std::string_view canonical_json);  // "req:"

}  // namespace remedy
