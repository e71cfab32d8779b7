#include "remedy/version.hpp"

#include <sstream>

#include "remedy/hash.hpp"

namespace remedy {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = REMEDY_VERSION;
  const HashRuntimeInfo hash = hash_runtime_info();
  m.hash_primitive = hash.primitive;
  m.blake3_version = hash.version;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"blake3_version\":\"" << m.blake3_version << "\""
    << ",\"result_schema\":" << m.result_schema
    << ",\"event_schema\":" << m.event_schema
    << ",\"request_schema\":" << m.request_schema
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace remedy
