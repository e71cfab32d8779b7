#pragma once

// remedy/version.hpp: Version manifest for the engine's serialized surfaces.
//
// INVARIANT:
//   Adding or removing a required field in a LoopResult document, an
//   AttemptEvent line or a RepairRequest file requires a bump of the
//   matching constant below.

#include <cstdint>
#include <string>

#ifndef REMEDY_VERSION
#define REMEDY_VERSION "0.1.0"
#endif

namespace remedy {
namespace version {

// 1 = BLAKE3, 32-byte output, lowercase hex, "<domain>:" separated.
constexpr std::uint32_t HASH_ALGORITHM_VERSION = 1;

// LoopResult / ExecutionResult JSON as written by `remedy repair` and `remedy batch`.
constexpr std::uint32_t RESULT_SCHEMA_VERSION = 1;

// One JSON object per line in REMEDY_EVENT_LOG.
constexpr std::uint32_t EVENT_SCHEMA_VERSION = 1;

// {"failure_kind","fields","strategy"} handed to a repair command.
constexpr std::uint32_t REQUEST_SCHEMA_VERSION = 1;

struct VersionManifest {
  std::uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::uint32_t result_schema{RESULT_SCHEMA_VERSION};
  std::uint32_t event_schema{EVENT_SCHEMA_VERSION};
  std::uint32_t request_schema{REQUEST_SCHEMA_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string blake3_version;
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace remedy
