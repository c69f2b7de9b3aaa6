#pragma once

#include <string>
#include <rapidjson/document.h>

namespace theory_validator
{
  namespace runstore
  {
    /**
     * @brief Canonical JSON and content hashes for run snapshots.
     *
     * Object keys are written in byte order at every nesting level and no
     * whitespace is emitted, so two documents with the same content produce
     * the same text regardless of member insertion order. Array order is
     * preserved; callers sort set-like arrays before serializing.
     */
    class SnapshotSerializer
    {
    public:
      static std::string canonicalJson(const rapidjson::Value& value);

      // First 16 hex digits of the SHA-1 digest of the payload.
      static std::string contentHash(const std::string& canonicalPayload);

      static std::string runId(const std::string& runType, const std::string& hash)
      {
	return runType + "-" + hash;
      }

      // Compact (not key-sorted) serialization.
      static std::string toJson(const rapidjson::Value& value);
    };
  }
}
