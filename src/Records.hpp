#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/// Source of "now"; injected so staleness and TTL checks are testable.
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline std::int64_t ToEpochSeconds(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch())
    .count();
}

/// One known card. `payload` is the upstream document, stored verbatim.
struct CardRecord {
  std::string id;
  std::string name;
  std::optional<std::int64_t> foreign_id;
  nlohmann::json payload;

  /// Extracts the index keys from an upstream card document. Returns nullopt
  /// when `id` or `name` is missing or not a string; a `mtgo_id` that is not
  /// an integer counts as absent.
  static std::optional<CardRecord> FromDocument(const nlohmann::json& doc);
};

/// Singleton bookkeeping row.
struct CacheMetadata {
  std::int64_t last_bulk_refresh{0};  // seconds since epoch
  std::string schema_version;
};

/// Last response seen for one exact request URL.
struct UrlResponseCacheEntry {
  std::string url;
  std::int64_t fetched_at{0};  // seconds since epoch
  nlohmann::json payload;
};
