#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>

#include "CardStore.hpp"
#include "HttpResponse.hpp"
#include "Records.hpp"
#include "URL.hpp"

/// Performs the live request on a cache miss.
using Fetcher = std::function<std::optional<HttpResponse>()>;

/// Per-URL memoization of JSON responses with a freshness window, persisted
/// in the CardStore.
class ResponseCache {
 public:
  ResponseCache(CardStore& store, Clock clock);
  ResponseCache(const ResponseCache&) = delete;

  /// Cached payload while fetched_at + ttl > now; otherwise calls `fetch`,
  /// stores and returns the parsed body. Transport failures, non-2xx
  /// statuses and non-JSON bodies are logged and yield nullopt.
  std::optional<nlohmann::json> Fetch(const URL& url, std::chrono::seconds ttl,
                                      const Fetcher& fetch);

  bool IsFresh(const UrlResponseCacheEntry& entry,
               std::chrono::seconds ttl) const;

 private:
  CardStore& store_;
  Clock clock_;
};
