#include "ResponseCache.hpp"
#include "Logger.hpp"

ResponseCache::ResponseCache(CardStore& store, Clock clock)
    : store_{store}, clock_{std::move(clock)} {
}

bool ResponseCache::IsFresh(const UrlResponseCacheEntry& entry,
                            std::chrono::seconds ttl) const {
  // fetched_at + ttl > now, rearranged so a huge ttl cannot overflow
  return ToEpochSeconds(clock_()) - entry.fetched_at < ttl.count();
}

std::optional<nlohmann::json> ResponseCache::Fetch(const URL& url,
                                                   std::chrono::seconds ttl,
                                                   const Fetcher& fetch) {
  const std::string key = url.ToString();

  if (auto entry = store_.GetUrlEntry(key); entry && IsFresh(*entry, ttl)) {
    logr::debug << "[ResponseCache] hit: " << key;
    return std::move(entry->payload);
  }

  logr::debug << "[ResponseCache] miss: " << key;
  auto response = fetch();
  if (!response.has_value()) {
    logr::warning << "[ResponseCache] no response from " << key;
    return std::nullopt;
  }
  if (!response->IsOkay()) {
    logr::LogEntry entry(logr::Level::Warning);
    entry << "[ResponseCache] HTTP " << response->GetStatusCode() << " from "
          << key;
    if (auto details = response->ErrorDetails())
      entry << ": " << *details;
    return std::nullopt;
  }

  if (const auto& final_url = response->GetEffectiveUrl();
      !final_url.empty() && final_url != key) {
    logr::debug << "[ResponseCache] " << key << " redirected to " << final_url
                << "; caching under the requested URL";
  }

  auto doc = response->ParseJson();
  if (!doc.has_value()) {
    logr::warning << "[ResponseCache] malformed JSON body from " << key;
    return std::nullopt;
  }

  const auto now = ToEpochSeconds(clock_());
  logr::debug << "[ResponseCache] storing " << key << " at " << now;
  store_.PutUrlEntry(key, now, *doc);
  return doc;
}
