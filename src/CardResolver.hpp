#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "CardStore.hpp"
#include "Endpoints.hpp"
#include "ResponseCache.hpp"
#include "Transport.hpp"

/// Exactly one key must be set; see the factories.
struct CardQuery {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::int64_t> foreign_id;

  static CardQuery ById(std::string id);
  static CardQuery ByName(std::string name);
  static CardQuery ByForeignId(std::int64_t foreign_id);
};

/*
  Lookup policy over the two cache tiers.

  id:          store hit is final. On a miss, fetch through the response
               cache and write the result back permanently.
  name, mtgo:  exactly one local match is final. Zero or several matches
               defer to the remote lookup; the result is written back only
               when there were zero, so an ambiguous key never gains more
               duplicates.

  Remote failures are logged and come back as nullopt.
*/
class CardResolver {
 public:
  CardResolver(CardStore& store, ResponseCache& responses,
               Transport& transport, Endpoints endpoints,
               std::chrono::seconds ttl);
  CardResolver(const CardResolver&) = delete;

  /// Throws InvalidQuery unless exactly one key of `query` is set.
  std::optional<nlohmann::json> Resolve(const CardQuery& query);

 private:
  std::optional<nlohmann::json> ResolveId(const std::string& id);
  std::optional<nlohmann::json> ResolveIndexed(
    const std::string& what, const std::vector<CardRecord>& local,
    const URL& remote);

  std::optional<nlohmann::json> FetchRemote(const URL& url);
  void WriteBack(const nlohmann::json& doc);

  CardStore& store_;
  ResponseCache& responses_;
  Transport& transport_;
  Endpoints endpoints_;
  std::chrono::seconds ttl_;
};
