#include "CardResolver.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

CardQuery CardQuery::ById(std::string id) {
  CardQuery q;
  q.id = std::move(id);
  return q;
}

CardQuery CardQuery::ByName(std::string name) {
  CardQuery q;
  q.name = std::move(name);
  return q;
}

CardQuery CardQuery::ByForeignId(std::int64_t foreign_id) {
  CardQuery q;
  q.foreign_id = foreign_id;
  return q;
}

CardResolver::CardResolver(CardStore& store, ResponseCache& responses,
                           Transport& transport, Endpoints endpoints,
                           std::chrono::seconds ttl)
    : store_{store},
      responses_{responses},
      transport_{transport},
      endpoints_{std::move(endpoints)},
      ttl_{ttl} {
}

std::optional<nlohmann::json> CardResolver::Resolve(const CardQuery& query) {
  const int keys = int(query.id.has_value()) + int(query.name.has_value()) +
                   int(query.foreign_id.has_value());
  if (keys != 1) {
    throw InvalidQuery("a card query needs exactly one of id, name or "
                       "foreign id; got " +
                       std::to_string(keys));
  }

  if (query.id)
    return ResolveId(*query.id);
  if (query.name)
    return ResolveIndexed("name " + *query.name, store_.FindByName(*query.name),
                          endpoints_.CardByName(*query.name));
  return ResolveIndexed("MTGO id " + std::to_string(*query.foreign_id),
                        store_.FindByForeignId(*query.foreign_id),
                        endpoints_.CardByForeignId(*query.foreign_id));
}

std::optional<nlohmann::json> CardResolver::ResolveId(const std::string& id) {
  if (auto record = store_.GetById(id)) {
    return std::move(record->payload);
  }

  logr::debug << "[CardResolver] id " << id << " not in store";
  auto doc = FetchRemote(endpoints_.CardById(id));
  if (doc)
    WriteBack(*doc);
  return doc;
}

std::optional<nlohmann::json> CardResolver::ResolveIndexed(
  const std::string& what, const std::vector<CardRecord>& local,
  const URL& remote) {
  if (local.size() == 1) {
    logr::debug << "[CardResolver] single local match for " << what;
    return local.front().payload;
  }

  logr::debug << "[CardResolver] " << local.size() << " local match(es) for "
              << what << "; asking upstream";
  auto doc = FetchRemote(remote);
  if (doc && local.empty())
    WriteBack(*doc);
  return doc;
}

std::optional<nlohmann::json> CardResolver::FetchRemote(const URL& url) {
  auto doc = responses_.Fetch(url, ttl_, [&] { return transport_.Get(url); });
  if (doc && !CardRecord::FromDocument(*doc)) {
    logr::warning << "[CardResolver] response from " << url
                  << " is not a card document";
    return std::nullopt;
  }
  return doc;
}

void CardResolver::WriteBack(const nlohmann::json& doc) {
  auto record = CardRecord::FromDocument(doc);
  if (!record)
    return;
  if (store_.InsertCard(*record)) {
    logr::debug << "[CardResolver] saved " << record->id;
  } else {
    logr::debug << "[CardResolver] " << record->id << " already stored";
  }
}
