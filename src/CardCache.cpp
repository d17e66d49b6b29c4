#include "CardCache.hpp"
#include "CurlTransport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "RateLimitedTransport.hpp"

#include <stdexcept>
#include <system_error>

std::shared_ptr<Transport> CardCache::MakeTransport(const Config& config) {
  auto curl = std::make_shared<CurlTransport>(config.GetUserAgent(),
                                              config.GetCaBundle());
  return std::make_shared<RateLimitedTransport>(std::move(curl),
                                                config.GetRateLimit());
}

CardCache::CardCache(const Config& config)
    : CardCache(config, MakeTransport(config)) {
}

CardCache::CardCache(const Config& config,
                     std::shared_ptr<Transport> transport, Clock clock)
    : dir_{config.GetDataDir()},
      transport_{std::move(transport)},
      clock_{std::move(clock)} {
  if (!transport_)
    throw std::invalid_argument("CardCache needs a transport");

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw StoreError("cannot create " + dir_.string() + ": " + ec.message());
  }

  const auto db_path = dir_ / kDatabaseFilename;
  logr::debug << "[CardCache] database path: " << db_path;

  db_ = std::make_shared<SqliteDB>(db_path, config.GetSqlDebug());
  store_ = std::make_unique<CardStore>(db_);
  responses_ = std::make_unique<ResponseCache>(*store_, clock_);

  Endpoints endpoints(config.GetApiBase());
  refresher_ = std::make_unique<BulkRefresher>(
    *store_, *transport_, endpoints, config.GetBulkDataType(),
    config.GetBulkRefreshPeriod(), dir_, clock_);
  resolver_ = std::make_unique<CardResolver>(*store_, *responses_, *transport_,
                                             endpoints,
                                             config.GetResponseTtl());
  images_ = std::make_unique<ImageStore>(*transport_, dir_ / "art_cache");

  refresher_->RefreshIfStale();
}

std::optional<Card> CardCache::Resolve(const CardQuery& query) {
  auto doc = resolver_->Resolve(query);
  if (!doc)
    return std::nullopt;
  return Card(std::move(*doc));
}

std::optional<Card> CardCache::GetById(const std::string& id) {
  return Resolve(CardQuery::ById(id));
}

std::optional<Card> CardCache::GetByName(const std::string& name) {
  return Resolve(CardQuery::ByName(name));
}

std::optional<Card> CardCache::GetByForeignId(std::int64_t foreign_id) {
  return Resolve(CardQuery::ByForeignId(foreign_id));
}

std::optional<std::filesystem::path> CardCache::GetImagePath(
  const Card& card, const std::string& format) {
  return images_->GetImagePath(card, format);
}

const std::filesystem::path& CardCache::GetCacheDirectory() const {
  return dir_;
}

void CardCache::Refresh() {
  refresher_->Refresh();
}
