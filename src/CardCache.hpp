#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "BulkRefresher.hpp"
#include "Card.hpp"
#include "CardResolver.hpp"
#include "CardStore.hpp"
#include "Config.hpp"
#include "ImageStore.hpp"
#include "Records.hpp"
#include "ResponseCache.hpp"
#include "SqliteDB.hpp"
#include "Transport.hpp"

/*
  Local read-through cache in front of the card-data API.

  Construction opens <data_dir>/cardcache.sqlite3 and runs a bulk refresh
  when the stored data is older than the configured period; refresh errors
  propagate out of the constructor. Instances are independent: each owns its
  own store handle. One instance must not be used from several threads at
  once.
*/
class CardCache {
 public:
  static constexpr const char* kDatabaseFilename = "cardcache.sqlite3";

  /// Talks to the network through libcurl, paced per Config::GetRateLimit().
  explicit CardCache(const Config& config);

  CardCache(const Config& config, std::shared_ptr<Transport> transport,
            Clock clock = std::chrono::system_clock::now);

  CardCache(const CardCache&) = delete;
  CardCache& operator=(const CardCache&) = delete;

  /// Throws InvalidQuery unless exactly one key is set. "Not found" and
  /// "upstream unreachable" both come back as nullopt.
  std::optional<Card> Resolve(const CardQuery& query);

  std::optional<Card> GetById(const std::string& id);
  std::optional<Card> GetByName(const std::string& name);
  std::optional<Card> GetByForeignId(std::int64_t foreign_id);

  /// See ImageStore::GetImagePath().
  std::optional<std::filesystem::path> GetImagePath(const Card& card,
                                                    const std::string& format);

  /// Directory holding the store and downloaded art; free for other
  /// libraries to keep their own files in.
  const std::filesystem::path& GetCacheDirectory() const;

  /// Unconditional bulk refresh.
  void Refresh();

  CardStore& Store() {
    return *store_;
  }

 private:
  static std::shared_ptr<Transport> MakeTransport(const Config& config);

  std::filesystem::path dir_;
  std::shared_ptr<Transport> transport_;
  Clock clock_;
  std::shared_ptr<SqliteDB> db_;
  std::unique_ptr<CardStore> store_;
  std::unique_ptr<ResponseCache> responses_;
  std::unique_ptr<BulkRefresher> refresher_;
  std::unique_ptr<CardResolver> resolver_;
  std::unique_ptr<ImageStore> images_;
};
