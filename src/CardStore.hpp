#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Records.hpp"
#include "SqliteDB.hpp"

/*
  Persistent store for the three record kinds.

  Every public call without a transaction argument runs in its own scoped
  transaction, committed before returning. The overloads taking a
  SqliteTransaction let a caller group several writes atomically.
*/
class CardStore {
 public:
  static constexpr const char* kSchemaVersion = "3";

  /// Opens (or creates) the schema; an incompatible on-disk layout is
  /// dropped and recreated.
  explicit CardStore(std::shared_ptr<SqliteDB> db);

  CardStore(const CardStore&) = delete;
  CardStore& operator=(const CardStore&) = delete;

  std::unique_ptr<SqliteTransaction> Begin(
    SqliteTransaction::Mode mode = SqliteTransaction::Mode::Immediate);

  // ---- cards
  std::optional<CardRecord> GetById(const std::string& id);
  std::vector<CardRecord> FindByName(const std::string& name);
  std::vector<CardRecord> FindByForeignId(std::int64_t foreign_id);

  /// Inserts unless a record with the same id exists; existing records are
  /// never touched. Returns true when a row was added.
  bool InsertCard(const CardRecord& record);
  bool InsertCard(SqliteTransaction& tx, const CardRecord& record);

  void ClearAllCards();
  void ClearAllCards(SqliteTransaction& tx);

  std::int64_t CountCards();

  // ---- metadata
  /// Creates the row with last_bulk_refresh = 0 when absent.
  CacheMetadata GetMetadata();
  void SetMetadata(std::int64_t last_bulk_refresh);
  void SetMetadata(SqliteTransaction& tx, std::int64_t last_bulk_refresh);

  // ---- URL response cache
  std::optional<UrlResponseCacheEntry> GetUrlEntry(const std::string& url);
  /// Replaces any previous entry for `url`.
  void PutUrlEntry(const std::string& url, std::int64_t fetched_at,
                   const nlohmann::json& payload);

 private:
  bool SchemaMatches();
  void CreateSchema();
  void DropSchema();
  void EnsureMetadata(SqliteTransaction& tx);

  std::vector<CardRecord> FindCards(const char* sql,
                                    const std::function<void(Statement&)>& bind);

  std::shared_ptr<SqliteDB> db_;
};
