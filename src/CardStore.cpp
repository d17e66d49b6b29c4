#include "CardStore.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <sqlite3.h>

namespace {

const char* kCreateSchema = R"SQL(
CREATE TABLE IF NOT EXISTS card (
  id         TEXT PRIMARY KEY NOT NULL,
  name       TEXT NOT NULL,
  foreign_id INTEGER,
  payload    TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS card_name_idx ON card(name);
CREATE INDEX IF NOT EXISTS card_foreign_id_idx ON card(foreign_id);

CREATE TABLE IF NOT EXISTS url_cache (
  url        TEXT PRIMARY KEY NOT NULL,
  fetched_at INTEGER NOT NULL,
  payload    TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS metadata (
  id             INTEGER PRIMARY KEY CHECK (id = 1),
  last_refresh   INTEGER NOT NULL,
  schema_version TEXT NOT NULL
);
)SQL";

// Column sets the code reads; a table lacking any of them is incompatible.
const char* kSchemaChecks[] = {
  "SELECT id, name, foreign_id, payload FROM card LIMIT 0;",
  "SELECT url, fetched_at, payload FROM url_cache LIMIT 0;",
  "SELECT id, last_refresh, schema_version FROM metadata LIMIT 0;",
};

nlohmann::json ParsePayload(const std::string& text) {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded())
    throw StoreError("stored payload is not valid JSON");
  return j;
}

CardRecord ReadCard(const Statement& st) {
  CardRecord r;
  r.id = st.ColText(0);
  r.name = st.ColText(1);
  if (!st.ColIsNull(2))
    r.foreign_id = st.ColInt64(2);
  r.payload = ParsePayload(st.ColText(3));
  return r;
}

}  // namespace

CardStore::CardStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  bool empty = true;
  {
    Statement count(*db_,
                    "SELECT COUNT(*) FROM sqlite_master WHERE type='table' "
                    "AND name NOT LIKE 'sqlite_%';");
    empty = !count.Step() || count.ColInt64(0) == 0;
  }

  if (empty) {
    logr::debug << "[CardStore] creating schema in " << db_->Path();
  } else if (!SchemaMatches()) {
    // The store is a cache, so losing its contents only costs refetches.
    logr::warning << "[CardStore] incompatible schema in " << db_->Path()
                  << "; dropping all tables and recreating";
    DropSchema();
  }

  CreateSchema();
}

bool CardStore::SchemaMatches() {
  for (const char* check : kSchemaChecks) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db_->Handle(), check, -1, &st, nullptr);
    sqlite3_finalize(st);
    if (rc != SQLITE_OK) {
      logr::debug << "[CardStore] schema check failed: "
                  << sqlite3_errmsg(db_->Handle());
      return false;
    }
  }

  std::optional<std::string> stored;
  {
    Statement st(*db_, "SELECT schema_version FROM metadata WHERE id = 1;");
    if (st.Step())
      stored = st.ColText(0);
  }
  if (stored && *stored != kSchemaVersion) {
    logr::debug << "[CardStore] stored schema version " << *stored
                << " != " << kSchemaVersion;
    return false;
  }
  return true;
}

void CardStore::DropSchema() {
  std::vector<std::string> tables;
  {
    Statement st(*db_,
                 "SELECT name FROM sqlite_master WHERE type='table' "
                 "AND name NOT LIKE 'sqlite_%';");
    while (st.Step())
      tables.push_back(st.ColText(0));
  }

  SqliteTransaction tx(*db_);
  for (const auto& t : tables) {
    logr::debug << "[CardStore] dropping table " << t;
    std::string quoted = "\"";
    for (char c : t) {
      quoted += c;
      if (c == '"')
        quoted += '"';
    }
    quoted += '"';
    db_->Exec("DROP TABLE IF EXISTS " + quoted + ";");
  }
  tx.Commit();
}

void CardStore::CreateSchema() {
  SqliteTransaction tx(*db_);
  db_->Exec(kCreateSchema);
  EnsureMetadata(tx);
  tx.Commit();
}

void CardStore::EnsureMetadata(SqliteTransaction& tx) {
  Statement st(tx.DB(),
               "INSERT INTO metadata(id, last_refresh, schema_version) "
               "VALUES(1, 0, ?) ON CONFLICT(id) DO NOTHING;");
  st.Bind(1, std::string(kSchemaVersion));
  if (st.Run() > 0)
    logr::debug << "[CardStore] created metadata row";
}

std::unique_ptr<SqliteTransaction> CardStore::Begin(
  SqliteTransaction::Mode mode) {
  return std::make_unique<SqliteTransaction>(*db_, mode);
}

// ------------------------------------------------------------------
// Cards
// ------------------------------------------------------------------

std::optional<CardRecord> CardStore::GetById(const std::string& id) {
  SqliteTransaction tx(*db_, SqliteTransaction::Mode::Deferred);
  std::optional<CardRecord> out;
  {
    Statement st(*db_,
                 "SELECT id, name, foreign_id, payload FROM card WHERE id = ?;");
    st.Bind(1, id);
    if (st.Step())
      out = ReadCard(st);
  }
  tx.Commit();
  return out;
}

std::vector<CardRecord> CardStore::FindCards(
  const char* sql, const std::function<void(Statement&)>& bind) {
  SqliteTransaction tx(*db_, SqliteTransaction::Mode::Deferred);
  std::vector<CardRecord> out;
  {
    Statement st(*db_, sql);
    bind(st);
    while (st.Step())
      out.push_back(ReadCard(st));
  }
  tx.Commit();
  return out;
}

std::vector<CardRecord> CardStore::FindByName(const std::string& name) {
  return FindCards(
    "SELECT id, name, foreign_id, payload FROM card WHERE name = ?;",
    [&](Statement& st) { st.Bind(1, name); });
}

std::vector<CardRecord> CardStore::FindByForeignId(std::int64_t foreign_id) {
  return FindCards(
    "SELECT id, name, foreign_id, payload FROM card WHERE foreign_id = ?;",
    [&](Statement& st) { st.Bind(1, foreign_id); });
}

bool CardStore::InsertCard(const CardRecord& record) {
  SqliteTransaction tx(*db_);
  bool inserted = InsertCard(tx, record);
  tx.Commit();
  return inserted;
}

bool CardStore::InsertCard(SqliteTransaction& tx, const CardRecord& record) {
  Statement st(tx.DB(),
               "INSERT INTO card(id, name, foreign_id, payload) "
               "VALUES(?, ?, ?, ?) ON CONFLICT(id) DO NOTHING;");
  st.Bind(1, record.id)
    .Bind(2, record.name)
    .Bind(3, record.foreign_id)
    .Bind(4, record.payload.dump());
  return st.Run() > 0;
}

void CardStore::ClearAllCards() {
  SqliteTransaction tx(*db_);
  ClearAllCards(tx);
  tx.Commit();
}

void CardStore::ClearAllCards(SqliteTransaction& tx) {
  Statement st(tx.DB(), "DELETE FROM card;");
  int removed = st.Run();
  logr::debug << "[CardStore] cleared " << removed << " card(s)";
}

std::int64_t CardStore::CountCards() {
  SqliteTransaction tx(*db_, SqliteTransaction::Mode::Deferred);
  std::int64_t n = 0;
  {
    Statement st(*db_, "SELECT COUNT(*) FROM card;");
    if (st.Step())
      n = st.ColInt64(0);
  }
  tx.Commit();
  return n;
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

CacheMetadata CardStore::GetMetadata() {
  SqliteTransaction tx(*db_);
  EnsureMetadata(tx);
  CacheMetadata m;
  {
    Statement st(*db_,
                 "SELECT last_refresh, schema_version FROM metadata "
                 "WHERE id = 1;");
    if (!st.Step())
      throw StoreError("metadata row missing after creation");
    m.last_bulk_refresh = st.ColInt64(0);
    m.schema_version = st.ColText(1);
  }
  tx.Commit();
  return m;
}

void CardStore::SetMetadata(std::int64_t last_bulk_refresh) {
  SqliteTransaction tx(*db_);
  SetMetadata(tx, last_bulk_refresh);
  tx.Commit();
}

void CardStore::SetMetadata(SqliteTransaction& tx,
                            std::int64_t last_bulk_refresh) {
  EnsureMetadata(tx);
  Statement st(tx.DB(), "UPDATE metadata SET last_refresh = ? WHERE id = 1;");
  st.Bind(1, last_bulk_refresh);
  st.Run();
  logr::debug << "[CardStore] last bulk refresh now " << last_bulk_refresh;
}

// ------------------------------------------------------------------
// URL response cache
// ------------------------------------------------------------------

std::optional<UrlResponseCacheEntry> CardStore::GetUrlEntry(
  const std::string& url) {
  SqliteTransaction tx(*db_, SqliteTransaction::Mode::Deferred);
  std::optional<UrlResponseCacheEntry> out;
  {
    Statement st(*db_,
                 "SELECT url, fetched_at, payload FROM url_cache "
                 "WHERE url = ?;");
    st.Bind(1, url);
    if (st.Step()) {
      UrlResponseCacheEntry e;
      e.url = st.ColText(0);
      e.fetched_at = st.ColInt64(1);
      e.payload = ParsePayload(st.ColText(2));
      out = std::move(e);
    }
  }
  tx.Commit();
  return out;
}

void CardStore::PutUrlEntry(const std::string& url, std::int64_t fetched_at,
                            const nlohmann::json& payload) {
  SqliteTransaction tx(*db_);
  {
    Statement st(*db_,
                 "INSERT INTO url_cache(url, fetched_at, payload) "
                 "VALUES(?, ?, ?) ON CONFLICT(url) DO UPDATE SET "
                 "fetched_at = excluded.fetched_at, "
                 "payload = excluded.payload;");
    st.Bind(1, url).Bind(2, fetched_at).Bind(3, payload.dump());
    st.Run();
  }
  tx.Commit();
}
