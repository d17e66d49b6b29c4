#include "SqliteDB.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

static int TraceSql(unsigned type, void*, void* p, void*) {
  if (type == SQLITE_TRACE_STMT) {
    auto* st = static_cast<sqlite3_stmt*>(p);
    if (char* sql = sqlite3_expanded_sql(st)) {
      logr::debug << "[SQL] " << sql;
      sqlite3_free(sql);
    }
  }
  return 0;
}

SqliteDB::SqliteDB(const std::filesystem::path& path, bool sql_debug)
    : path_(path) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                             SQLITE_OPEN_FULLMUTEX,
                           nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_)
      sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("cannot open " + path_.string() + ": " + msg);
  }

  if (sql_debug) {
    sqlite3_trace_v2(db_, SQLITE_TRACE_STMT, TraceSql, nullptr);
  }

  try {
    Configure();
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_)
    sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StoreError(msg + " (in: " + sql + ")");
  }
}

void SqliteDB::Configure() {
  // WAL lets readers keep a consistent snapshot while a refresh writes.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(SqliteDB& db, const char* sql) : db_(db) {
  sqlite3_stmt* st = nullptr;
  int rc = sqlite3_prepare_v2(db_.Handle(), sql, -1, &st, nullptr);
  stmt_.reset(st);
  ThrowIf(rc, db_.Handle(), "sqlite prepare");
}

Statement& Statement::Bind(int idx, const std::string& s) {
  ThrowIf(sqlite3_bind_text(stmt_.get(), idx, s.c_str(),
                            static_cast<int>(s.size()), SQLITE_TRANSIENT),
          db_.Handle(), "sqlite bind");
  return *this;
}

Statement& Statement::Bind(int idx, std::int64_t v) {
  ThrowIf(sqlite3_bind_int64(stmt_.get(), idx, static_cast<sqlite3_int64>(v)),
          db_.Handle(), "sqlite bind");
  return *this;
}

Statement& Statement::Bind(int idx, const std::optional<std::int64_t>& v) {
  if (!v.has_value()) {
    ThrowIf(sqlite3_bind_null(stmt_.get(), idx), db_.Handle(), "sqlite bind");
    return *this;
  }
  return Bind(idx, *v);
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db_.Handle()));
}

int Statement::Run() {
  while (Step()) {
  }
  return sqlite3_changes(db_.Handle());
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_.get(), col);
  if (!t)
    return {};
  return std::string(reinterpret_cast<const char*>(t),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), col)));
}

std::int64_t Statement::ColInt64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), col));
}

bool Statement::ColIsNull(int col) const {
  return sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL;
}

// ------------------------------------------------------------------
// Transaction
// ------------------------------------------------------------------

SqliteTransaction::SqliteTransaction(SqliteDB& db, Mode mode) : db_(db) {
  db_.Exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (open_) {
    // Destructors must not throw; report and carry on.
    char* err = nullptr;
    if (sqlite3_exec(db_.Handle(), "ROLLBACK;", nullptr, nullptr, &err) !=
        SQLITE_OK) {
      logr::error << "[SqliteTransaction] rollback failed: "
                  << (err ? err : sqlite3_errmsg(db_.Handle()));
    }
    sqlite3_free(err);
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  open_ = false;
}
