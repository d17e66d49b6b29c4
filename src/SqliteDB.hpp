#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

/*
  Thin RAII wrapper around sqlite3*.
  Errors surface as StoreError carrying sqlite3_errmsg().
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::filesystem::path& path, bool sql_debug = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&) = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

  // Execute one or more SQL statements without results.
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, busy timeout, ...)
  void Configure();

 private:
  sqlite3* db_ = nullptr;
  std::filesystem::path path_;
};

// Prepared statement; finalized on destruction.
class Statement {
 public:
  Statement(SqliteDB& db, const char* sql);

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(int idx, const std::string& s);
  Statement& Bind(int idx, std::int64_t v);
  Statement& Bind(int idx, const std::optional<std::int64_t>& v);

  // true while a row is available; throws on error.
  bool Step();

  // Runs a statement that returns no rows. Returns sqlite3_changes().
  int Run();

  std::string ColText(int col) const;
  std::int64_t ColInt64(int col) const;
  bool ColIsNull(int col) const;

 private:
  struct Finalizer {
    void operator()(sqlite3_stmt* st) const {
      sqlite3_finalize(st);
    }
  };

  SqliteDB& db_;
  std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

/*
  Scoped transaction. Rolls back on destruction unless committed.

  Immediate grabs the write lock up front so a read-then-write sequence
  cannot fail half way on SQLITE_BUSY; Deferred is for pure reads.
*/
class SqliteTransaction {
 public:
  enum class Mode { Deferred, Immediate };

  explicit SqliteTransaction(SqliteDB& db, Mode mode = Mode::Immediate);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  SqliteDB& DB() const {
    return db_;
  }

  void Commit();

 private:
  SqliteDB& db_;
  bool open_ = false;
};
