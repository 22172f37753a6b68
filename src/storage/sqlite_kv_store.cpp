#include "paramvault/storage/sqlite_kv_store.hpp"

#include "paramvault/common/fs.hpp"

namespace paramvault::storage {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message, common::ErrorCode::StorageError);
  }
  return common::Status::success();
}

// A failed COMMIT can leave the transaction open; nothing may run inside it afterwards.
common::Status abort_transaction(sqlite3 *db, const common::Status &cause) {
  if (sqlite3_get_autocommit(db) != 0) {
    return cause;
  }
  const auto rollback = exec_sql(db, "ROLLBACK;");
  if (!rollback.ok()) {
    return common::Status::error(cause.error() + " (rollback failed: " + rollback.error() + ")",
                                 common::ErrorCode::StorageError);
  }
  return cause;
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  if (text == nullptr) {
    return "";
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // namespace

SqliteKvStore::SqliteKvStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    auto dir = common::ensure_private_dir(db_path_.parent_path());
    if (!dir.ok()) {
      open_status_ = common::Status::error(dir.error(), common::ErrorCode::StorageError);
      return;
    }
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message =
        db_ == nullptr ? "unable to open database" : std::string(sqlite3_errmsg(db_));
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    open_status_ = common::Status::error("failed to open " + db_path_.string() + ": " + message,
                                         common::ErrorCode::StorageError);
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  open_status_ = init_schema();
  if (!open_status_.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteKvStore::~SqliteKvStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteKvStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS tkv (
  table_name TEXT NOT NULL,
  key TEXT NOT NULL,
  value TEXT NOT NULL,
  UNIQUE(table_name, key) ON CONFLICT REPLACE
);
)");
}

common::Status SqliteKvStore::upsert(const std::string &table, const std::string &key,
                                     const std::string &value) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO tkv(table_name, key, value) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  bind_text(stmt, 1, table);
  bind_text(stmt, 2, key);
  bind_text(stmt, 3, value);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  return common::Status::success();
}

common::Result<std::string> SqliteKvStore::get(const std::string &table, const std::string &key) {
  if (db_ == nullptr) {
    return common::Result<std::string>::failure(open_status_.error(),
                                                common::ErrorCode::StorageError);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM tkv WHERE table_name = ?1 AND key = ?2", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::string>::failure(sqlite3_errmsg(db_),
                                                common::ErrorCode::StorageError);
  }
  bind_text(stmt, 1, table);
  bind_text(stmt, 2, key);
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    std::string value = column_text(stmt, 0);
    sqlite3_finalize(stmt);
    return common::Result<std::string>::success(std::move(value));
  }
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return common::Result<std::string>::failure("key not found", common::ErrorCode::NotFound);
  }
  return common::Result<std::string>::failure(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
}

common::Status SqliteKvStore::set(const std::string &table, const std::string &key,
                                  const std::string &value) {
  if (db_ == nullptr) {
    return common::Status::error(open_status_.error(), common::ErrorCode::StorageError);
  }
  return upsert(table, key, value);
}

common::Status SqliteKvStore::set_batch(const std::string &table,
                                        const std::vector<KvEntry> &entries) {
  if (db_ == nullptr) {
    return common::Status::error(open_status_.error(), common::ErrorCode::StorageError);
  }
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }
  for (const auto &[key, value] : entries) {
    status = upsert(table, key, value);
    if (!status.ok()) {
      return abort_transaction(db_, status);
    }
  }
  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    return abort_transaction(db_, status);
  }
  return status;
}

common::Result<bool> SqliteKvStore::remove(const std::string &table, const std::string &key) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure(open_status_.error(), common::ErrorCode::StorageError);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM tkv WHERE table_name = ?1 AND key = ?2", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  bind_text(stmt, 1, table);
  bind_text(stmt, 2, key);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<bool> SqliteKvStore::contains(const std::string &table, const std::string &key) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure(open_status_.error(), common::ErrorCode::StorageError);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM tkv WHERE table_name = ?1 AND key = ?2 LIMIT 1", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  bind_text(stmt, 1, table);
  bind_text(stmt, 2, key);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  return common::Result<bool>::success(rc == SQLITE_ROW);
}

common::Status SqliteKvStore::for_each(const std::string &table, const KvVisitor &visitor) {
  if (db_ == nullptr) {
    return common::Status::error(open_status_.error(), common::ErrorCode::StorageError);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT key, value FROM tkv WHERE table_name = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  bind_text(stmt, 1, table);

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    if (!visitor(column_text(stmt, 0), column_text(stmt, 1))) {
      rc = SQLITE_DONE;
      break;
    }
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_), common::ErrorCode::StorageError);
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> SqliteKvStore::keys(const std::string &table) {
  std::vector<std::string> out;
  auto status = for_each(table, [&out](const std::string &key, const std::string &) {
    out.push_back(key);
    return true;
  });
  if (!status.ok()) {
    return common::Result<std::vector<std::string>>::failure(status.error(), status.code());
  }
  return common::Result<std::vector<std::string>>::success(std::move(out));
}

} // namespace paramvault::storage
