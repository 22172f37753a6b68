#pragma once

#include "paramvault/storage/kv_store.hpp"

#include <filesystem>
#include <sqlite3.h>

namespace paramvault::storage {

class SqliteKvStore final : public IKvStore {
public:
  explicit SqliteKvStore(std::filesystem::path db_path);
  ~SqliteKvStore() override;

  SqliteKvStore(const SqliteKvStore &) = delete;
  SqliteKvStore &operator=(const SqliteKvStore &) = delete;

  /// Error from opening the database, if any. Every other call fails the same way.
  [[nodiscard]] const common::Status &status() const { return open_status_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Result<std::string> get(const std::string &table,
                                                const std::string &key) override;
  [[nodiscard]] common::Status set(const std::string &table, const std::string &key,
                                   const std::string &value) override;
  [[nodiscard]] common::Status set_batch(const std::string &table,
                                         const std::vector<KvEntry> &entries) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &table,
                                            const std::string &key) override;
  [[nodiscard]] common::Result<bool> contains(const std::string &table,
                                              const std::string &key) override;
  [[nodiscard]] common::Status for_each(const std::string &table,
                                        const KvVisitor &visitor) override;
  [[nodiscard]] common::Result<std::vector<std::string>> keys(const std::string &table) override;

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status upsert(const std::string &table, const std::string &key,
                                      const std::string &value);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  common::Status open_status_ = common::Status::success();
};

} // namespace paramvault::storage
