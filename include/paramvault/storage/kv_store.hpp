#pragma once

#include "paramvault/common/result.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace paramvault::storage {

using KvEntry = std::pair<std::string, std::string>;

/// Return false to stop the scan early.
using KvVisitor = std::function<bool(const std::string &key, const std::string &value)>;

/// Durable string-to-string mapping, partitioned by table name. Every write is
/// committed before the call returns.
class IKvStore {
public:
  virtual ~IKvStore() = default;

  /// NotFound when the key is absent.
  [[nodiscard]] virtual common::Result<std::string> get(const std::string &table,
                                                        const std::string &key) = 0;
  [[nodiscard]] virtual common::Status set(const std::string &table, const std::string &key,
                                           const std::string &value) = 0;
  /// All entries land or none do.
  [[nodiscard]] virtual common::Status set_batch(const std::string &table,
                                                 const std::vector<KvEntry> &entries) = 0;
  /// Returns whether a row was removed.
  [[nodiscard]] virtual common::Result<bool> remove(const std::string &table,
                                                    const std::string &key) = 0;
  [[nodiscard]] virtual common::Result<bool> contains(const std::string &table,
                                                      const std::string &key) = 0;
  [[nodiscard]] virtual common::Status for_each(const std::string &table,
                                                const KvVisitor &visitor) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>> keys(const std::string &table) = 0;
};

} // namespace paramvault::storage
