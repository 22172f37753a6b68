#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/params/record_codec.hpp"
#include "paramvault/params/unlock_registry.hpp"
#include "paramvault/storage/kv_store.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace paramvault::params {

constexpr const char *PARAMS_TABLE = "params";

struct SessionOptions {
  bool read_only = true;
  /// Unset means the store's default-open-method.
  std::optional<std::string> open_method;
};

/// Return false to stop iterating.
using ItemVisitor = std::function<bool(const std::string &name, const std::string &value)>;

/// Encrypted name/value mapping. Keys are resolved through the registry on first
/// use and kept for the lifetime of the object; a failed unlock leaves the store
/// locked and the next call tries again.
class ParameterStore {
public:
  ParameterStore(storage::IKvStore &store, UnlockRegistry &registry, SessionOptions options = {});

  [[nodiscard]] common::Status unlock();
  [[nodiscard]] bool is_unlocked() const { return keys_.has_value(); }

  [[nodiscard]] bool read_only() const { return options_.read_only; }
  void set_read_only(bool read_only) { options_.read_only = read_only; }

  [[nodiscard]] common::Result<std::string> get(const std::string &name);
  [[nodiscard]] common::Status set(const std::string &name, const std::string &value);
  /// Removing an absent name succeeds.
  [[nodiscard]] common::Status remove(const std::string &name);
  [[nodiscard]] common::Result<bool> contains(const std::string &name);

  /// Single pass over stored secrets, decrypting one row at a time. Not a snapshot.
  [[nodiscard]] common::Status for_each_item(const ItemVisitor &visitor);
  [[nodiscard]] common::Result<std::vector<std::string>> keys();
  [[nodiscard]] common::Result<std::vector<std::string>> values();
  [[nodiscard]] common::Result<std::vector<SecretPair>> items();

private:
  [[nodiscard]] common::Status require_writable() const;
  [[nodiscard]] common::Result<std::string> digest_for(const std::string &name);

  storage::IKvStore &store_;
  UnlockRegistry &registry_;
  SessionOptions options_;
  std::optional<UnlockedKeys> keys_;
};

} // namespace paramvault::params
