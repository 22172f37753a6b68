#include "paramvault/params/parameter_store.hpp"

#include "paramvault/observability/global.hpp"

namespace paramvault::params {

ParameterStore::ParameterStore(storage::IKvStore &store, UnlockRegistry &registry,
                               SessionOptions options)
    : store_(store), registry_(registry), options_(std::move(options)) {}

common::Status ParameterStore::unlock() {
  if (keys_.has_value()) {
    return common::Status::success();
  }
  auto resolved = registry_.resolve(options_.open_method);
  if (!resolved.ok()) {
    return common::Status::error(resolved.error(), resolved.code());
  }
  keys_.emplace(std::move(resolved.value()));
  return common::Status::success();
}

common::Status ParameterStore::require_writable() const {
  if (options_.read_only) {
    return common::Status::error("parameter store is read-only",
                                 common::ErrorCode::PermissionDenied);
  }
  return common::Status::success();
}

common::Result<std::string> ParameterStore::digest_for(const std::string &name) {
  const auto unlocked = unlock();
  if (!unlocked.ok()) {
    return common::Result<std::string>::failure(unlocked.error(), unlocked.code());
  }
  return digest(keys_->name_key(), name);
}

common::Result<std::string> ParameterStore::get(const std::string &name) {
  const auto key = digest_for(name);
  if (!key.ok()) {
    return key;
  }
  const auto stored = store_.get(PARAMS_TABLE, key.value());
  if (!stored.ok()) {
    if (stored.code() == common::ErrorCode::NotFound) {
      return common::Result<std::string>::failure("parameter not found",
                                                  common::ErrorCode::NotFound);
    }
    return stored;
  }
  auto pair = decode(keys_->value_key(), key.value(), stored.value());
  if (!pair.ok()) {
    return common::Result<std::string>::failure(pair.error(), pair.code());
  }
  if (pair.value().name != name) {
    return common::Result<std::string>::failure("authentication failed",
                                                common::ErrorCode::AuthenticationFailed);
  }
  return common::Result<std::string>::success(std::move(pair.value().value));
}

common::Status ParameterStore::set(const std::string &name, const std::string &value) {
  const auto writable = require_writable();
  if (!writable.ok()) {
    return writable;
  }
  const auto key = digest_for(name);
  if (!key.ok()) {
    return common::Status::error(key.error(), key.code());
  }
  const auto blob = encode(keys_->value_key(), key.value(), name, value);
  if (!blob.ok()) {
    return common::Status::error(blob.error(), blob.code());
  }
  return store_.set(PARAMS_TABLE, key.value(), blob.value());
}

common::Status ParameterStore::remove(const std::string &name) {
  const auto writable = require_writable();
  if (!writable.ok()) {
    return writable;
  }
  const auto key = digest_for(name);
  if (!key.ok()) {
    return common::Status::error(key.error(), key.code());
  }
  const auto removed = store_.remove(PARAMS_TABLE, key.value());
  if (!removed.ok()) {
    return common::Status::error(removed.error(), removed.code());
  }
  return common::Status::success();
}

common::Result<bool> ParameterStore::contains(const std::string &name) {
  const auto key = digest_for(name);
  if (!key.ok()) {
    return common::Result<bool>::failure(key.error(), key.code());
  }
  return store_.contains(PARAMS_TABLE, key.value());
}

common::Status ParameterStore::for_each_item(const ItemVisitor &visitor) {
  const auto unlocked = unlock();
  if (!unlocked.ok()) {
    return unlocked;
  }

  std::uint64_t rows = 0;
  common::Status decode_status = common::Status::success();
  const auto scanned = store_.for_each(
      PARAMS_TABLE, [this, &visitor, &rows, &decode_status](const std::string &key,
                                                            const std::string &blob) {
        ++rows;
        auto pair = decode(keys_->value_key(), key, blob);
        if (!pair.ok()) {
          decode_status = common::Status::error(pair.error(), pair.code());
          return false;
        }
        return visitor(pair.value().name, pair.value().value);
      });
  observability::record_scan_rows(rows);
  if (!scanned.ok()) {
    return scanned;
  }
  return decode_status;
}

common::Result<std::vector<std::string>> ParameterStore::keys() {
  std::vector<std::string> out;
  const auto status = for_each_item([&out](const std::string &name, const std::string &) {
    out.push_back(name);
    return true;
  });
  if (!status.ok()) {
    return common::Result<std::vector<std::string>>::failure(status.error(), status.code());
  }
  return common::Result<std::vector<std::string>>::success(std::move(out));
}

common::Result<std::vector<std::string>> ParameterStore::values() {
  std::vector<std::string> out;
  const auto status = for_each_item([&out](const std::string &, const std::string &value) {
    out.push_back(value);
    return true;
  });
  if (!status.ok()) {
    return common::Result<std::vector<std::string>>::failure(status.error(), status.code());
  }
  return common::Result<std::vector<std::string>>::success(std::move(out));
}

common::Result<std::vector<SecretPair>> ParameterStore::items() {
  std::vector<SecretPair> out;
  const auto status = for_each_item([&out](const std::string &name, const std::string &value) {
    out.push_back(SecretPair{.name = name, .value = value});
    return true;
  });
  if (!status.ok()) {
    return common::Result<std::vector<SecretPair>>::failure(status.error(), status.code());
  }
  return common::Result<std::vector<SecretPair>>::success(std::move(out));
}

} // namespace paramvault::params
