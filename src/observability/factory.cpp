#include "paramvault/observability/factory.hpp"

#include "paramvault/common/fs.hpp"
#include "paramvault/observability/log_observer.hpp"
#include "paramvault/observability/multi_observer.hpp"

#include <sstream>
#include <vector>

namespace paramvault::observability {

namespace {

std::vector<std::string> split_backends(const std::string &list) {
  std::vector<std::string> names;
  std::stringstream stream(list);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::to_lower(common::trim(part));
    if (!part.empty()) {
      names.push_back(part);
    }
  }
  return names;
}

} // namespace

common::Result<std::unique_ptr<IObserver>> create_observer(const config::Config &config,
                                                           std::ostream *log_stream) {
  using ObserverResult = common::Result<std::unique_ptr<IObserver>>;

  const auto level = parse_log_level(config.observability.level);
  if (!level.has_value()) {
    return ObserverResult::failure("Invalid observability.level: " + config.observability.level,
                                   common::ErrorCode::InvalidArgument);
  }

  std::vector<std::unique_ptr<IObserver>> observers;
  for (const auto &name : split_backends(config.observability.backend)) {
    if (name == "log") {
      observers.push_back(std::make_unique<LogObserver>(*level, log_stream));
    } else if (name != "none" && name != "noop") {
      return ObserverResult::failure("Unknown observability.backend: " + name,
                                     common::ErrorCode::InvalidArgument);
    }
  }

  if (observers.empty()) {
    return ObserverResult::success(std::make_unique<NoopObserver>());
  }
  if (observers.size() == 1) {
    return ObserverResult::success(std::move(observers.front()));
  }
  return ObserverResult::success(std::make_unique<MultiObserver>(std::move(observers)));
}

} // namespace paramvault::observability
