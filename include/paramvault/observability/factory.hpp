#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/config/schema.hpp"
#include "paramvault/observability/observer.hpp"

#include <memory>
#include <ostream>

namespace paramvault::observability {

/// Builds the observer named by observability.backend: "log", "none", or a
/// comma-separated list of those. Log output goes to log_stream (stderr when null).
[[nodiscard]] common::Result<std::unique_ptr<IObserver>>
create_observer(const config::Config &config, std::ostream *log_stream = nullptr);

} // namespace paramvault::observability
