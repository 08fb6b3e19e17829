#pragma once
#include <string>
#include "core/errors/nexus_errors.hpp"

namespace nexus::core::config {

// "nx-" followed by 8 hex chars drawn from the OpenSSL RNG. Tags every
// log line of one CLI invocation.
errors::Result<std::string> generate_correlation_id();

}  // namespace nexus::core::config
