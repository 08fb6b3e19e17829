#include "core/config/correlation_id.hpp"
#include "codec/ed25519.hpp"
#include "codec/hex.hpp"

namespace nexus::core::config {

errors::Result<std::string> generate_correlation_id() {
    auto bytes = codec::random_bytes(4);
    if (errors::is_error(bytes)) {
        return errors::get_error(bytes);
    }
    return "nx-" + codec::hex_encode(errors::get_value(bytes));
}

}  // namespace nexus::core::config
