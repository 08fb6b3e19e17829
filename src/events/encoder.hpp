#pragma once

#include <vector>
#include "codec/address.hpp"
#include "events/decoder.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::events {

// Struct tag of the event itself. Scheduled wrappers derive their type
// parameter from the carried request; other kinds take `generics`.
StructTag event_struct_tag(const NexusEventKind& kind, const codec::Address& package,
                           const std::vector<TypeTag>& generics = {});

// Produces the ledger shape decode_event() consumes: wrapper type text and
// {"event": payload} with untagged scheduled requests.
ledger::LedgerEvent encode_event(const NexusEvent& event, const codec::Address& primitives_pkg_id,
                                 const codec::Address& event_pkg_id);

}  // namespace nexus::events
