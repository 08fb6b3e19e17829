#pragma once

#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/nexus_errors.hpp"
#include "events/event_kinds.hpp"
#include "ledger/ledger_types.hpp"
#include "types/nexus_objects.hpp"
#include "types/type_tag.hpp"

namespace nexus::events {

// primitives::event::EventWrapper<T>
inline constexpr const char* kEventWrapperModule = "event";
inline constexpr const char* kEventWrapperName = "EventWrapper";

struct NexusEvent {
    ledger::EventId id;
    // Type parameters of the inner event; RequestScheduledExecution<T> has [T].
    std::vector<TypeTag> generics;
    NexusEventKind data;
};

// Decodes one wrapped event given its parsed outer type and JSON contents
// ({"event": {...}}).
//
// Errors (category Event):
//   not_nexus_event     outer type is not event::EventWrapper
//   not_a_struct        wrapper or scheduled type parameter is not a struct
//   unknown_event_kind  inner struct name is not a known kind
//   malformed_payload   missing fields or non-numeric stringified integers
core::errors::Result<NexusEvent> decode_event(const StructTag& wrapper,
                                              const nlohmann::json& contents,
                                              const ledger::EventId& id);

// As above, from the ledger's textual type. With `objects`, the emitting
// package must be a Nexus package and the wrapper must come from the
// primitives package.
core::errors::Result<NexusEvent> decode_event(const ledger::LedgerEvent& event,
                                              const types::NexusObjects* objects = nullptr);

}  // namespace nexus::events
