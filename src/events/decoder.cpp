#include "events/decoder.hpp"

#include <utility>

namespace nexus::events {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError not_nexus(const std::string& reason) {
    return NexusError{ErrorCategory::Event, reason + ".", "not_nexus_event"};
}

NexusError not_a_struct(const std::string& reason) {
    return NexusError{ErrorCategory::Event, reason + ".", "not_a_struct"};
}

// The scheduled wrapper's payload has no discriminator for its request;
// the name comes from the wrapper's own type parameter. Each nesting level
// is tagged with its immediate parameter so Scheduled<Scheduled<X>> decodes.
core::errors::Status tag_scheduled_requests(const StructTag& tag, json& event) {
    if (tag.name != kScheduledExecutionName) {
        return core::errors::ok();
    }
    if (tag.type_params.empty() || !tag.type_params.front().is_struct()) {
        return not_a_struct(std::string(kScheduledExecutionName) +
                            " expects a struct type parameter");
    }
    const StructTag& inner = *tag.type_params.front().struct_tag;
    if (!event.is_object() || !event.contains("request")) {
        return NexusError{ErrorCategory::Event,
                          std::string(kScheduledExecutionName) + " payload has no request.",
                          "malformed_payload"};
    }

    json request = std::move(event["request"]);
    auto status = tag_scheduled_requests(inner, request);
    if (core::errors::is_error(status)) {
        return status;
    }
    event["request"] = json{{kEventTypeKey, inner.name}, {"event", std::move(request)}};
    return core::errors::ok();
}

}  // namespace

core::errors::Result<NexusEvent> decode_event(const StructTag& wrapper, const json& contents,
                                              const ledger::EventId& id) {
    if (wrapper.module != kEventWrapperModule || wrapper.name != kEventWrapperName) {
        return not_nexus("Event type " + types::to_string(wrapper) + " is not an event wrapper");
    }
    if (wrapper.type_params.empty() || !wrapper.type_params.front().is_struct()) {
        return not_a_struct("EventWrapper does not have a struct type parameter");
    }
    const StructTag& inner = *wrapper.type_params.front().struct_tag;
    if (!is_known_event_name(inner.name)) {
        return NexusError{ErrorCategory::Event, "Unknown event kind '" + inner.name + "'.",
                          "unknown_event_kind"};
    }
    if (!contents.is_object() || !contents.contains("event")) {
        return NexusError{ErrorCategory::Event, "Event contents missing 'event'.",
                          "malformed_payload"};
    }

    json payload = contents.at("event");
    auto tagged = tag_scheduled_requests(inner, payload);
    if (core::errors::is_error(tagged)) {
        return core::errors::get_error(tagged);
    }

    auto kind = kind_from_json(inner.name, payload);
    if (core::errors::is_error(kind)) {
        return core::errors::get_error(kind);
    }
    return NexusEvent{id, inner.type_params, core::errors::take_value(kind)};
}

core::errors::Result<NexusEvent> decode_event(const ledger::LedgerEvent& event,
                                              const types::NexusObjects* objects) {
    if (objects != nullptr && !objects->is_nexus_package(event.package_id)) {
        return not_nexus("Event comes from package " + event.package_id.to_hex() +
                         ", not a Nexus package");
    }

    auto wrapper = types::parse_type_tag(event.type);
    if (core::errors::is_error(wrapper)) {
        return core::errors::get_error(wrapper);
    }
    const TypeTag& tag = core::errors::get_value(wrapper);
    if (!tag.is_struct()) {
        return not_nexus("Event type '" + event.type + "' is not a struct");
    }
    if (objects != nullptr && tag.struct_tag->address != objects->primitives_pkg_id) {
        return not_nexus("Event wrapper does not come from the primitives package");
    }
    return decode_event(*tag.struct_tag, event.contents, event.id);
}

}  // namespace nexus::events
