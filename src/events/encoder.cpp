#include "events/encoder.hpp"

#include <utility>

namespace nexus::events {

StructTag event_struct_tag(const NexusEventKind& kind, const codec::Address& package,
                           const std::vector<TypeTag>& generics) {
    StructTag tag;
    tag.address = package;
    tag.module = kind.module();
    tag.name = kind.name();

    const auto* scheduled = kind.as<RequestScheduledExecution>();
    if (scheduled != nullptr && scheduled->request) {
        tag.type_params.push_back(TypeTag::of_struct(event_struct_tag(*scheduled->request, package)));
    } else {
        tag.type_params = generics;
    }
    return tag;
}

ledger::LedgerEvent encode_event(const NexusEvent& event, const codec::Address& primitives_pkg_id,
                                 const codec::Address& event_pkg_id) {
    StructTag wrapper;
    wrapper.address = primitives_pkg_id;
    wrapper.module = kEventWrapperModule;
    wrapper.name = kEventWrapperName;
    wrapper.type_params.push_back(
        TypeTag::of_struct(event_struct_tag(event.data, event_pkg_id, event.generics)));

    ledger::LedgerEvent out;
    out.id = event.id;
    out.package_id = event_pkg_id;
    out.type = types::to_string(wrapper);
    out.contents = nlohmann::json{{"event", kind_to_json(event.data)}};
    return out;
}

}  // namespace nexus::events
