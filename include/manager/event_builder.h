// =============================================================================
// FILE: include/manager/event_builder.h
// =============================================================================
#ifndef MANAGER_EVENT_BUILDER_H
#define MANAGER_EVENT_BUILDER_H

#include "manager/ami_packet.h"
#include "manager/manager_event.h"
#include <string>

namespace asterisk_live {

// Maps a framed packet carrying "Event:" to its typed alternative.
// Names are matched case-insensitively; unknown names become GenericEvent.
ManagerEvent build_event(const AmiPacket& packet, EventId id);

// Maps a framed packet carrying "Response:" to a ManagerResponse.
ManagerResponse build_response(const AmiPacket& packet);

// Short type tag for logging ("NewChannel", "Generic", ...)
const char* event_type_name(const EventPayload& payload);

} // namespace asterisk_live
#endif // MANAGER_EVENT_BUILDER_H
