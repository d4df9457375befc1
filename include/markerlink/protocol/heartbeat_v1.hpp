#pragma once
#include <cstdint>

namespace markerlink::protocol {

    /*
        HeartbeatV1 (TOPIC_LINK)

        Sent periodically both directions once the claim/ack handshake is done.
        Drives SessionLink connection state.
    */
    static constexpr uint16_t MSG_HEARTBEAT_V1 = 1;

#pragma pack(push, 1)
    struct HeartbeatV1 {
        uint32_t counter;    // increments per sender
        uint32_t reserved;   // reserved for future fields
    };
#pragma pack(pop)

    static_assert(sizeof(HeartbeatV1) == 8, "HeartbeatV1 size mismatch");

} // namespace markerlink::protocol
