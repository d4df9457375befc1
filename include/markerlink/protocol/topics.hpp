#pragma once
#include <cstdint>

namespace markerlink::protocol {

    /*
        Topics are high-level routing channels.
        They MUST remain stable once released.
    */
    enum : uint64_t {
        TOPIC_LINK      = 1,    // session link: claim/ack, heartbeat
        TOPIC_DISCOVERY = 10    // marker token broadcasts
    };

} // namespace markerlink::protocol
