#pragma once
#include <cstdint>

namespace markerlink::protocol::ports {

    /*
        markerlink UDP Port Contract (Defaults)

        Applications MAY override these via CLI/config for deployments,
        but these defaults must remain stable for development and testing.
    */

    // Host broadcasts marker tokens here; clients bind RX here.
    static constexpr uint16_t DISCOVERY_BROADCAST = 47777;

    // Host binds the session link here; clients send CLAIM to <host address>:SESSION.
    static constexpr uint16_t SESSION = 7777;

    // Limited broadcast. Deployments on routed segments may use a directed broadcast instead.
    static constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";
}
