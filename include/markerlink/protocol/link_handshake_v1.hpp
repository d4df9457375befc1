#pragma once
#include <cstdint>

namespace markerlink::protocol {

/*
    Session link handshake messages

    These run on TOPIC_LINK alongside HeartbeatV1.

    Flow:
      Host broadcasts its marker token (TOPIC_DISCOVERY, see broadcast_payload_v1.hpp)
      Client matches the token, sends CLAIM unicast to <host address>:ports::SESSION
      Host learns the client endpoint from CLAIM, replies ACK unicast
      Both sides heartbeat once the handshake is done
*/

static constexpr uint16_t MSG_LINK_CLAIM_V1 = 3;
static constexpr uint16_t MSG_LINK_ACK_V1   = 4;

#pragma pack(push, 1)

struct LinkClaimV1 {
    uint64_t node_id  = 0;   // sender node id (client)
    uint32_t flags    = 0;   // reserved
    uint32_t reserved = 0;
};

struct LinkAckV1 {
    uint64_t node_id  = 0;   // sender node id (host)
    uint32_t flags    = 0;
    uint32_t reserved = 0;
};

#pragma pack(pop)

static_assert(sizeof(LinkClaimV1) == 16);
static_assert(sizeof(LinkAckV1)   == 16);

} // namespace markerlink::protocol
