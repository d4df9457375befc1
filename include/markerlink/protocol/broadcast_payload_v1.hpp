#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <markerlink/protocol/protocol_version.hpp>

namespace markerlink::protocol {

    /*
        Discovery broadcast (TOPIC_DISCOVERY)

        Datagram layout after WireHeaderV1:

            DiscoveryPreambleV1 | token text

        Token text is ASCII "|<int32>|". Anything after the second delimiter is
        ignored by receivers, so hosts may append fields later without breaking
        older clients.
    */
    static constexpr uint16_t MSG_DISCOVERY_BROADCAST_V1 = 1;

    static constexpr uint32_t DEFAULT_BROADCAST_KEY = 2222;

    // Upper bound for the token text carried in one broadcast.
    static constexpr size_t kMaxBroadcastPayload = 1024;

    static constexpr char kTokenDelimiter = '|';

#pragma pack(push, 1)
    struct DiscoveryPreambleV1 {
        uint32_t key = DEFAULT_BROADCAST_KEY;
        uint16_t version = CURRENT_VERSION.major;
        uint16_t subversion = CURRENT_VERSION.minor;
    };
#pragma pack(pop)

    static_assert(sizeof(DiscoveryPreambleV1) == 8, "DiscoveryPreambleV1 size mismatch");

    // "|<token>|"
    std::string EncodeMarkerToken(int32_t token);

    // First non-empty '|' segment parsed as int32. False when there is no segment
    // or it is not an integer (the latter is logged).
    bool DecodeMarkerToken(std::string_view payload, int32_t& out);

    void EncodeDiscoveryPayload(const DiscoveryPreambleV1& preamble, std::string_view text,
        std::vector<uint8_t>& out);

    bool DecodeDiscoveryPayload(const uint8_t* data, size_t size,
        DiscoveryPreambleV1& out_preamble, std::string& out_text);

    inline bool SamePreamble(const DiscoveryPreambleV1& a, const DiscoveryPreambleV1& b) {
        return a.key == b.key && a.version == b.version && a.subversion == b.subversion;
    }

} // namespace markerlink::protocol
