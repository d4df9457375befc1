#pragma once
#include <cstdint>

namespace markerlink::protocol {

    /*
        Protocol versioning

        MAJOR and MINOR are carried in every discovery preamble as
        version / subversion; listeners drop broadcasts that do not match.

        Increment MAJOR if:
        - wire header or preamble layout changes
        - token text format changes incompatibly

        Increment MINOR if:
        - new message types are added
        - hosts and clients of different builds must not pair

        PATCH is for documentation / comments only.
    */
    struct ProtocolVersion {
        uint16_t major;
        uint16_t minor;
        uint16_t patch;
    };

    static constexpr ProtocolVersion CURRENT_VERSION {
        1,  // major
        1,  // minor
        0   // patch
    };

} // namespace markerlink::protocol
