#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <FrameKit/Networking/UdpDatagramTransport.hpp>
#include <FrameKit/Networking/DatagramChannel.hpp>
#include <FrameKit/Networking/EndpointText.hpp>

/*
    Glue shared by the FrameKit-based services:
      - WireHeaderV1 codec for DatagramChannel (Framed mode)
      - endpoint text helpers
      - a dt-driven rate limiter for periodic logs
*/

namespace markerlink::wire {

    FrameKit::Net::HeaderCodecOps MakeHeaderCodec();

    FrameKit::Net::DatagramChannelConfig MakeChannelConfig();

    void EndpointToText(const FrameKit::Net::Endpoint& ep, char* out, size_t out_sz);

    bool MakeEndpointFromIpPort(const std::string& ip, uint16_t port, FrameKit::Net::Endpoint& out);

    // "10.0.0.5:47777" -> "10.0.0.5", "[fe80::1]:47777" -> "fe80::1".
    // Text without a port is returned unchanged.
    std::string AddressFromEndpointText(std::string_view text);

    struct RateLimiter {
        double acc = 0.0;
        double every = 1.0;
        bool Step(double dt) {
            if (dt < 0.0 || dt > 5.0) dt = 0.0;
            acc += dt;
            if (acc >= every) { acc = 0.0; return true; }
            return false;
        }
    };

} // namespace markerlink::wire
