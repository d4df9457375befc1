#include "markerlink/services/WireSupport.h"

#include <cstring>

#include <markerlink/protocol/wire_header_v1.hpp>

using namespace markerlink::protocol;

namespace markerlink::wire {

    namespace {

        bool DecodeHdr(void*, FrameKit::Net::ConstByteSpan bytes,
            FrameKit::Net::HeaderView& out, size_t& out_header_size)
        {
            if (bytes.size < sizeof(WireHeaderV1)) return false;

            WireHeaderV1 wh{};
            std::memcpy(&wh, bytes.data, sizeof(WireHeaderV1));

            out.msg_type = wh.msg_type;
            out.flags = wh.flags;
            out.seq = wh.seq;
            out.ts_us = wh.ts_us;
            out.topic = wh.topic;
            out.src = wh.src;
            out.dst = wh.dst;

            out.extra_ptr = nullptr;
            out.extra_size = 0;

            out_header_size = sizeof(WireHeaderV1);
            return true;
        }

        size_t EncodeHdr(void*, FrameKit::Net::ByteSpan out_bytes,
            const FrameKit::Net::HeaderView& in)
        {
            if (out_bytes.size < sizeof(WireHeaderV1)) return 0;

            WireHeaderV1 wh{};
            wh.msg_type = (uint16_t)in.msg_type;
            wh.flags = (uint16_t)in.flags;
            wh.seq = (uint32_t)in.seq;
            wh.ts_us = (uint64_t)in.ts_us;
            wh.topic = (uint64_t)in.topic;
            wh.src = (uint64_t)in.src;
            wh.dst = (uint64_t)in.dst;

            std::memcpy(out_bytes.data, &wh, sizeof(WireHeaderV1));
            return sizeof(WireHeaderV1);
        }

    } // namespace

    FrameKit::Net::HeaderCodecOps MakeHeaderCodec()
    {
        FrameKit::Net::HeaderCodecOps ops{};
        ops.user = nullptr;
        ops.decode = &DecodeHdr;
        ops.encode = &EncodeHdr;
        return ops;
    }

    FrameKit::Net::DatagramChannelConfig MakeChannelConfig()
    {
        FrameKit::Net::DatagramChannelConfig cfg{};
        cfg.mode = FrameKit::Net::WireMode::Framed;
        cfg.use_header_crc = true;
        cfg.use_payload_crc = false;
        cfg.max_datagram = 1400;
        return cfg;
    }

    void EndpointToText(const FrameKit::Net::Endpoint& ep, char* out, size_t out_sz)
    {
        if (!out || out_sz == 0) return;
        out[0] = 0;
        (void)FrameKit::Net::FormatEndpoint(ep, out, out_sz);
    }

    bool MakeEndpointFromIpPort(const std::string& ip, uint16_t port, FrameKit::Net::Endpoint& out)
    {
        std::string s;

        const bool has_brackets = (!ip.empty() && ip.front() == '[');
        const bool looks_ipv6 = (ip.find(':') != std::string::npos);

        if (has_brackets)        s = ip + ":" + std::to_string((unsigned)port);
        else if (looks_ipv6)     s = "[" + ip + "]:" + std::to_string((unsigned)port);
        else                     s = ip + ":" + std::to_string((unsigned)port);

        return FrameKit::Net::ParseEndpoint(s.c_str(), out, 0) == FrameKit::Net::NetErr::Ok;
    }

    std::string AddressFromEndpointText(std::string_view text)
    {
        if (!text.empty() && text.front() == '[') {
            const size_t close = text.find(']');
            if (close == std::string_view::npos) return std::string(text);
            return std::string(text.substr(1, close - 1));
        }

        const size_t colon = text.rfind(':');
        if (colon == std::string_view::npos) return std::string(text);

        // Bare IPv6 without brackets carries no port we can split off safely.
        if (text.find(':') != colon) return std::string(text);

        return std::string(text.substr(0, colon));
    }

} // namespace markerlink::wire
