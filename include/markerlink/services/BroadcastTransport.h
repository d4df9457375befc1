#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <FrameKit/Networking/UdpDatagramTransport.hpp>
#include <FrameKit/Networking/DatagramChannel.hpp>
#include <FrameKit/Networking/EndpointText.hpp>

#include <markerlink/protocol/broadcast_payload_v1.hpp>
#include <markerlink/protocol/ports.hpp>
#include <markerlink/services/DiscoveryTransport.h>
#include <markerlink/services/WireSupport.h>

/*
    BroadcastTransport

    Purpose:
      - UDP broadcast discovery over FrameKit (WireHeaderV1 framed datagrams).
      - Server mode: one IPv4 socket on an ephemeral port, sends the current
        payload to broadcast_address:port every broadcast_interval_sec.
      - Client mode: one IPv4 socket bound to port, polls and forwards every
        datagram whose preamble (key/version/subversion) matches ours.

    Stop semantics:
      - StopBroadcast() only flags the stop. Sockets are closed on the next
        Tick(), after which IsStopComplete() returns true. Nothing is sent or
        delivered between the two.

    Everything runs on the thread that calls Tick(); the broadcast handler is
    invoked from inside Tick().
*/

class BroadcastTransport : public markerlink::IDiscoveryTransport {
public:
    struct Params {
        uint16_t port = markerlink::protocol::ports::DISCOVERY_BROADCAST;
        std::string broadcast_address = markerlink::protocol::ports::BROADCAST_ADDRESS;

        markerlink::protocol::DiscoveryPreambleV1 preamble{};

        double broadcast_interval_sec = 1.0;
    };

    enum class Mode : uint8_t { None, Server, Client };

    struct Stats {
        uint64_t tx_broadcasts = 0;
        uint64_t tx_failures = 0;
        uint64_t rx_broadcasts = 0;
        uint64_t rx_rejected = 0;
    };

public:
    BroadcastTransport() = default;
    ~BroadcastTransport() override;

    BroadcastTransport(const BroadcastTransport&) = delete;
    BroadcastTransport& operator=(const BroadcastTransport&) = delete;

    bool Configure(const Params& p);
    void Shutdown();

    void Tick(double dt_seconds);

    // IDiscoveryTransport
    bool Initialize(const std::string& payload) override;
    bool StartAsServer() override;
    bool StartAsClient() override;
    void StopBroadcast() override;
    bool IsStopComplete() const override { return !m_StopPending && !m_Open; }
    void SetBroadcastHandler(BroadcastFn fn, void* user) override;

    bool IsRunning() const { return m_Running; }
    Mode GetMode() const { return m_Mode; }
    const std::string& GetPayload() const { return m_Payload; }
    const Stats& GetStats() const { return m_Stats; }

private:
    bool OpenSocket(uint16_t bind_port, bool listen);
    void CloseSocket();
    void SendBroadcast();

    static void OnDatagram(void* user,
        const FrameKit::Net::HeaderView& hdr,
        FrameKit::Net::ConstByteSpan payload,
        const FrameKit::Net::Endpoint& from);

private:
    Params m_Params{};
    bool m_Configured = false;

    FrameKit::Net::UdpDatagramTransport m_Udp{};
    FrameKit::Net::DatagramChannel      m_Ch{};
    bool m_Open = false;

    FrameKit::Net::Endpoint m_BroadcastTo{};

    std::string m_Payload{};
    std::vector<uint8_t> m_Datagram{};

    bool m_Initialized = false;
    bool m_Running = false;
    bool m_StopPending = false;
    Mode m_Mode = Mode::None;

    double   m_SendAccumSec = 0.0;
    uint32_t m_Seq = 0;

    BroadcastFn m_Handler = nullptr;
    void* m_HandlerUser = nullptr;

    Stats m_Stats{};
    markerlink::wire::RateLimiter m_RejectLog{ 0.0, 5.0 };
    markerlink::wire::RateLimiter m_TxLog{ 0.0, 10.0 };
    double m_LastDt = 0.0;
};
