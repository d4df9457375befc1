#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <FrameKit/Networking/UdpDatagramTransport.hpp>
#include <FrameKit/Networking/DatagramChannel.hpp>
#include <FrameKit/Networking/EndpointText.hpp>

#include <markerlink/protocol/ports.hpp>
#include <markerlink/services/Collaborators.h>
#include <markerlink/services/WireSupport.h>

/*
    SessionLink

    Purpose:
      - Point-to-point UDP link between a host and the client that matched its
        marker token. One dual-stack socket per side (RX + TX).
      - Host: Listen() binds the session port. A CLAIM teaches it the client
        endpoint; it replies ACK and starts heartbeating.
      - Client: RequestConnection(address) binds an ephemeral port and sends CLAIM
        to address:port every claim_interval_sec until ACK arrives.
      - Link health: connected while the handshake is done and the last packet
        from the peer is younger than disconnect_sec.

    Session replication on top of the link is not handled here.
*/

class SessionLink : public markerlink::ISessionConnector {
public:
    struct Params {
        uint16_t port = markerlink::protocol::ports::SESSION;

        uint64_t node_id = 0;

        float  heartbeat_hz = 2.0f;
        double disconnect_sec = 2.5;
        double claim_interval_sec = 0.5;
    };

    enum class Mode : uint8_t { None, Host, Client };

    struct Health {
        uint64_t rx_packets = 0;
        uint64_t tx_packets = 0;
        uint64_t rx_heartbeat = 0;
        uint64_t tx_heartbeat = 0;
        uint64_t tx_claims = 0;

        bool connected = false;

        std::chrono::steady_clock::time_point last_rx{};
        std::chrono::steady_clock::time_point last_hb_rx{};
        std::chrono::steady_clock::time_point last_hb_tx{};
    };

public:
    SessionLink() = default;
    ~SessionLink() override;

    SessionLink(const SessionLink&) = delete;
    SessionLink& operator=(const SessionLink&) = delete;

    bool Configure(const Params& p);
    void Shutdown();

    void Tick(double dt_seconds);

    // Host side.
    bool Listen();

    // ISessionConnector (client side)
    bool RequestConnection(const std::string& address) override;
    bool IsConnected() const override { return m_Health.connected; }
    void CancelConnection() override;

    Mode GetMode() const { return m_Mode; }
    bool HasPeer() const { return m_HasPeer; }
    uint64_t GetPeerNodeId() const { return m_PeerNodeId; }
    const Health& GetHealth() const { return m_Health; }

private:
    bool OpenSocket(uint16_t bind_port);
    void CloseSocket();
    void ClearPeer();
    bool SubscribeLink(uint16_t msg_type,
        void (*fn)(void*, const FrameKit::Net::HeaderView&, FrameKit::Net::ConstByteSpan, const FrameKit::Net::Endpoint&));

    void TickClaim(double dt_seconds);
    void TickHeartbeat(double dt_seconds);
    void UpdateConnectionState();

    FrameKit::Net::NetErr SendToPeer(uint16_t msg_type, const void* body, size_t size);

    static void OnClaim(void* user, const FrameKit::Net::HeaderView& hdr,
        FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint& from);
    static void OnAck(void* user, const FrameKit::Net::HeaderView& hdr,
        FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint& from);
    static void OnHeartbeat(void* user, const FrameKit::Net::HeaderView& hdr,
        FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint& from);

private:
    Params m_Params{};
    Health m_Health{};
    bool m_Configured = false;

    FrameKit::Net::UdpDatagramTransport m_Udp{};
    FrameKit::Net::DatagramChannel      m_Ch{};
    bool m_Open = false;

    Mode m_Mode = Mode::None;

    bool m_HasPeer = false;
    bool m_Handshaked = false;
    bool m_Claiming = false;
    uint64_t m_PeerNodeId = 0;
    FrameKit::Net::Endpoint m_Peer{};

    double   m_ClaimAccumSec = 0.0;
    double   m_HbAccumSec = 0.0;
    uint32_t m_Seq = 0;
    uint32_t m_HbCounter = 0;

    markerlink::wire::RateLimiter m_SummaryLog{ 0.0, 5.0 };
};
