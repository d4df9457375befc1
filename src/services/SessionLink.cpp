#include "markerlink/services/SessionLink.h"

#include <cstring>

#include <FrameKit/Debug/Log.h>

#include <markerlink/protocol/heartbeat_v1.hpp>
#include <markerlink/protocol/link_handshake_v1.hpp>
#include <markerlink/protocol/topics.hpp>

using namespace markerlink::protocol;
using markerlink::wire::EndpointToText;

SessionLink::~SessionLink()
{
    Shutdown();
}

bool SessionLink::Configure(const Params& p)
{
    if (m_Open) {
        FK_ERROR("[Link] Configure refused: link is open");
        return false;
    }

    m_Params = p;

    FK_INFO("[Link] Configure: port={} node_id={} hb_hz={} disc_sec={} claim_sec={}",
        (unsigned)m_Params.port,
        (unsigned long long)m_Params.node_id,
        m_Params.heartbeat_hz,
        m_Params.disconnect_sec,
        m_Params.claim_interval_sec
    );

    if (m_Params.heartbeat_hz <= 0.0f) {
        FK_ERROR("[Link] Configure failed: heartbeat_hz must be > 0");
        return false;
    }
    if (m_Params.claim_interval_sec <= 0.0) {
        FK_ERROR("[Link] Configure failed: claim_interval_sec must be > 0");
        return false;
    }

    m_Configured = true;
    return true;
}

void SessionLink::Shutdown()
{
    if (m_Open) {
        FK_INFO("[Link] Shutdown");
    }
    CloseSocket();
    ClearPeer();
    m_Mode = Mode::None;
}

bool SessionLink::Listen()
{
    if (!m_Configured) {
        FK_ERROR("[Link] Listen failed: Configure() was not called");
        return false;
    }
    if (m_Open) {
        FK_WARN("[Link] Listen ignored: already open (mode={})", (int)m_Mode);
        return false;
    }

    if (!OpenSocket(m_Params.port)) return false;

    if (!SubscribeLink(MSG_LINK_CLAIM_V1, &SessionLink::OnClaim) ||
        !SubscribeLink(MSG_HEARTBEAT_V1, &SessionLink::OnHeartbeat)) {
        CloseSocket();
        return false;
    }

    m_Mode = Mode::Host;
    FK_INFO("[Link] Listening for claims on port {}", (unsigned)m_Params.port);
    return true;
}

bool SessionLink::RequestConnection(const std::string& address)
{
    if (!m_Configured) {
        FK_ERROR("[Link] RequestConnection failed: Configure() was not called");
        return false;
    }
    if (m_Mode == Mode::Host) {
        FK_ERROR("[Link] RequestConnection refused: link is listening as host");
        return false;
    }
    if (m_Open) {
        FK_WARN("[Link] RequestConnection ignored: already connecting/connected");
        return false;
    }

    FrameKit::Net::Endpoint target{};
    if (!markerlink::wire::MakeEndpointFromIpPort(address, m_Params.port, target)) {
        FK_ERROR("[Link] RequestConnection failed: bad address '{}'", address);
        return false;
    }

    if (!OpenSocket(0)) return false;

    if (!SubscribeLink(MSG_LINK_ACK_V1, &SessionLink::OnAck) ||
        !SubscribeLink(MSG_HEARTBEAT_V1, &SessionLink::OnHeartbeat)) {
        CloseSocket();
        return false;
    }

    m_Mode = Mode::Client;
    m_Peer = target;
    m_HasPeer = true;
    m_Claiming = true;
    // First CLAIM goes out on the next tick.
    m_ClaimAccumSec = m_Params.claim_interval_sec;

    char to_txt[128]{};
    EndpointToText(m_Peer, to_txt, sizeof(to_txt));
    FK_INFO("[Link] Connecting to {}", to_txt);
    return true;
}

void SessionLink::CancelConnection()
{
    if (m_Mode != Mode::Client) return;

    FK_INFO("[Link] Connection cancelled (connected={})", (int)m_Health.connected);
    CloseSocket();
    ClearPeer();
    m_Mode = Mode::None;
}

bool SessionLink::OpenSocket(uint16_t bind_port)
{
    FrameKit::Net::Endpoint bind{};
    if (FrameKit::Net::ParseEndpoint("[::]:0", bind, 0) != FrameKit::Net::NetErr::Ok) {
        bind = FrameKit::Net::Endpoint::FromV4(0, 0);
        FK_WARN("[Link] ParseEndpoint([::]:0) failed; fallback to v4 any");
    }

    if (bind.family == FrameKit::Net::AddressFamily::IPv6) bind.v6.port_host = bind_port;
    else                                                   bind.v4.port_host = bind_port;

    auto e = m_Udp.Open();
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Link] Open failed (port {}) err={}", (unsigned)bind_port, (int)e);
        return false;
    }

    (void)m_Udp.SetReuseAddr(true);
    (void)m_Udp.SetNonBlocking(true);
    (void)m_Udp.SetIPv6Only(false);

    e = m_Udp.Bind(bind);
    if (e != FrameKit::Net::NetErr::Ok) {
        char bind_txt[128]{};
        EndpointToText(bind, bind_txt, sizeof(bind_txt));
        FK_ERROR("[Link] Bind failed bind={} err={}", bind_txt, (int)e);
        m_Udp.Close();
        return false;
    }

    e = m_Ch.Open(&m_Udp, markerlink::wire::MakeChannelConfig(), markerlink::wire::MakeHeaderCodec());
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Link] Channel open failed err={}", (int)e);
        m_Udp.Close();
        return false;
    }

    m_Open = true;
    m_Health = Health{};
    return true;
}

void SessionLink::CloseSocket()
{
    if (!m_Open) return;

    m_Ch.Close();
    m_Udp.Close();
    m_Open = false;
}

void SessionLink::ClearPeer()
{
    m_HasPeer = false;
    m_Handshaked = false;
    m_Claiming = false;
    m_PeerNodeId = 0;
    m_Health.connected = false;
    std::memset(&m_Peer, 0, sizeof(m_Peer));
}

bool SessionLink::SubscribeLink(uint16_t msg_type,
    void (*fn)(void*, const FrameKit::Net::HeaderView&, FrameKit::Net::ConstByteSpan, const FrameKit::Net::Endpoint&))
{
    const auto e = m_Ch.Subscribe(TOPIC_LINK, msg_type, fn, this);
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Link] Subscribe FAILED msg={} err={}", (unsigned)msg_type, (int)e);
        return false;
    }
    return true;
}

FrameKit::Net::NetErr SessionLink::SendToPeer(uint16_t msg_type, const void* body, size_t size)
{
    if (!m_Open || !m_HasPeer) return FrameKit::Net::NetErr::Fail;

    FrameKit::Net::HeaderView hv{};
    hv.topic = TOPIC_LINK;
    hv.msg_type = msg_type;
    hv.seq = ++m_Seq;
    hv.src = m_Params.node_id;
    hv.dst = m_PeerNodeId;

    const auto e = m_Ch.SendTo(m_Peer, hv,
        FrameKit::Net::ConstByteSpan{ reinterpret_cast<const uint8_t*>(body), size });
    m_Health.tx_packets++;

    if (e != FrameKit::Net::NetErr::Ok) {
        char to_txt[128]{};
        EndpointToText(m_Peer, to_txt, sizeof(to_txt));
        FK_WARN("[Link] SendTo FAIL err={} to={} msg={} seq={}",
            (int)e, to_txt, (unsigned)msg_type, (unsigned)hv.seq);
    }
    return e;
}

void SessionLink::OnClaim(void* user, const FrameKit::Net::HeaderView& hdr,
    FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint& from)
{
    auto* self = static_cast<SessionLink*>(user);
    if (!self || self->m_Mode != Mode::Host) return;

    char from_txt[128]{};
    EndpointToText(from, from_txt, sizeof(from_txt));

    if (payload.size < sizeof(LinkClaimV1)) {
        FK_WARN("[Link] CLAIM from={} too short ({} bytes)", from_txt, (int)payload.size);
        return;
    }

    LinkClaimV1 claim{};
    std::memcpy(&claim, payload.data, sizeof(claim));

    const auto now = std::chrono::steady_clock::now();
    self->m_Health.rx_packets++;
    self->m_Health.last_rx = now;

    const bool fresh = !self->m_Handshaked || self->m_PeerNodeId != claim.node_id;

    self->m_Peer = from;
    self->m_PeerNodeId = claim.node_id;
    self->m_HasPeer = true;
    self->m_Handshaked = true;

    if (fresh) {
        FK_INFO("[Link] CLAIM accepted from={} node_id={} seq={}",
            from_txt, (unsigned long long)claim.node_id, (unsigned)hdr.seq);
    }

    LinkAckV1 ack{};
    ack.node_id = self->m_Params.node_id;
    (void)self->SendToPeer(MSG_LINK_ACK_V1, &ack, sizeof(ack));
}

void SessionLink::OnAck(void* user, const FrameKit::Net::HeaderView& hdr,
    FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint& from)
{
    auto* self = static_cast<SessionLink*>(user);
    if (!self || self->m_Mode != Mode::Client) return;

    char from_txt[128]{};
    EndpointToText(from, from_txt, sizeof(from_txt));

    if (payload.size < sizeof(LinkAckV1)) {
        FK_WARN("[Link] ACK from={} too short ({} bytes)", from_txt, (int)payload.size);
        return;
    }

    LinkAckV1 ack{};
    std::memcpy(&ack, payload.data, sizeof(ack));

    self->m_Health.rx_packets++;
    self->m_Health.last_rx = std::chrono::steady_clock::now();

    if (!self->m_Claiming) return;

    self->m_Claiming = false;
    self->m_Handshaked = true;
    self->m_PeerNodeId = ack.node_id;

    FK_INFO("[Link] ACK from={} node_id={} seq={} claims_sent={}",
        from_txt, (unsigned long long)ack.node_id, (unsigned)hdr.seq,
        (unsigned long long)self->m_Health.tx_claims);
}

void SessionLink::OnHeartbeat(void* user, const FrameKit::Net::HeaderView& hdr,
    FrameKit::Net::ConstByteSpan payload, const FrameKit::Net::Endpoint&)
{
    auto* self = static_cast<SessionLink*>(user);
    if (!self || !self->m_Handshaked) return;
    if (hdr.src != self->m_PeerNodeId) return;

    const auto now = std::chrono::steady_clock::now();
    self->m_Health.rx_packets++;
    self->m_Health.rx_heartbeat++;
    self->m_Health.last_rx = now;
    self->m_Health.last_hb_rx = now;

    if (payload.size < sizeof(HeartbeatV1)) {
        FK_WARN("[Link] HB RX seq={} short payload ({} bytes)", (unsigned)hdr.seq, (int)payload.size);
    }
}

void SessionLink::Tick(double dt_seconds)
{
    if (!m_Open) return;
    if (dt_seconds < 0.0 || dt_seconds > 1.0) dt_seconds = 0.0;

    (void)m_Ch.PollAll();

    TickClaim(dt_seconds);
    TickHeartbeat(dt_seconds);
    UpdateConnectionState();

    if (m_SummaryLog.Step(dt_seconds)) {
        FK_INFO("[Link] Tick: mode={} connected={} has_peer={} rx_pkts={} tx_pkts={} hb_rx={} hb_tx={}",
            (int)m_Mode,
            (int)m_Health.connected,
            (int)m_HasPeer,
            (unsigned long long)m_Health.rx_packets,
            (unsigned long long)m_Health.tx_packets,
            (unsigned long long)m_Health.rx_heartbeat,
            (unsigned long long)m_Health.tx_heartbeat
        );
    }
}

void SessionLink::TickClaim(double dt_seconds)
{
    if (!m_Claiming) return;

    m_ClaimAccumSec += dt_seconds;
    if (m_ClaimAccumSec < m_Params.claim_interval_sec) return;
    m_ClaimAccumSec = 0.0;

    LinkClaimV1 claim{};
    claim.node_id = m_Params.node_id;

    if (SendToPeer(MSG_LINK_CLAIM_V1, &claim, sizeof(claim)) == FrameKit::Net::NetErr::Ok) {
        m_Health.tx_claims++;
    }
}

void SessionLink::TickHeartbeat(double dt_seconds)
{
    if (!m_Handshaked || !m_HasPeer) return;

    m_HbAccumSec += dt_seconds;

    const double period = 1.0 / (double)m_Params.heartbeat_hz;

    int sent = 0;
    while (m_HbAccumSec >= period && sent < 4) {
        m_HbAccumSec -= period;
        ++sent;

        HeartbeatV1 hb{};
        hb.counter = ++m_HbCounter;
        hb.reserved = 0;

        (void)SendToPeer(MSG_HEARTBEAT_V1, &hb, sizeof(hb));

        m_Health.tx_heartbeat++;
        m_Health.last_hb_tx = std::chrono::steady_clock::now();
    }
}

void SessionLink::UpdateConnectionState()
{
    using clock = std::chrono::steady_clock;

    if (!m_Handshaked || m_Health.last_rx.time_since_epoch().count() == 0) {
        if (m_Health.connected) {
            m_Health.connected = false;
            FK_WARN("[Link] DISCONNECTED (no handshake)");
        }
        return;
    }

    const auto now = clock::now();
    const double age = std::chrono::duration<double>(now - m_Health.last_rx).count();
    const bool alive = (age <= m_Params.disconnect_sec);

    if (alive && !m_Health.connected) {
        m_Health.connected = true;
        FK_INFO("[Link] CONNECTED (last_rx_age={}s)", age);
    }
    else if (!alive && m_Health.connected) {
        m_Health.connected = false;
        FK_WARN("[Link] DISCONNECTED (last_rx_age={}s > {}s)", age, m_Params.disconnect_sec);
    }
}
