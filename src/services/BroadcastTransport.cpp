#include "markerlink/services/BroadcastTransport.h"

#include <FrameKit/Debug/Log.h>

#include <markerlink/protocol/topics.hpp>

using namespace markerlink::protocol;
using markerlink::wire::EndpointToText;

BroadcastTransport::~BroadcastTransport()
{
    Shutdown();
}

bool BroadcastTransport::Configure(const Params& p)
{
    if (m_Open || m_Running) {
        FK_ERROR("[Bcast] Configure refused: transport is running");
        return false;
    }

    m_Params = p;

    FK_INFO("[Bcast] Configure: port={} broadcast_address='{}' key={} version={}.{} interval={}s",
        (unsigned)m_Params.port,
        m_Params.broadcast_address,
        (unsigned)m_Params.preamble.key,
        (unsigned)m_Params.preamble.version,
        (unsigned)m_Params.preamble.subversion,
        m_Params.broadcast_interval_sec
    );

    if (m_Params.broadcast_interval_sec <= 0.0) {
        FK_ERROR("[Bcast] Configure failed: broadcast_interval_sec must be > 0");
        return false;
    }

    if (!markerlink::wire::MakeEndpointFromIpPort(m_Params.broadcast_address, m_Params.port, m_BroadcastTo)) {
        FK_ERROR("[Bcast] Configure failed: bad broadcast address '{}'", m_Params.broadcast_address);
        return false;
    }

    m_Configured = true;
    return true;
}

void BroadcastTransport::Shutdown()
{
    if (m_Open) {
        FK_INFO("[Bcast] Shutdown: closing socket");
    }
    CloseSocket();

    m_Running = false;
    m_StopPending = false;
    m_Initialized = false;
    m_Mode = Mode::None;
}

bool BroadcastTransport::Initialize(const std::string& payload)
{
    if (!m_Configured) {
        FK_ERROR("[Bcast] Initialize failed: Configure() was not called");
        return false;
    }
    if (m_Running) {
        FK_WARN("[Bcast] Initialize ignored: already running");
        return false;
    }
    if (payload.size() > kMaxBroadcastPayload) {
        FK_ERROR("[Bcast] Initialize failed: payload too large ({} > {})",
            (int)payload.size(), (int)kMaxBroadcastPayload);
        return false;
    }

    m_Payload = payload;
    EncodeDiscoveryPayload(m_Params.preamble, m_Payload, m_Datagram);
    m_Initialized = true;

    FK_INFO("[Bcast] Initialized: payload='{}'", m_Payload);
    return true;
}

bool BroadcastTransport::StartAsServer()
{
    if (!m_Initialized) {
        FK_ERROR("[Bcast] StartAsServer failed: not initialized");
        return false;
    }
    if (m_Running || m_Open) {
        FK_WARN("[Bcast] StartAsServer ignored: already started (stop_pending={})", (int)m_StopPending);
        return false;
    }

    if (!OpenSocket(0, false)) return false;

    m_Mode = Mode::Server;
    m_Running = true;
    // First datagram goes out on the next tick.
    m_SendAccumSec = m_Params.broadcast_interval_sec;

    FK_INFO("[Bcast] Server started: payload='{}'", m_Payload);
    return true;
}

bool BroadcastTransport::StartAsClient()
{
    if (!m_Initialized) {
        FK_ERROR("[Bcast] StartAsClient failed: not initialized");
        return false;
    }
    if (m_Running || m_Open) {
        FK_WARN("[Bcast] StartAsClient ignored: already started (stop_pending={})", (int)m_StopPending);
        return false;
    }

    if (!OpenSocket(m_Params.port, true)) return false;

    const auto e = m_Ch.Subscribe(TOPIC_DISCOVERY, MSG_DISCOVERY_BROADCAST_V1,
        &BroadcastTransport::OnDatagram, this);
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Bcast] StartAsClient: Subscribe failed err={}", (int)e);
        CloseSocket();
        return false;
    }

    m_Mode = Mode::Client;
    m_Running = true;

    FK_INFO("[Bcast] Client listening on port {}", (unsigned)m_Params.port);
    return true;
}

void BroadcastTransport::StopBroadcast()
{
    if (!m_Running && !m_Open) return;

    m_Running = false;
    m_StopPending = true;
    FK_INFO("[Bcast] Stop requested (mode={})", (int)m_Mode);
}

void BroadcastTransport::SetBroadcastHandler(BroadcastFn fn, void* user)
{
    m_Handler = fn;
    m_HandlerUser = user;
}

bool BroadcastTransport::OpenSocket(uint16_t bind_port, bool listen)
{
    const FrameKit::Net::Endpoint bind = FrameKit::Net::Endpoint::FromV4(0, bind_port);

    auto e = m_Udp.Open();
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Bcast] Open failed err={}", (int)e);
        return false;
    }

    (void)m_Udp.SetReuseAddr(true);
    (void)m_Udp.SetNonBlocking(true);
    if (!listen) {
        e = m_Udp.SetBroadcast(true);
        if (e != FrameKit::Net::NetErr::Ok) {
            FK_ERROR("[Bcast] SetBroadcast failed err={}", (int)e);
            m_Udp.Close();
            return false;
        }
    }

    e = m_Udp.Bind(bind);
    if (e != FrameKit::Net::NetErr::Ok) {
        char bind_txt[128]{};
        EndpointToText(bind, bind_txt, sizeof(bind_txt));
        FK_ERROR("[Bcast] Bind failed bind={} err={}", bind_txt, (int)e);
        m_Udp.Close();
        return false;
    }

    e = m_Ch.Open(&m_Udp, markerlink::wire::MakeChannelConfig(), markerlink::wire::MakeHeaderCodec());
    if (e != FrameKit::Net::NetErr::Ok) {
        FK_ERROR("[Bcast] Channel open failed err={}", (int)e);
        m_Udp.Close();
        return false;
    }

    {
        char bind_txt[128]{};
        EndpointToText(bind, bind_txt, sizeof(bind_txt));
        FK_INFO("[Bcast] Socket bound: {} ({})", bind_txt, listen ? "rx" : "tx");
    }

    m_Open = true;
    return true;
}

void BroadcastTransport::CloseSocket()
{
    if (!m_Open) return;

    m_Ch.Close();
    m_Udp.Close();
    m_Open = false;
}

void BroadcastTransport::Tick(double dt_seconds)
{
    if (dt_seconds < 0.0 || dt_seconds > 1.0) dt_seconds = 0.0;
    m_LastDt = dt_seconds;

    if (m_StopPending) {
        CloseSocket();
        m_StopPending = false;
        m_Mode = Mode::None;
        FK_INFO("[Bcast] Stopped");
        return;
    }

    if (!m_Running) return;

    if (m_Mode == Mode::Client) {
        (void)m_Ch.PollAll();
        return;
    }

    m_SendAccumSec += dt_seconds;
    if (m_SendAccumSec >= m_Params.broadcast_interval_sec) {
        m_SendAccumSec = 0.0;
        SendBroadcast();
    }
}

void BroadcastTransport::SendBroadcast()
{
    FrameKit::Net::HeaderView hv{};
    hv.topic = TOPIC_DISCOVERY;
    hv.msg_type = MSG_DISCOVERY_BROADCAST_V1;
    hv.seq = ++m_Seq;
    hv.src = 0;
    hv.dst = 0;

    const auto e = m_Ch.SendTo(m_BroadcastTo, hv,
        FrameKit::Net::ConstByteSpan{ m_Datagram.data(), m_Datagram.size() });

    if (e != FrameKit::Net::NetErr::Ok) {
        m_Stats.tx_failures++;
        char to_txt[128]{};
        EndpointToText(m_BroadcastTo, to_txt, sizeof(to_txt));
        FK_WARN("[Bcast] SendTo FAIL err={} to={} seq={}", (int)e, to_txt, (unsigned)hv.seq);
        return;
    }

    m_Stats.tx_broadcasts++;
    if (m_TxLog.Step(m_Params.broadcast_interval_sec)) {
        FK_INFO("[Bcast] TX payload='{}' sent={} failed={}",
            m_Payload,
            (unsigned long long)m_Stats.tx_broadcasts,
            (unsigned long long)m_Stats.tx_failures);
    }
}

void BroadcastTransport::OnDatagram(void* user,
    const FrameKit::Net::HeaderView&,
    FrameKit::Net::ConstByteSpan payload,
    const FrameKit::Net::Endpoint& from)
{
    auto* self = static_cast<BroadcastTransport*>(user);
    if (!self) return;
    if (!self->m_Running || self->m_Mode != Mode::Client) return;

    DiscoveryPreambleV1 pre{};
    std::string text;
    const bool decoded = DecodeDiscoveryPayload(
        reinterpret_cast<const uint8_t*>(payload.data), payload.size, pre, text);

    if (!decoded || !SamePreamble(pre, self->m_Params.preamble)) {
        self->m_Stats.rx_rejected++;
        if (self->m_RejectLog.Step(self->m_LastDt) || self->m_Stats.rx_rejected == 1) {
            char from_txt[128]{};
            EndpointToText(from, from_txt, sizeof(from_txt));
            FK_WARN("[Bcast] RX rejected from={} bytes={} key={} version={}.{} (rejected={})",
                from_txt, (int)payload.size,
                (unsigned)pre.key, (unsigned)pre.version, (unsigned)pre.subversion,
                (unsigned long long)self->m_Stats.rx_rejected);
        }
        return;
    }

    char from_txt[128]{};
    EndpointToText(from, from_txt, sizeof(from_txt));
    const std::string address = markerlink::wire::AddressFromEndpointText(from_txt);

    self->m_Stats.rx_broadcasts++;

    if (self->m_Handler) self->m_Handler(self->m_HandlerUser, address, text);
}
