#include "markerlink/services/RendezvousService.h"

#include <algorithm>
#include <utility>

#include <FrameKit/Debug/Log.h>

#include <markerlink/protocol/broadcast_payload_v1.hpp>

using markerlink::Role;

const char* RendezvousService::ToString(State s)
{
    switch (s) {
    case State::Idle:         return "Idle";
    case State::Broadcasting: return "Broadcasting";
    case State::Listening:    return "Listening";
    case State::Stopping:     return "Stopping";
    case State::Connecting:   return "Connecting";
    case State::Connected:    return "Connected";
    case State::Failed:       return "Failed";
    case State::Disabled:     return "Disabled";
    }
    return "?";
}

RendezvousService::~RendezvousService()
{
    Shutdown();
}

bool RendezvousService::Init(const Params& p, const Collaborators& c)
{
    if (m_Initialized) {
        FK_WARN("[Rdv] Init ignored: already initialized (role={})", markerlink::ToString(m_Role));
        return false;
    }

    if (!c.transport) {
        FK_ERROR("[Rdv] Init failed: no discovery transport");
        return false;
    }
    if (!c.platform) {
        FK_ERROR("[Rdv] Init failed: no platform probe");
        return false;
    }
    if (p.client_start_delay_sec < 0.0 || p.retry_delay_sec < 0.0 || p.stop_timeout_sec < 0.0) {
        FK_ERROR("[Rdv] Init failed: negative delay (start={} retry={} stop={})",
            p.client_start_delay_sec, p.retry_delay_sec, p.stop_timeout_sec);
        return false;
    }

    const Role role = c.platform->DetectRole();

    if (role == Role::Client) {
        if (!c.connector) {
            FK_ERROR("[Rdv] Init failed: client role needs a session connector");
            return false;
        }
        if (!c.marker_source) {
            FK_ERROR("[Rdv] Init failed: client role needs a marker source");
            return false;
        }
    }

    m_Role = role;

    std::string error;
    if (!c.platform->CheckVisionBackend(error)) {
        FK_ERROR("[Rdv] Vision backend unavailable ({}); rendezvous disabled on this device", error);
        SetState(State::Disabled);
        return false;
    }

    m_Params = p;
    m_Collab = c;
    m_Payload = p.initial_payload;
    m_PendingPayload.clear();
    m_PeerAddress.clear();
    m_Stopping = false;
    m_Started = false;
    m_Step = Step::None;
    m_State = State::Idle;

    m_Collab.transport->SetBroadcastHandler(&RendezvousService::BroadcastTrampoline, this);
    m_Initialized = true;

    FK_INFO("[Rdv] Init: role={} auto_start={} start_delay={}s connect_timeout={}s",
        markerlink::ToString(m_Role),
        (int)m_Params.auto_start,
        m_Params.client_start_delay_sec,
        m_Params.connect_timeout_sec);

    if (m_Role == Role::Host || m_Params.client_start_delay_sec <= 0.0) {
        ManualStart();
    }
    else {
        m_StartPending = true;
        m_StartDelayAccum = 0.0;
    }
    return true;
}

void RendezvousService::Shutdown()
{
    if (!m_Initialized) return;

    FK_INFO("[Rdv] Shutdown (state={})", ToString(m_State));

    if (m_Role == Role::Host && m_Collab.marker_detector) {
        m_Collab.marker_detector->SetMarkerDetectedHandler(nullptr, nullptr);
    }

    m_Collab.transport->SetBroadcastHandler(nullptr, nullptr);
    m_Collab.transport->StopBroadcast();

    if (m_Step == Step::ClientAwaitConnect && m_Collab.connector) {
        m_Collab.connector->CancelConnection();
    }

    m_Initialized = false;
    m_Started = false;
    m_StartPending = false;
    m_Stopping = false;
    m_Step = Step::None;
    SetState(State::Idle);
    m_Collab = Collaborators{};
}

void RendezvousService::ManualStart()
{
    if (!m_Initialized) {
        FK_WARN("[Rdv] ManualStart ignored: not initialized");
        return;
    }
    m_StartPending = false;

    if (m_Started) {
        FK_WARN("[Rdv] ManualStart ignored: already started");
        return;
    }

    if (!m_Params.auto_start) {
        FK_INFO("[Rdv] ManualStart: auto_start disabled, transport left idle");
        return;
    }

    m_Started = true;

    if (m_Role == Role::Client) {
        if (!StartListening()) {
            FailConnect("could not start listening");
        }
        return;
    }

    // The hookup does not depend on the server: a later marker restarts it.
    if (m_Collab.marker_detector) {
        m_Collab.marker_detector->SetMarkerDetectedHandler(&RendezvousService::MarkerTrampoline, this);
    }
    else {
        FK_WARN("[Rdv] No marker detector; marker hookup skipped (OnMarkerDetected must be called directly)");
    }

    if (!m_Collab.transport->Initialize(m_Payload) || !m_Collab.transport->StartAsServer()) {
        m_Stats.transport_failures++;
        FK_ERROR("[Rdv] ManualStart: broadcast server failed to start");
        m_Payload.clear();
        SetState(State::Idle);
        return;
    }
    SetState(State::Broadcasting);
}

bool RendezvousService::StartListening()
{
    if (!m_Collab.transport->Initialize(m_Payload) || !m_Collab.transport->StartAsClient()) {
        m_Stats.transport_failures++;
        return false;
    }
    SetState(State::Listening);
    return true;
}

void RendezvousService::OnMarkerDetected(int32_t marker_id, const markerlink::Vec3&, const markerlink::Quat&)
{
    if (m_Role != Role::Host || !m_Started) return;

    std::string data = markerlink::protocol::EncodeMarkerToken(marker_id);

    if (data == m_Payload) return;

    if (m_Stopping) {
        m_Stats.dropped_restarts++;
        FK_INFO("[Rdv] Marker {} dropped: broadcast restart already in flight", marker_id);
        return;
    }

    FK_INFO("[Rdv] Marker {} detected; restarting broadcast '{}' -> '{}'", marker_id, m_Payload, data);

    m_Stopping = true;
    m_PendingPayload = std::move(data);
    SetState(State::Stopping);
    m_Collab.transport->StopBroadcast();
    EnterStep(Step::HostAwaitStop);
}

void RendezvousService::OnBroadcastReceived(const std::string& from_address, const std::string& data)
{
    if (m_Role == Role::Host) return;
    if (!m_Initialized || m_State == State::Disabled) return;

    int32_t token = 0;
    if (!markerlink::protocol::DecodeMarkerToken(data, token)) {
        m_Stats.undecodable_broadcasts++;
        return;
    }

    int32_t mine = 0;
    if (!m_Collab.marker_source->TryGetMarkerId(mine)) return;

    if (token != mine || m_Stopping || m_Collab.connector->IsConnected()) return;

    m_Stats.matches++;
    FK_INFO("[Rdv] Host {} is broadcasting our marker {}; joining", from_address, token);

    PublishSessionFound();

    m_Stopping = true;
    m_PeerAddress = from_address;
    SetState(State::Stopping);
    m_Collab.transport->StopBroadcast();
    EnterStep(Step::ClientAwaitStop);
}

void RendezvousService::Tick(double dt_seconds)
{
    if (!m_Initialized) return;
    if (dt_seconds < 0.0 || dt_seconds > 5.0) dt_seconds = 0.0;

    if (m_StartPending) {
        m_StartDelayAccum += dt_seconds;
        if (m_StartDelayAccum >= m_Params.client_start_delay_sec) {
            ManualStart();
        }
        return;
    }

    ++m_StepTicks;
    m_StepElapsed += dt_seconds;

    switch (m_Step) {
    case Step::None:
        if (m_State == State::Connected && !m_Collab.connector->IsConnected()) {
            FK_WARN("[Rdv] Session link to {} lost; listening again", m_PeerAddress);
            m_Collab.connector->CancelConnection();
            m_PeerAddress.clear();
            SetState(State::Idle);
            if (!StartListening()) FailConnect("could not restart listening");
        }
        return;

    case Step::HostAwaitStop:
        if (!StopAcknowledged()) return;
        if (!m_Collab.transport->Initialize(m_PendingPayload)) {
            AbortRestart("Initialize failed");
            return;
        }
        EnterStep(Step::HostAwaitInit);
        return;

    case Step::HostAwaitInit:
        if (!m_Collab.transport->StartAsServer()) {
            AbortRestart("StartAsServer failed");
            return;
        }
        m_Payload = std::move(m_PendingPayload);
        m_PendingPayload.clear();
        m_Stats.restarts++;
        m_Stopping = false;
        EnterStep(Step::None);
        SetState(State::Broadcasting);
        return;

    case Step::ClientAwaitStop:
        if (!StopAcknowledged()) return;
        if (!m_Collab.connector->RequestConnection(m_PeerAddress)) {
            FailConnect("connection request refused");
            return;
        }
        SetState(State::Connecting);
        EnterStep(Step::ClientAwaitConnect);
        return;

    case Step::ClientAwaitConnect:
        if (m_Collab.connector->IsConnected()) {
            m_Stopping = false;
            EnterStep(Step::None);
            SetState(State::Connected);
            return;
        }
        if (m_Params.connect_timeout_sec > 0.0 && m_StepElapsed >= m_Params.connect_timeout_sec) {
            m_Stats.connect_timeouts++;
            m_Collab.connector->CancelConnection();
            FailConnect("connect timed out");
        }
        return;

    case Step::ClientRetry:
        if (m_StepElapsed < m_Params.retry_delay_sec) return;
        EnterStep(Step::None);
        m_PeerAddress.clear();
        SetState(State::Idle);
        if (!StartListening()) FailConnect("could not restart listening");
        return;
    }
}

bool RendezvousService::StopAcknowledged()
{
    if (m_StepTicks < 1) return false;
    if (m_Collab.transport->IsStopComplete()) return true;

    if (m_StepElapsed >= m_Params.stop_timeout_sec) {
        FK_WARN("[Rdv] Transport stop not acknowledged after {}s ({} ticks); proceeding",
            m_StepElapsed, (unsigned)m_StepTicks);
        return true;
    }
    return false;
}

void RendezvousService::AbortRestart(const char* why)
{
    m_Stats.transport_failures++;
    FK_ERROR("[Rdv] Broadcast restart aborted: {} (payload='{}')", why, m_PendingPayload);
    // Nothing is on air now, so any marker, the same one included, restarts the server.
    m_Payload.clear();
    m_PendingPayload.clear();
    m_Stopping = false;
    EnterStep(Step::None);
    SetState(State::Idle);
}

void RendezvousService::FailConnect(const char* why)
{
    FK_WARN("[Rdv] Join {} failed: {}; retrying in {}s", m_PeerAddress, why, m_Params.retry_delay_sec);
    m_Stopping = false;
    SetState(State::Failed);
    EnterStep(Step::ClientRetry);
}

void RendezvousService::EnterStep(Step s)
{
    m_Step = s;
    m_StepTicks = 0;
    m_StepElapsed = 0.0;
}

void RendezvousService::SetState(State s)
{
    if (m_State == s) return;
    FK_INFO("[Rdv] {} -> {}", ToString(m_State), ToString(s));
    m_State = s;
}

uint32_t RendezvousService::SubscribeSessionFound(SessionFoundFn fn, void* user)
{
    if (!fn) return 0;

    Observer o{};
    o.id = m_NextObserverId++;
    o.fn = fn;
    o.user = user;
    m_Observers.push_back(o);
    return o.id;
}

void RendezvousService::UnsubscribeSessionFound(uint32_t id)
{
    m_Observers.erase(std::remove_if(m_Observers.begin(), m_Observers.end(),
        [id](const Observer& o) { return o.id == id; }), m_Observers.end());
}

void RendezvousService::PublishSessionFound()
{
    // Observers may unsubscribe from inside the callback.
    const std::vector<Observer> snapshot = m_Observers;
    for (const auto& o : snapshot) {
        o.fn(o.user);
    }
}

void RendezvousService::MarkerTrampoline(void* user, int32_t marker_id,
    const markerlink::Vec3& position, const markerlink::Quat& rotation)
{
    auto* self = static_cast<RendezvousService*>(user);
    if (self) self->OnMarkerDetected(marker_id, position, rotation);
}

void RendezvousService::BroadcastTrampoline(void* user, const std::string& from_address, const std::string& data)
{
    auto* self = static_cast<RendezvousService*>(user);
    if (self) self->OnBroadcastReceived(from_address, data);
}
