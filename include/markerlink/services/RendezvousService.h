#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <markerlink/services/Collaborators.h>
#include <markerlink/services/DiscoveryTransport.h>

/*
    RendezvousService

    Purpose:
      - Marker-keyed discovery between a host (broadcasts the token of the marker
        it just detected) and a client (listens, and connects to the host whose
        token equals the marker it is rendering).
      - Drives IDiscoveryTransport start/stop and ISessionConnector from Tick().

    Host:   Idle -> Broadcasting -> Stopping -> Broadcasting (payload changed)
    Client: Idle -> Listening -> Stopping -> Connecting -> Connected
            Connecting -> Failed -> Idle -> Listening   (connect timeout)

    Single-flight:
      - IsStopping() is true while a restart or stop-and-connect cycle runs.
        Requests arriving meanwhile are dropped, never queued.

    Tick discipline:
      - Every wait below resumes on a later Tick(), never inside the call that
        started it. A stop additionally waits for IsStopComplete() (or
        stop_timeout_sec).
      - Owner order per frame: transport Tick, connector Tick, then this Tick.

    Collaborators are borrowed; they must outlive the service (or Shutdown()).
*/

class RendezvousService {
public:
    struct Params {
        // false: ManualStart() returns without touching the transport.
        bool auto_start = true;

        // Client only; lets the rest of the networking stack warm up.
        double client_start_delay_sec = 3.0;

        // <= 0 waits forever.
        double connect_timeout_sec = 10.0;
        double retry_delay_sec = 1.0;

        // Upper bound on waiting for the transport stop acknowledgment.
        double stop_timeout_sec = 1.0;

        // Payload broadcast before any marker has been detected.
        std::string initial_payload;
    };

    struct Collaborators {
        markerlink::IDiscoveryTransport* transport = nullptr;     // required
        markerlink::IPlatformProbe*      platform = nullptr;      // required
        markerlink::ISessionConnector*   connector = nullptr;     // required for Client
        markerlink::IMarkerSource*       marker_source = nullptr; // required for Client
        markerlink::IMarkerDetector*     marker_detector = nullptr; // optional, Host
    };

    enum class State : uint8_t {
        Idle,
        Broadcasting,
        Listening,
        Stopping,
        Connecting,
        Connected,
        Failed,
        Disabled
    };

    struct Stats {
        uint64_t restarts = 0;
        uint64_t dropped_restarts = 0;
        uint64_t undecodable_broadcasts = 0;
        uint64_t matches = 0;
        uint64_t connect_timeouts = 0;
        uint64_t transport_failures = 0;
    };

    using SessionFoundFn = void (*)(void* user);

public:
    RendezvousService() = default;
    ~RendezvousService();

    RendezvousService(const RendezvousService&) = delete;
    RendezvousService& operator=(const RendezvousService&) = delete;

    bool Init(const Params& p, const Collaborators& c);
    void Shutdown();

    void ManualStart();

    void Tick(double dt_seconds);

    // Host input (also wired to Collaborators::marker_detector when present).
    void OnMarkerDetected(int32_t marker_id, const markerlink::Vec3& position, const markerlink::Quat& rotation);

    // Client input (wired to the transport's broadcast handler by Init).
    void OnBroadcastReceived(const std::string& from_address, const std::string& data);

    /*
        Session-found observers.

        Fired once per successful match, before the connect sequence starts.
        Returns a non-zero subscription id.
    */
    uint32_t SubscribeSessionFound(SessionFoundFn fn, void* user);
    void UnsubscribeSessionFound(uint32_t id);

    State GetState() const { return m_State; }
    bool IsStopping() const { return m_Stopping; }
    markerlink::Role GetRole() const { return m_Role; }
    bool IsStarted() const { return m_Started; }
    const std::string& GetBroadcastPayload() const { return m_Payload; }
    const std::string& GetPeerAddress() const { return m_PeerAddress; }
    const Stats& GetStats() const { return m_Stats; }

    static const char* ToString(State s);

private:
    enum class Step : uint8_t {
        None,
        HostAwaitStop,
        HostAwaitInit,
        ClientAwaitStop,
        ClientAwaitConnect,
        ClientRetry
    };

    struct Observer {
        uint32_t id = 0;
        SessionFoundFn fn = nullptr;
        void* user = nullptr;
    };

private:
    void SetState(State s);
    void EnterStep(Step s);
    bool StopAcknowledged();

    bool StartListening();
    void AbortRestart(const char* why);
    void FailConnect(const char* why);
    void PublishSessionFound();

    static void MarkerTrampoline(void* user, int32_t marker_id,
        const markerlink::Vec3& position, const markerlink::Quat& rotation);
    static void BroadcastTrampoline(void* user, const std::string& from_address, const std::string& data);

private:
    Params m_Params{};
    Collaborators m_Collab{};

    bool m_Initialized = false;
    bool m_Started = false;
    bool m_StartPending = false;
    double m_StartDelayAccum = 0.0;

    markerlink::Role m_Role = markerlink::Role::Client;
    State m_State = State::Idle;
    bool m_Stopping = false;

    std::string m_Payload;
    std::string m_PendingPayload;
    std::string m_PeerAddress;

    Step     m_Step = Step::None;
    uint32_t m_StepTicks = 0;
    double   m_StepElapsed = 0.0;

    std::vector<Observer> m_Observers;
    uint32_t m_NextObserverId = 1;

    Stats m_Stats{};
};
