#include "rendezvous_fakes.hpp"

#include <markerlink/services/RendezvousService.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using markerlink::Role;
using State = RendezvousService::State;
using namespace testing_fakes;

namespace {
void assertTrue(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void assertState(const RendezvousService& svc, State expected, const std::string& message) {
    if (svc.GetState() != expected) {
        throw std::runtime_error(message + " (expected=" + RendezvousService::ToString(expected) +
                                 ", got=" + RendezvousService::ToString(svc.GetState()) + ")");
    }
}

void countSessionFound(void* user) {
    ++*static_cast<int*>(user);
}

struct HostRig {
    FakeTransport transport{"10.0.0.1"};
    FakePlatform platform{Role::Host};
    FakeMarkerDetector detector;
    RendezvousService svc;

    bool init(bool withDetector = true, RendezvousService::Params params = {}) {
        RendezvousService::Collaborators c{};
        c.transport = &transport;
        c.platform = &platform;
        c.marker_detector = withDetector ? &detector : nullptr;
        return svc.Init(params, c);
    }

    void tick(double dt = 0.016) {
        transport.Tick();
        svc.Tick(dt);
    }
};

struct ClientRig {
    FakeTransport transport{"10.0.0.2"};
    FakePlatform platform{Role::Client};
    FakeConnector connector;
    FakeMarkerSource markers{7};
    RendezvousService svc;
    int sessionsFound = 0;

    static RendezvousService::Params immediate() {
        RendezvousService::Params p{};
        p.client_start_delay_sec = 0.0;
        return p;
    }

    bool init(RendezvousService::Params params = immediate()) {
        RendezvousService::Collaborators c{};
        c.transport = &transport;
        c.platform = &platform;
        c.connector = &connector;
        c.marker_source = &markers;
        svc.SubscribeSessionFound(&countSessionFound, &sessionsFound);
        return svc.Init(params, c);
    }

    void tick(double dt = 0.016) {
        transport.Tick();
        connector.Tick();
        svc.Tick(dt);
    }
};

void testHostStartsBroadcastingImmediately() {
    HostRig host;
    assertTrue(host.init(), "Host init must succeed");
    assertState(host.svc, State::Broadcasting, "Host broadcasts right after Init");
    assertTrue(host.transport.serverStarts == 1, "Server started once");
    assertTrue(host.transport.clientStarts == 0, "Host never listens");
    assertTrue(host.transport.initializedPayloads == std::vector<std::string>{""}, "Initial payload is empty");
    assertTrue(host.detector.hookups == 1 && host.detector.handler != nullptr, "Marker detector hooked up");
}

void testHostMarkerRestartsBroadcastAcrossTwoTicks() {
    HostRig host;
    host.init();

    host.detector.Detect(7);
    assertState(host.svc, State::Stopping, "Marker triggers a stop");
    assertTrue(host.svc.IsStopping(), "IsStopping set during restart");
    assertTrue(host.transport.stops == 1, "Transport asked to stop");
    assertTrue(host.transport.initializedPayloads.size() == 1, "Nothing reinitialized before a tick");

    host.tick();
    assertTrue(host.transport.initializedPayloads.back() == "|7|", "New payload initialized after the stop tick");
    assertTrue(host.transport.serverStarts == 1, "Server not restarted in the same tick");
    assertState(host.svc, State::Stopping, "Still restarting after first tick");

    host.tick();
    assertTrue(host.transport.serverStarts == 2, "Server restarted on the second tick");
    assertState(host.svc, State::Broadcasting, "Back to broadcasting");
    assertTrue(!host.svc.IsStopping(), "IsStopping cleared");
    assertTrue(host.svc.GetBroadcastPayload() == "|7|", "Payload carries the marker token");
    assertTrue(host.svc.GetStats().restarts == 1, "One restart recorded");
}

void testHostDuplicateMarkerDuringRestartRunsOneCycle() {
    HostRig host;
    host.init();

    host.detector.Detect(7);
    host.detector.Detect(7);
    for (int i = 0; i < 5; ++i) host.tick();

    assertTrue(host.transport.initializedPayloads == std::vector<std::string>{"", "|7|"},
               "Payload changed exactly once");
    assertTrue(host.transport.serverStarts == 2, "StartAsServer called once for the restart");
    assertTrue(host.svc.GetStats().restarts == 1, "Exactly one restart cycle");

    const int stopsBefore = host.transport.stops;
    host.detector.Detect(7);
    host.tick();
    assertTrue(host.transport.stops == stopsBefore, "Same marker after the restart is a no-op");
    assertState(host.svc, State::Broadcasting, "Still broadcasting");
}

void testHostNewMarkerWhileStoppingIsDropped() {
    HostRig host;
    host.init();

    host.detector.Detect(7);
    host.detector.Detect(8);
    assertTrue(host.svc.GetStats().dropped_restarts == 1, "Second marker dropped");

    for (int i = 0; i < 5; ++i) host.tick();
    assertTrue(host.svc.GetBroadcastPayload() == "|7|", "First marker wins");
    for (const auto& p : host.transport.initializedPayloads) {
        assertTrue(p != "|8|", "Dropped marker is never queued");
    }

    host.detector.Detect(8);
    for (int i = 0; i < 3; ++i) host.tick();
    assertTrue(host.svc.GetBroadcastPayload() == "|8|", "A later detection restarts normally");
    assertTrue(host.svc.GetStats().restarts == 2, "Two restarts in total");
}

void testHostWaitsForStopAcknowledgment() {
    HostRig host;
    host.init();
    host.transport.holdStop = true;

    host.detector.Detect(7);
    for (int i = 0; i < 5; ++i) host.tick(0.1);
    assertTrue(host.transport.initializedPayloads.size() == 1, "No reinitialize while the stop is pending");
    assertState(host.svc, State::Stopping, "Still stopping");

    host.transport.holdStop = false;
    host.tick(0.1);
    host.tick(0.1);
    assertState(host.svc, State::Broadcasting, "Restart completes once the stop is acknowledged");
}

void testHostStopTimeoutProceedsAndReportsStartFailure() {
    HostRig host;
    RendezvousService::Params params{};
    params.stop_timeout_sec = 0.35;
    host.init(true, params);
    host.transport.holdStop = true;

    host.detector.Detect(7);
    for (int i = 0; i < 3; ++i) host.tick(0.1);
    assertTrue(host.transport.initializedPayloads.size() == 1, "Waiting within the stop timeout");
    host.tick(0.1);
    assertTrue(host.transport.initializedPayloads.back() == "|7|", "Stop timeout lets the cycle proceed");

    host.tick(0.1);
    assertState(host.svc, State::Idle, "Server start failure leaves the host idle");
    assertTrue(!host.svc.IsStopping(), "Failure clears IsStopping");
    assertTrue(host.svc.GetStats().transport_failures == 1, "Failure counted");
}

void testHostRestartAbortAcceptsSameMarkerAgain() {
    HostRig host;
    RendezvousService::Params params{};
    params.stop_timeout_sec = 0.35;
    host.init(true, params);
    host.transport.holdStop = true;

    host.detector.Detect(7);
    for (int i = 0; i < 5; ++i) host.tick(0.1);
    assertState(host.svc, State::Idle, "Aborted restart leaves the host idle");
    assertTrue(!host.transport.running, "Nothing on air after the abort");
    assertTrue(host.svc.GetBroadcastPayload().empty(), "Aborted token is not kept as the current payload");

    host.transport.holdStop = false;
    host.transport.Tick();

    host.detector.Detect(7);
    for (int i = 0; i < 5; ++i) host.tick(0.1);
    assertState(host.svc, State::Broadcasting, "Same marker restarts the server after an abort");
    assertTrue(host.transport.running && host.transport.server, "Server running again");
    assertTrue(host.transport.serverStarts == 2, "Server started a second time");
    assertTrue(host.svc.GetBroadcastPayload() == "|7|", "Marker token on air");
}

void testHostStartFailureKeepsMarkerInput() {
    HostRig host;
    host.transport.failStart = true;
    assertTrue(host.init(), "Init succeeds even if the server cannot start yet");
    assertState(host.svc, State::Idle, "Start failure leaves the host idle");
    assertTrue(host.svc.GetStats().transport_failures == 1, "Start failure counted");
    assertTrue(host.detector.hookups == 1 && host.detector.handler != nullptr,
               "Marker detector hooked up despite the failed start");

    host.transport.failStart = false;
    host.detector.Detect(4);
    host.tick();
    host.tick();
    assertState(host.svc, State::Broadcasting, "Detection starts the server");
    assertTrue(host.svc.GetBroadcastPayload() == "|4|", "Detected marker on air");
}

void testHostWithoutDetectorStillAcceptsDirectCalls() {
    HostRig host;
    assertTrue(host.init(false), "Missing detector is not fatal for the host");
    assertState(host.svc, State::Broadcasting, "Host still broadcasts");
    assertTrue(host.detector.hookups == 0, "Nothing hooked up");

    host.svc.OnMarkerDetected(3, markerlink::Vec3{}, markerlink::Quat{});
    host.tick();
    host.tick();
    assertTrue(host.svc.GetBroadcastPayload() == "|3|", "Direct detection restarts the broadcast");
}

void testHostIgnoresBroadcasts() {
    HostRig host;
    host.init();
    host.svc.OnBroadcastReceived("10.0.0.9", "|0|");
    assertState(host.svc, State::Broadcasting, "Host ignores received broadcasts");
    assertTrue(host.transport.stops == 0, "No stop issued");
}

void testHostShutdownUnhooksDetector() {
    HostRig host;
    host.init();
    host.svc.Shutdown();
    assertTrue(host.detector.handler == nullptr, "Detector handler removed");
    assertTrue(host.transport.handler == nullptr, "Broadcast handler removed");
    assertTrue(!host.transport.running, "Transport stopped");
    assertState(host.svc, State::Idle, "Idle after shutdown");
}

void testClientStartsAfterDelay() {
    ClientRig client;
    RendezvousService::Params params{};
    params.client_start_delay_sec = 3.0;
    assertTrue(client.init(params), "Client init must succeed");
    assertState(client.svc, State::Idle, "Client waits before starting");

    for (int i = 0; i < 5; ++i) client.tick(0.5);
    assertTrue(client.transport.clientStarts == 0, "Not started before the delay");

    client.tick(0.5);
    assertTrue(client.transport.clientStarts == 1, "Started once the delay elapsed");
    assertTrue(client.transport.serverStarts == 0, "Client never broadcasts");
    assertState(client.svc, State::Listening, "Client listens");
}

void testAutoStartDisabledLeavesTransportIdle() {
    ClientRig client;
    RendezvousService::Params params = ClientRig::immediate();
    params.auto_start = false;
    assertTrue(client.init(params), "Init succeeds");
    assertTrue(client.transport.initializedPayloads.empty(), "Transport untouched");
    assertTrue(!client.svc.IsStarted(), "Not started");
    assertState(client.svc, State::Idle, "Idle");

    HostRig host;
    RendezvousService::Params hostParams{};
    hostParams.auto_start = false;
    host.init(true, hostParams);
    assertTrue(host.transport.serverStarts == 0, "Host transport untouched too");
    assertTrue(host.detector.hookups == 0, "No marker hookup without a start");
}

void testClientIgnoresNonMatchingTokens() {
    ClientRig client;
    client.init();

    client.transport.Deliver("10.0.0.1", "|8|");
    client.transport.Deliver("10.0.0.1", "garbage");
    client.transport.Deliver("10.0.0.1", "");
    for (int i = 0; i < 3; ++i) client.tick();

    assertState(client.svc, State::Listening, "Non-matching broadcasts keep the client listening");
    assertTrue(client.sessionsFound == 0, "No session found");
    assertTrue(client.connector.requests.empty(), "No connection requested");
    assertTrue(client.svc.GetStats().undecodable_broadcasts == 2, "Undecodable payloads counted");
}

void testClientMatchFiresOnceThenConnects() {
    ClientRig client;
    client.init();

    client.transport.Deliver("10.0.0.1", "|7|trailing");
    assertTrue(client.sessionsFound == 1, "Session found fired on match");
    assertState(client.svc, State::Stopping, "Match moves to Stopping");
    assertTrue(client.svc.IsStopping(), "IsStopping set");
    assertTrue(client.svc.GetPeerAddress() == "10.0.0.1", "Peer address recorded");

    client.svc.OnBroadcastReceived("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 1, "Repeated broadcast while stopping does not fire again");

    client.tick();
    assertState(client.svc, State::Connecting, "Connect requested after the stop tick");
    assertTrue(client.connector.requests == std::vector<std::string>{"10.0.0.1"}, "Connect to the sender");

    client.tick();
    assertState(client.svc, State::Connected, "Connected once the link reports it");
    assertTrue(!client.svc.IsStopping(), "IsStopping cleared after connecting");
    assertTrue(client.svc.GetStats().matches == 1, "One match");
}

void testClientAlreadyConnectedIgnoresMatch() {
    ClientRig client;
    client.init();
    client.connector.connected = true;

    client.transport.Deliver("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 0, "Connected client does not rejoin");
    assertState(client.svc, State::Listening, "Still listening");
}

void testClientWithoutRenderedMarkerIgnoresBroadcasts() {
    ClientRig client;
    client.markers.has = false;
    client.init();

    client.transport.Deliver("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 0, "Nothing rendered, nothing matches");
}

void testClientConnectTimeoutFailsThenListensAgain() {
    ClientRig client;
    RendezvousService::Params params = ClientRig::immediate();
    params.connect_timeout_sec = 2.0;
    params.retry_delay_sec = 1.0;
    client.init(params);
    client.connector.neverConnect = true;

    client.transport.Deliver("10.0.0.1", "|7|");
    client.tick(0.5);
    assertState(client.svc, State::Connecting, "Connecting");

    for (int i = 0; i < 3; ++i) client.tick(0.5);
    assertState(client.svc, State::Connecting, "Still within the timeout");

    client.tick(0.5);
    assertState(client.svc, State::Failed, "Timeout fails the attempt");
    assertTrue(!client.svc.IsStopping(), "Failure clears IsStopping");
    assertTrue(client.connector.cancels == 1, "Pending connection cancelled");
    assertTrue(client.svc.GetStats().connect_timeouts == 1, "Timeout counted");

    client.tick(0.5);
    assertState(client.svc, State::Failed, "Retry waits for the retry delay");
    client.tick(0.5);
    assertState(client.svc, State::Listening, "Listening again after the retry delay");
    assertTrue(client.transport.clientStarts == 2, "Listener restarted");
    assertTrue(client.svc.GetPeerAddress().empty(), "Peer address cleared");

    client.transport.Deliver("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 2, "A later broadcast can match again");
}

void testClientRefusedRequestFails() {
    ClientRig client;
    client.init();
    client.connector.refuse = true;

    client.transport.Deliver("10.0.0.1", "|7|");
    client.tick();
    assertState(client.svc, State::Failed, "Refused request fails the attempt");
    assertTrue(!client.svc.IsStopping(), "IsStopping cleared");
}

void testClientRelistensWhenLinkDrops() {
    ClientRig client;
    client.init();
    client.transport.Deliver("10.0.0.1", "|7|");
    client.tick();
    client.tick();
    assertState(client.svc, State::Connected, "Connected");

    client.connector.connected = false;
    client.tick();
    assertState(client.svc, State::Listening, "Lost link sends the client back to listening");
    assertTrue(client.transport.clientStarts == 2, "Listener restarted");
    assertTrue(client.connector.cancels == 1, "Lost link releases the connector");
    assertTrue(!client.connector.open, "Connector closed before listening again");

    client.transport.Deliver("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 2, "Host found again after the drop");
    client.tick();
    assertState(client.svc, State::Connecting, "Second connection requested");
    assertTrue(client.connector.refusedWhileOpen == 0, "Second request is not refused");
    client.tick();
    assertState(client.svc, State::Connected, "Client paired a second time");
    assertTrue(client.connector.requests.size() == 2, "Two connection requests in total");
}

void testSessionFoundObserversCanUnsubscribe() {
    ClientRig client;
    int second = 0;
    const uint32_t id = client.svc.SubscribeSessionFound(&countSessionFound, &second);
    assertTrue(id != 0, "Subscription id is non-zero");
    assertTrue(client.svc.SubscribeSessionFound(nullptr, nullptr) == 0, "Null observer rejected");
    client.svc.UnsubscribeSessionFound(id);

    client.init();
    client.transport.Deliver("10.0.0.1", "|7|");
    assertTrue(client.sessionsFound == 1, "Remaining observer notified");
    assertTrue(second == 0, "Unsubscribed observer not notified");
}

void testInitRejectsMissingCollaborators() {
    FakeTransport transport;
    FakePlatform clientPlatform{Role::Client};
    FakeConnector connector;
    FakeMarkerSource markers{7};

    {
        RendezvousService svc;
        RendezvousService::Collaborators c{};
        c.platform = &clientPlatform;
        c.connector = &connector;
        c.marker_source = &markers;
        assertTrue(!svc.Init({}, c), "Transport is required");
    }
    {
        RendezvousService svc;
        RendezvousService::Collaborators c{};
        c.transport = &transport;
        c.connector = &connector;
        c.marker_source = &markers;
        assertTrue(!svc.Init({}, c), "Platform probe is required");
    }
    {
        RendezvousService svc;
        RendezvousService::Collaborators c{};
        c.transport = &transport;
        c.platform = &clientPlatform;
        c.marker_source = &markers;
        assertTrue(!svc.Init({}, c), "Client needs a connector");
    }
    {
        RendezvousService svc;
        RendezvousService::Collaborators c{};
        c.transport = &transport;
        c.platform = &clientPlatform;
        c.connector = &connector;
        assertTrue(!svc.Init({}, c), "Client needs a marker source");
    }
    assertTrue(transport.initializedPayloads.empty(), "Failed inits never touch the transport");
}

void testUnsupportedPlatformDisablesInstance() {
    ClientRig client;
    client.platform.visionOk = false;
    assertTrue(!client.init(), "Init fails without the vision backend");
    assertState(client.svc, State::Disabled, "Instance disabled");

    client.tick();
    client.svc.OnBroadcastReceived("10.0.0.1", "|7|");
    assertTrue(client.transport.initializedPayloads.empty(), "Disabled instance never starts");
    assertTrue(client.sessionsFound == 0, "Disabled instance never matches");

    ClientRig other;
    assertTrue(other.init(), "Other instances are unaffected");
}

void testHostAndClientRendezvousEndToEnd() {
    FakeLan lan;
    HostRig host;
    ClientRig client;
    host.transport.lan = &lan;
    client.transport.lan = &lan;
    lan.Attach(host.transport);
    lan.Attach(client.transport);
    client.connector.acceptAddress = "10.0.0.1";
    client.connector.connectAfterTicks = 2;

    host.init();
    client.init(RendezvousService::Params{});

    for (int frame = 0; frame < 200 && client.svc.GetState() != State::Connected; ++frame) {
        if (frame == 5) host.detector.Detect(7);

        host.transport.Tick();
        client.transport.Tick();
        client.connector.Tick();
        host.svc.Tick(0.1);
        client.svc.Tick(0.1);
    }

    assertTrue(host.svc.GetBroadcastPayload() == "|7|", "Host broadcasts the detected marker");
    assertState(host.svc, State::Broadcasting, "Host keeps broadcasting");
    assertTrue(client.sessionsFound == 1, "Client found the session exactly once");
    assertTrue(client.connector.requests == std::vector<std::string>{"10.0.0.1"}, "Client connected to the host");
    assertState(client.svc, State::Connected, "Client connected");
    assertTrue(!client.svc.IsStopping(), "Client not stopping at the end");
}
} // namespace

int main() {
    try {
        testHostStartsBroadcastingImmediately();
        testHostMarkerRestartsBroadcastAcrossTwoTicks();
        testHostDuplicateMarkerDuringRestartRunsOneCycle();
        testHostNewMarkerWhileStoppingIsDropped();
        testHostWaitsForStopAcknowledgment();
        testHostStopTimeoutProceedsAndReportsStartFailure();
        testHostRestartAbortAcceptsSameMarkerAgain();
        testHostStartFailureKeepsMarkerInput();
        testHostWithoutDetectorStillAcceptsDirectCalls();
        testHostIgnoresBroadcasts();
        testHostShutdownUnhooksDetector();
        testClientStartsAfterDelay();
        testAutoStartDisabledLeavesTransportIdle();
        testClientIgnoresNonMatchingTokens();
        testClientMatchFiresOnceThenConnects();
        testClientAlreadyConnectedIgnoresMatch();
        testClientWithoutRenderedMarkerIgnoresBroadcasts();
        testClientConnectTimeoutFailsThenListensAgain();
        testClientRefusedRequestFails();
        testClientRelistensWhenLinkDrops();
        testSessionFoundObserversCanUnsubscribe();
        testInitRejectsMissingCollaborators();
        testUnsupportedPlatformDisablesInstance();
        testHostAndClientRendezvousEndToEnd();
        std::cout << "All rendezvous tests passed.\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
}
