#include <markerlink/services/BroadcastTransport.h>
#include <markerlink/services/RendezvousService.h>
#include <markerlink/services/SessionLink.h>

#include <FrameKit/Debug/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

/*
    markerlink-node

    Runs one side of the rendezvous on this machine. Vision is out of scope, so
    the host "detects" the marker given on the command line after a delay, and
    the client "renders" the marker given on its command line.
*/

namespace {

std::atomic<bool> g_Stop{ false };

void onSignal(int) {
    g_Stop = true;
}

void printUsage() {
    std::cout << "Usage:\n"
              << "  markerlink-node host   --marker <id> [--detect-after <sec>] [options]\n"
              << "  markerlink-node client --marker <id> [options]\n"
              << "Options:\n"
              << "  --port <udp>               discovery port (default 47777)\n"
              << "  --session-port <udp>       session link port (default 7777)\n"
              << "  --broadcast-address <ip>   broadcast target (default 255.255.255.255)\n"
              << "  --key <n>                  discovery key (default 2222)\n"
              << "  --interval <sec>           broadcast interval (default 1.0)\n"
              << "  --start-delay <sec>        client warm-up delay (default 3.0)\n"
              << "  --connect-timeout <sec>    client connect timeout (default 10.0)\n"
              << "  --node-id <n>              session link node id\n"
              << "  --run-for <sec>            exit after this long (default: until Ctrl-C)\n";
}

double parseDouble(const std::string& raw, const std::string& field) {
    std::size_t consumed = 0;
    const double value = std::stod(raw, &consumed);
    if (consumed != raw.size()) {
        throw std::invalid_argument("Invalid value for " + field + ": " + raw);
    }
    return value;
}

long long parseInteger(const std::string& raw, const std::string& field, long long lo, long long hi) {
    std::size_t consumed = 0;
    const long long value = std::stoll(raw, &consumed);
    if (consumed != raw.size() || value < lo || value > hi) {
        throw std::invalid_argument("Invalid value for " + field + ": " + raw);
    }
    return value;
}

struct NodeOptions {
    markerlink::Role role = markerlink::Role::Client;
    int32_t marker = 0;
    bool hasMarker = false;
    double detectAfter = 2.0;
    double runFor = 0.0;

    BroadcastTransport::Params discovery{};
    SessionLink::Params link{};
    RendezvousService::Params rendezvous{};
};

NodeOptions parseArgs(int argc, char** argv) {
    if (argc < 2) throw std::invalid_argument("Missing role");

    NodeOptions o{};
    const std::string role = argv[1];
    if (role == "host") o.role = markerlink::Role::Host;
    else if (role == "client") o.role = markerlink::Role::Client;
    else throw std::invalid_argument("Unknown role: " + role);

    o.link.node_id = (o.role == markerlink::Role::Host) ? 1 : 2;

    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + flag);
        const std::string value = argv[++i];

        if (flag == "--marker") {
            o.marker = static_cast<int32_t>(parseInteger(value, flag,
                std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));
            o.hasMarker = true;
        }
        else if (flag == "--detect-after") o.detectAfter = parseDouble(value, flag);
        else if (flag == "--port") o.discovery.port = static_cast<uint16_t>(parseInteger(value, flag, 1, 65535));
        else if (flag == "--session-port") o.link.port = static_cast<uint16_t>(parseInteger(value, flag, 1, 65535));
        else if (flag == "--broadcast-address") o.discovery.broadcast_address = value;
        else if (flag == "--key") o.discovery.preamble.key = static_cast<uint32_t>(parseInteger(value, flag, 0, 0xFFFFFFFFLL));
        else if (flag == "--interval") o.discovery.broadcast_interval_sec = parseDouble(value, flag);
        else if (flag == "--start-delay") o.rendezvous.client_start_delay_sec = parseDouble(value, flag);
        else if (flag == "--connect-timeout") o.rendezvous.connect_timeout_sec = parseDouble(value, flag);
        else if (flag == "--node-id") o.link.node_id = static_cast<uint64_t>(parseInteger(value, flag, 0, std::numeric_limits<long long>::max()));
        else if (flag == "--run-for") o.runFor = parseDouble(value, flag);
        else throw std::invalid_argument("Unknown option: " + flag);
    }

    if (!o.hasMarker) throw std::invalid_argument("--marker is required");
    return o;
}

class CliPlatform : public markerlink::IPlatformProbe {
public:
    explicit CliPlatform(markerlink::Role role) : m_Role(role) {}

    markerlink::Role DetectRole() const override { return m_Role; }
    bool CheckVisionBackend(std::string&) const override { return true; }

private:
    markerlink::Role m_Role;
};

class FixedMarkerSource : public markerlink::IMarkerSource {
public:
    explicit FixedMarkerSource(int32_t id) : m_Id(id) {}

    bool TryGetMarkerId(int32_t& out) const override {
        out = m_Id;
        return true;
    }

private:
    int32_t m_Id;
};

// Raises a single detection once the configured delay has elapsed.
class ScriptedMarkerDetector : public markerlink::IMarkerDetector {
public:
    ScriptedMarkerDetector(int32_t id, double after) : m_Id(id), m_After(after) {}

    void SetMarkerDetectedHandler(MarkerDetectedFn fn, void* user) override {
        m_Fn = fn;
        m_User = user;
    }

    void Tick(double dt_seconds) {
        if (m_Fired || !m_Fn) return;
        m_Elapsed += dt_seconds;
        if (m_Elapsed < m_After) return;
        m_Fired = true;
        m_Fn(m_User, m_Id, markerlink::Vec3{ 0.f, 0.f, 0.5f }, markerlink::Quat{});
    }

private:
    int32_t m_Id;
    double m_After;
    double m_Elapsed = 0.0;
    bool m_Fired = false;
    MarkerDetectedFn m_Fn = nullptr;
    void* m_User = nullptr;
};

void onSessionFound(void*) {
    FK_INFO("[Node] Session found; joining host");
}

int run(const NodeOptions& o) {
    BroadcastTransport discovery;
    SessionLink link;
    CliPlatform platform{ o.role };
    FixedMarkerSource markerSource{ o.marker };
    ScriptedMarkerDetector detector{ o.marker, o.detectAfter };

    if (!discovery.Configure(o.discovery) || !link.Configure(o.link)) return 1;

    const bool isHost = (o.role == markerlink::Role::Host);
    if (isHost && !link.Listen()) return 1;

    RendezvousService::Collaborators c{};
    c.transport = &discovery;
    c.platform = &platform;
    c.connector = isHost ? nullptr : &link;
    c.marker_source = isHost ? nullptr : &markerSource;
    c.marker_detector = isHost ? &detector : nullptr;

    RendezvousService rendezvous;
    rendezvous.SubscribeSessionFound(&onSessionFound, nullptr);
    if (!rendezvous.Init(o.rendezvous, c)) return 1;

    using clock = std::chrono::steady_clock;
    auto last = clock::now();
    double total = 0.0;
    RendezvousService::State reported = rendezvous.GetState();

    while (!g_Stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
        const auto now = clock::now();
        const double dt = std::chrono::duration<double>(now - last).count();
        last = now;
        total += dt;

        discovery.Tick(dt);
        link.Tick(dt);
        if (isHost) detector.Tick(dt);
        rendezvous.Tick(dt);

        if (rendezvous.GetState() != reported) {
            reported = rendezvous.GetState();
            std::cout << "state: " << RendezvousService::ToString(reported) << std::endl;
        }

        if (o.runFor > 0.0 && total >= o.runFor) break;
    }

    rendezvous.Shutdown();
    link.Shutdown();
    discovery.Shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    NodeOptions options{};
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        printUsage();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    return run(options);
}
