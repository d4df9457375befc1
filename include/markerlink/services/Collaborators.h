#pragma once
#include <cstdint>
#include <string>

/*
    External collaborators of the rendezvous service.

    None of these are implemented here (vision, platform detection and session
    replication live elsewhere), except ISessionConnector which SessionLink
    provides. They are handed to RendezvousService::Init explicitly.
*/

namespace markerlink {

    enum class Role : uint8_t {
        Host,   // head-mounted display, detects markers and broadcasts
        Client  // companion device, renders a marker and listens
    };

    inline const char* ToString(Role r)
    {
        switch (r) {
        case Role::Host:   return "Host";
        case Role::Client: return "Client";
        }
        return "?";
    }

    struct Vec3 { float x = 0.f, y = 0.f, z = 0.f; };
    struct Quat { float x = 0.f, y = 0.f, z = 0.f, w = 1.f; };

    class ISessionConnector {
    public:
        virtual ~ISessionConnector() = default;

        // Address text without port; the connector applies its own session port.
        virtual bool RequestConnection(const std::string& address) = 0;
        virtual bool IsConnected() const = 0;
        virtual void CancelConnection() = 0;
    };

    // Client side: the marker currently rendered on screen.
    class IMarkerSource {
    public:
        virtual ~IMarkerSource() = default;
        virtual bool TryGetMarkerId(int32_t& out) const = 0;
    };

    // Host side: vision layer raising marker detections.
    class IMarkerDetector {
    public:
        using MarkerDetectedFn = void (*)(void* user, int32_t marker_id, const Vec3& position, const Quat& rotation);

        virtual ~IMarkerDetector() = default;

        // fn == nullptr unhooks.
        virtual void SetMarkerDetectedHandler(MarkerDetectedFn fn, void* user) = 0;
    };

    class IPlatformProbe {
    public:
        virtual ~IPlatformProbe() = default;

        virtual Role DetectRole() const = 0;

        // False if the native vision backend failed to load on this device.
        virtual bool CheckVisionBackend(std::string& error) const = 0;
    };

} // namespace markerlink
