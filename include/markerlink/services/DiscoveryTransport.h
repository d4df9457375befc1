#pragma once
#include <string>

/*
    IDiscoveryTransport

    Contract the rendezvous state machine drives. BroadcastTransport is the
    UDP implementation; tests substitute an in-memory one.

      - Initialize(payload) must precede StartAsServer()/StartAsClient().
      - StopBroadcast() is NOT synchronous. The stop is only guaranteed once
        IsStopComplete() returns true, which never happens before the
        transport's next tick.
      - The broadcast handler fires once per received datagram, client mode only.
*/

namespace markerlink {

    class IDiscoveryTransport {
    public:
        using BroadcastFn = void (*)(void* user, const std::string& from_address, const std::string& data);

        virtual ~IDiscoveryTransport() = default;

        virtual bool Initialize(const std::string& payload) = 0;
        virtual bool StartAsServer() = 0;
        virtual bool StartAsClient() = 0;
        virtual void StopBroadcast() = 0;
        virtual bool IsStopComplete() const = 0;

        virtual void SetBroadcastHandler(BroadcastFn fn, void* user) = 0;
    };

} // namespace markerlink
