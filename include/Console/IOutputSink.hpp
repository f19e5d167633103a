#pragma once
#include <string>

#include "Clients/IStreamClient.hpp"

// Receiver of everything a live session produces asynchronously.
// Called from the stream worker thread; implementations serialise their own writers.
class IOutputSink {
public:
    virtual ~IOutputSink() = default;

    virtual void live_update(const LiveSnapshot& snapshot) = 0;

    // The worker died without being asked to stop; the session is already Idle.
    virtual void stream_fault(const StreamSubscription& subscription, const std::string& reason) = 0;
};
