#pragma once
#include <string>

// Receiver of command latency samples.
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void log(const std::string& command, long duration_ms) = 0;
};
