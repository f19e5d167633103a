#pragma once
#include <mutex>
#include <ostream>
#include "ILogger.hpp"

// Writes "[TIMING] <command> <ms> ms" lines to a stream.
class StreamLogger : public ILogger {
public:
    explicit StreamLogger(std::ostream& out) : out_(out) {}

    void log(const std::string& command, long duration_ms) override;

private:
    std::ostream& out_;
    std::mutex mtx_;
};
