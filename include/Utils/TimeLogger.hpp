#pragma once
#include <chrono>
#include <string>
#include "ILogger.hpp"

// Reports the time between construction and destruction to `logger`.
class TimeLogger {
public:
    TimeLogger(ILogger& logger, std::string command);
    ~TimeLogger();

    TimeLogger(const TimeLogger&) = delete;
    TimeLogger& operator=(const TimeLogger&) = delete;

private:
    ILogger& logger_;
    std::string command_;
    std::chrono::steady_clock::time_point start_;
};
