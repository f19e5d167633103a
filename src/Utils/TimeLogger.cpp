#include "Utils/TimeLogger.hpp"

#include <exception>
#include <iostream>
#include <utility>

TimeLogger::TimeLogger(ILogger& logger, std::string command)
    : logger_(logger), command_(std::move(command)), start_(std::chrono::steady_clock::now()) {}

TimeLogger::~TimeLogger() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    try {
        logger_.log(command_, static_cast<long>(elapsed.count()));
    } catch (const std::exception& e) {
        std::cerr << "[TIMING] Failed to record " << command_ << ": " << e.what() << "\n";
    }
}
