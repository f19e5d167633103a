#include "Utils/StreamLogger.hpp"

void StreamLogger::log(const std::string& command, long duration_ms) {
    std::lock_guard lock(mtx_);
    out_ << "[TIMING] " << command << " " << duration_ms << " ms" << std::endl;
}
