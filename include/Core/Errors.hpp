#pragma once
#include <stdexcept>
#include <string>

// Transport or API failure on a REST call or inside a stream worker.
// `status` is the HTTP status (0 when the request never got a response),
// `code` the venue error code when the body carried one.
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& what, int status = 0, int code = 0)
        : std::runtime_error(what), status_(status), code_(code) {}

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int status_;
    int code_;
};

// Bootstrap failure: unreadable or malformed configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SessionError { AlreadyActive };
