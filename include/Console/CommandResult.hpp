#pragma once
#include <string>
#include <utility>

enum class CommandStatus {
    Ok,
    Empty,               // blank line
    Quit,
    UnrecognizedCommand,
    ArgumentError,       // a required argument is missing or malformed; nothing was done
    NotAuthorized,       // the verb needs API credentials
    SessionError,        // a live stream is already active
    RemoteError          // the venue call failed
};

struct CommandResult {
    CommandStatus status = CommandStatus::Ok;
    std::string message;

    static CommandResult ok() { return {}; }
    static CommandResult fail(CommandStatus status, std::string message = {}) {
        return CommandResult{status, std::move(message)};
    }
};
