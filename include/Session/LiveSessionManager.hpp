#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Clients/IStreamClient.hpp"
#include "Console/IOutputSink.hpp"
#include "Core/Errors.hpp"

// Public description of the running session.
struct SessionHandle {
    std::uint64_t id = 0;
    StreamSubscription subscription;
};

// Owner of the single live stream the console may hold.
//
// States: Idle (no session) and Active (one session with a running worker).
// start() only succeeds from Idle; stop() always ends in Idle. The worker's
// latest snapshot is cached inside the session and handed out read-only
// through snapshot_for(), which only answers for an exactly matching request.
//
// Thread model: start()/stop()/active_view()/snapshot_for() are called from
// the console thread; the worker runs on its own std::jthread and is the only
// writer of the cache. If the worker dies on its own, it moves the manager
// back to Idle and reports through IOutputSink::stream_fault().
class LiveSessionManager {
public:
    struct Options {
        // Upper bound for stop() to wait on a cancelled worker.
        std::chrono::milliseconds stop_timeout{5000};
    };

    LiveSessionManager(IStreamClient& client, IOutputSink& sink);
    LiveSessionManager(IStreamClient& client, IOutputSink& sink, Options opts);
    ~LiveSessionManager();

    LiveSessionManager(const LiveSessionManager&) = delete;
    LiveSessionManager& operator=(const LiveSessionManager&) = delete;

    // Fails with AlreadyActive, without side effects, if a session is running.
    std::expected<SessionHandle, SessionError> start(StreamSubscription subscription);

    // Cancels the running session and waits for its worker. No-op when Idle.
    // When it returns the previous session's cache is closed and empty.
    void stop();

    // Latest snapshot of the active session if it streams exactly
    // (kind, symbol[, interval]); nullptr otherwise or before the first update.
    [[nodiscard]] std::shared_ptr<const LiveSnapshot> snapshot_for(
        StreamKind kind, const std::string& symbol,
        std::optional<KlineInterval> interval = std::nullopt) const;

    [[nodiscard]] std::optional<SessionHandle> active_view() const;
    [[nodiscard]] bool active() const;

private:
    struct Session;

    void worker_main(const std::shared_ptr<Session>& session, std::stop_token stop);
    void publish(Session& session, LiveSnapshot snapshot);
    void on_worker_exit(const std::shared_ptr<Session>& session, std::string fault);
    void reap_retired(bool final_pass);
    static void close_cache(Session& session);

    IStreamClient& client_;
    IOutputSink& sink_;
    Options opts_;

    std::mutex lifecycle_;     // serialises start() and stop()
    mutable std::mutex mutex_; // guards active_, retired_, next_id_
    std::shared_ptr<Session> active_;
    // Sessions whose worker thread still has to be joined: workers that died
    // on their own, and workers that did not honour stop() in time.
    std::vector<std::shared_ptr<Session>> retired_;
    std::uint64_t next_id_{1};
};
