#include "Session/LiveSessionManager.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <thread>
#include <utility>

struct LiveSessionManager::Session {
    SessionHandle handle;
    std::jthread worker;        // owns the cancellation handle (its stop_source)
    // Set by stop() under LiveSessionManager::mutex_; read lock-free by the
    // worker so that a cancelled worker never touches the manager again.
    std::atomic<bool> stop_requested{false};

    // Cache: single writer (the worker), readers via snapshot_for().
    std::mutex cache_mutex;
    std::shared_ptr<const LiveSnapshot> cached;
    bool accepting{true};

    // Completion signal of the worker.
    std::mutex done_mutex;
    std::condition_variable done_cv;
    std::atomic<bool> finished{false};

    bool wait_finished(std::chrono::milliseconds timeout) {
        std::unique_lock lock(done_mutex);
        return done_cv.wait_for(lock, timeout, [this] { return finished.load(); });
    }
};

LiveSessionManager::LiveSessionManager(IStreamClient& client, IOutputSink& sink)
    : LiveSessionManager(client, sink, Options{}) {}

LiveSessionManager::LiveSessionManager(IStreamClient& client, IOutputSink& sink, Options opts)
    : client_(client), sink_(sink), opts_(opts) {}

LiveSessionManager::~LiveSessionManager() {
    stop();
    reap_retired(true);
}

std::expected<SessionHandle, SessionError> LiveSessionManager::start(StreamSubscription subscription) {
    std::lock_guard lifecycle(lifecycle_);
    reap_retired(false);

    // Normalise so that snapshot_for() can compare the subscription field by field.
    switch (subscription.kind) {
        case StreamKind::UserData:
            subscription.symbol.clear();
            subscription.interval.reset();
            break;
        case StreamKind::Candlesticks:
            if (!subscription.interval) subscription.interval = kDefaultInterval;
            break;
        default:
            subscription.interval.reset();
            break;
    }

    std::lock_guard lock(mutex_);
    if (active_) {
        return std::unexpected(SessionError::AlreadyActive);
    }

    auto session = std::make_shared<Session>();
    session->handle.id = next_id_++;
    session->handle.subscription = std::move(subscription);

    // The worker may finish before this function returns; on_worker_exit()
    // needs mutex_, so it cannot observe the session before active_ is set.
    session->worker = std::jthread([this, session](std::stop_token stop) {
        worker_main(session, stop);
    });
    active_ = session;
    return session->handle;
}

void LiveSessionManager::stop() {
    std::lock_guard lifecycle(lifecycle_);

    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        session = active_;
        if (session) session->stop_requested = true;
    }
    if (!session) {
        reap_retired(false);
        return;
    }

    session->worker.request_stop();
    const bool finished = session->wait_finished(opts_.stop_timeout);
    if (!finished) {
        std::cerr << "[SESSION] " << to_string(session->handle.subscription.kind)
                  << " worker did not stop within " << opts_.stop_timeout.count()
                  << " ms; its output is discarded from now on" << std::endl;
    }

    // From here on a late event from the worker is dropped.
    close_cache(*session);

    {
        std::lock_guard lock(mutex_);
        active_.reset();
        if (!finished) retired_.push_back(session);
    }
    if (finished) {
        session->worker.join();
    }
    reap_retired(false);
}

std::shared_ptr<const LiveSnapshot> LiveSessionManager::snapshot_for(
    StreamKind kind, const std::string& symbol, std::optional<KlineInterval> interval) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(mutex_);
        session = active_;
    }
    if (!session) return nullptr;

    const auto& sub = session->handle.subscription;
    if (sub.kind != kind || sub.symbol != symbol) return nullptr;
    if (kind == StreamKind::Candlesticks && sub.interval != interval) return nullptr;

    std::lock_guard cache(session->cache_mutex);
    return session->accepting ? session->cached : nullptr;
}

std::optional<SessionHandle> LiveSessionManager::active_view() const {
    std::lock_guard lock(mutex_);
    if (!active_) return std::nullopt;
    return active_->handle;
}

bool LiveSessionManager::active() const {
    std::lock_guard lock(mutex_);
    return active_ != nullptr;
}

void LiveSessionManager::worker_main(const std::shared_ptr<Session>& session, std::stop_token stop) {
    std::string fault;
    try {
        client_.run(session->handle.subscription,
                    [this, &session](LiveSnapshot snapshot) { publish(*session, std::move(snapshot)); },
                    stop);
        if (!stop.stop_requested()) {
            fault = "stream ended by the remote side";
        }
    } catch (const std::exception& e) {
        fault = e.what();
    }

    if (!session->stop_requested.load()) {
        on_worker_exit(session, std::move(fault));
    }

    {
        std::lock_guard lock(session->done_mutex);
        session->finished = true;
    }
    session->done_cv.notify_all();
}

void LiveSessionManager::publish(Session& session, LiveSnapshot snapshot) {
    if (kind_of(snapshot) != session.handle.subscription.kind) {
        std::cerr << "[SESSION] dropped " << to_string(kind_of(snapshot))
                  << " update on a " << to_string(session.handle.subscription.kind)
                  << " session" << std::endl;
        return;
    }

    auto shared = std::make_shared<const LiveSnapshot>(std::move(snapshot));

    // Forwarding happens under the cache lock so that stop() returning also
    // means no further live line reaches the sink.
    std::lock_guard lock(session.cache_mutex);
    if (!session.accepting) return;
    session.cached = shared;
    sink_.live_update(*shared);
}

void LiveSessionManager::on_worker_exit(const std::shared_ptr<Session>& session, std::string fault) {
    {
        std::lock_guard lock(mutex_);
        // stop() owns the teardown of sessions it cancelled.
        if (active_ != session || session->stop_requested.load()) return;
        active_.reset();
        // This thread cannot join itself; the next start()/stop() does.
        retired_.push_back(session);
    }

    close_cache(*session);

    if (fault.empty()) fault = "stream terminated";
    std::cerr << "[SESSION] " << to_string(session->handle.subscription.kind)
              << " stream failed: " << fault << std::endl;
    sink_.stream_fault(session->handle.subscription, fault);
}

void LiveSessionManager::close_cache(Session& session) {
    std::lock_guard lock(session.cache_mutex);
    session.accepting = false;
    session.cached.reset();
}

void LiveSessionManager::reap_retired(bool final_pass) {
    std::vector<std::shared_ptr<Session>> to_join;
    {
        std::lock_guard lock(mutex_);
        for (auto it = retired_.begin(); it != retired_.end();) {
            if (final_pass || (*it)->finished.load()) {
                to_join.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& session : to_join) {
        if (!session->worker.joinable()) continue;
        if (session->wait_finished(final_pass ? opts_.stop_timeout : std::chrono::milliseconds{0})) {
            session->worker.join();
        } else {
            std::cerr << "[SESSION] abandoning unresponsive " << to_string(session->handle.subscription.kind)
                      << " worker" << std::endl;
            session->worker.detach();
        }
    }
}
