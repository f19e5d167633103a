#pragma once
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

#include "Core/LiveSnapshot.hpp"

// What to stream. `symbol` is ignored for UserData, `interval` is only
// meaningful for Candlesticks.
struct StreamSubscription {
    StreamKind kind = StreamKind::OrderBook;
    std::string symbol;
    std::optional<KlineInterval> interval;
};

// Push-data boundary of the venue.
// run() blocks the calling thread for the lifetime of one subscription and
// hands every update to `on_snapshot` as a complete, self-contained snapshot
// (the client owns whatever aggregation is needed to build it).
// It returns normally only after `stop` has been requested; a transport
// fault or a server-side close is reported by throwing.
class IStreamClient {
public:
    using SnapshotHandler = std::function<void(LiveSnapshot)>;

    virtual ~IStreamClient() = default;

    virtual void run(const StreamSubscription& subscription,
                     const SnapshotHandler& on_snapshot,
                     std::stop_token stop) = 0;
};
