#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <boost/asio/steady_timer.hpp>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/core/worker_pool.h>

namespace mediacat::notify {

using catalog::VisibilityTier;

/**
 * @brief Debounced "catalog changed" signals, partitioned by visibility tier
 *
 * Producers on any thread call schedule(); requests are handed to a single dispatch thread
 * that owns one timer per tier. Each request restarts its tier's timer, so a burst collapses
 * into one signal emitted `delay` after the last request. A restricted request is absorbed by a
 * pending public signal, and a public request supersedes a pending restricted one.
 *
 * A public signal reaches public and restricted listeners; a restricted signal reaches only
 * restricted listeners. Listeners run on the dispatch thread.
 */
class ChangeNotifier {
public:
    using Listener = std::function<void(VisibilityTier)>;
    using SubscriptionId = uint64_t;

    static constexpr std::chrono::milliseconds kDefaultDelay{1500};

    explicit ChangeNotifier(std::chrono::milliseconds delay = kDefaultDelay);
    ~ChangeNotifier();

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    /**
     * @brief Subscribe to catalog changes visible to `audience`
     */
    SubscriptionId onCatalogChange(VisibilityTier audience, Listener listener);
    void unsubscribe(SubscriptionId id);

    void schedule(VisibilityTier tier);

    // Whether a signal for this tier is waiting on its timer
    [[nodiscard]] bool pending(VisibilityTier tier) const;

    [[nodiscard]] std::chrono::milliseconds delay() const { return delay_; }

    // Cancels pending timers and joins the dispatch thread
    void stop();

private:
    struct TierState {
        explicit TierState(const boost::asio::any_io_executor& ex) : timer(ex) {}
        boost::asio::steady_timer timer;
        uint64_t generation = 0;
        std::atomic<bool> pending{false};
    };

    void handleSchedule(VisibilityTier tier);
    void cancel(TierState& state);
    void emit(VisibilityTier tier);
    TierState& state(VisibilityTier tier);
    const TierState& state(VisibilityTier tier) const;

    std::chrono::milliseconds delay_;
    WorkerPool loop_;
    TierState public_;
    TierState restricted_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex listenersMutex_;
    std::map<SubscriptionId, std::pair<VisibilityTier, Listener>> listeners_;
    SubscriptionId nextId_ = 1;
};

} // namespace mediacat::notify
