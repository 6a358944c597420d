#include <spdlog/spdlog.h>
#include <mediacat/notify/change_notifier.h>

#include <vector>

namespace mediacat::notify {

ChangeNotifier::ChangeNotifier(std::chrono::milliseconds delay)
    : delay_(delay),
      loop_(1, "ChangeNotifier"),
      public_(loop_.executor()),
      restricted_(loop_.executor()) {}

ChangeNotifier::~ChangeNotifier() {
    stop();
}

ChangeNotifier::SubscriptionId ChangeNotifier::onCatalogChange(VisibilityTier audience,
                                                               Listener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    const SubscriptionId id = nextId_++;
    listeners_.emplace(id, std::make_pair(audience, std::move(listener)));
    return id;
}

void ChangeNotifier::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(id);
}

void ChangeNotifier::schedule(VisibilityTier tier) {
    if (stopped_.load())
        return;
    loop_.post([this, tier]() { handleSchedule(tier); });
}

bool ChangeNotifier::pending(VisibilityTier tier) const {
    return state(tier).pending.load();
}

void ChangeNotifier::stop() {
    if (stopped_.exchange(true))
        return;
    loop_.stop();
    // Dispatch thread is joined; timers can be touched from here
    cancel(public_);
    cancel(restricted_);
}

void ChangeNotifier::handleSchedule(VisibilityTier tier) {
    if (tier == VisibilityTier::Restricted && public_.pending.load()) {
        spdlog::trace("Restricted change absorbed by pending public signal");
        return;
    }
    if (tier == VisibilityTier::Public && restricted_.pending.load()) {
        cancel(restricted_);
    }

    TierState& s = state(tier);
    const uint64_t generation = ++s.generation;
    s.pending.store(true);
    s.timer.expires_after(delay_);
    s.timer.async_wait([this, tier, generation](const boost::system::error_code& ec) {
        TierState& current = state(tier);
        // A later schedule() or cancel() superseded this wait
        if (ec == boost::asio::error::operation_aborted || generation != current.generation)
            return;
        current.pending.store(false);
        emit(tier);
    });
}

void ChangeNotifier::cancel(TierState& s) {
    ++s.generation;
    s.timer.cancel();
    s.pending.store(false);
}

void ChangeNotifier::emit(VisibilityTier tier) {
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (const auto& [id, entry] : listeners_) {
            const auto& [audience, listener] = entry;
            if (tier == VisibilityTier::Public || audience == VisibilityTier::Restricted)
                targets.push_back(listener);
        }
    }

    spdlog::debug("Broadcasting {} catalog refresh to {} listener(s)", tierToString(tier),
                  targets.size());
    for (auto& listener : targets) {
        try {
            listener(tier);
        } catch (const std::exception& e) {
            spdlog::warn("Catalog change listener failed: {}", e.what());
        }
    }
}

ChangeNotifier::TierState& ChangeNotifier::state(VisibilityTier tier) {
    return tier == VisibilityTier::Public ? public_ : restricted_;
}

const ChangeNotifier::TierState& ChangeNotifier::state(VisibilityTier tier) const {
    return tier == VisibilityTier::Public ? public_ : restricted_;
}

} // namespace mediacat::notify
