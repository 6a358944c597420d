#include <mediacat/core/worker_pool.h>

#include <spdlog/spdlog.h>
#include <system_error>

namespace mediacat {

WorkerPool::WorkerPool(std::size_t threads, std::string name)
    : name_(std::move(name)), io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token st) { run_thread(st); });
        active_.fetch_add(1, std::memory_order_relaxed);
    }
    spdlog::debug("[{}] started with {} threads", name_, threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    if (threads_.empty())
        return;

    // Order matters: release the guard, then stop the io_context so run() returns
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    if (!io_.stopped()) {
        io_.stop();
    }

    for (auto& t : threads_) {
        if (t.joinable())
            t.request_stop();
    }
    for (size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("[{}] thread {} join failed: {}", name_, i, e.what());
            }
        }
    }
    threads_.clear();
    active_.store(0, std::memory_order_relaxed);
    spdlog::debug("[{}] stopped", name_);
}

void WorkerPool::run_thread(std::stop_token st) {
    while (!st.stop_requested() && !io_.stopped()) {
        try {
            io_.run();
        } catch (const std::exception& e) {
            // A throwing handler must not take the worker down with it
            spdlog::warn("[{}] handler threw: {}", name_, e.what());
        }
    }
    active_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace mediacat
