#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace mediacat {

// Fixed-size pool of std::jthread workers running one io_context.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1, std::string name = "WorkerPool");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    template <typename Fn> void post(Fn&& fn) {
        boost::asio::post(io_, std::forward<Fn>(fn));
    }

    // Handlers already running finish; queued ones are dropped.
    void stop();

    std::size_t threads() const noexcept { return active_.load(std::memory_order_relaxed); }

private:
    void run_thread(std::stop_token st);

    std::string name_;
    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> active_{0};
};

} // namespace mediacat
