#include "Core/concurrency/EventDispatcher.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <atomic>
#include <exception>
#include <optional>
#include <vector>
#include "System/Logger.hpp"

namespace CONCURRENCY {

struct EventDispatcher::Impl {
    asio::io_context io_ctx;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;
    std::vector<std::thread> threads;
    size_t thread_count{1};
    std::atomic<bool> running{false};

    explicit Impl(size_t threads_count)
        : io_ctx(), thread_count(threads_count)
    {
        work_guard.emplace(io_ctx.get_executor());
    }

    void run_threads() {
        if (running.exchange(true)) return;
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this]() {
                // A throwing handler must not take the worker down with it.
                for (;;) {
                    try {
                        io_ctx.run();
                        return;
                    } catch (const std::exception& e) {
                        LSLOG_ERROR("dispatcher task failed: {}", e.what());
                    }
                }
            });
        }
    }

    void stop_threads() {
        if (!running.exchange(false)) return;
        work_guard.reset();
        io_ctx.stop();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
        io_ctx.restart();
        work_guard.emplace(io_ctx.get_executor());
    }
};

EventDispatcher::EventDispatcher(size_t threads)
    : impl_(std::make_unique<Impl>(threads == 0 ? 1 : threads))
{
    impl_->run_threads();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::dispatch(std::function<void()> f) {
    if (!f) return;
    asio::post(impl_->io_ctx, std::move(f));
}

asio::io_context& EventDispatcher::context() noexcept {
    return impl_->io_ctx;
}

void EventDispatcher::start() {
    impl_->run_threads();
}

void EventDispatcher::stop() {
    impl_->stop_threads();
}

} // namespace CONCURRENCY
