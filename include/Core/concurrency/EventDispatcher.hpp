#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>

namespace CONCURRENCY {
namespace asio = boost::asio;

/**
 * @brief Worker pool around a single io_context.
 *
 * Besides plain task dispatch it lends its io_context to components that need
 * asynchronous completion handlers (child process reaping, for one).
 */
class EventDispatcher {
public:
    explicit EventDispatcher(size_t threads = std::thread::hardware_concurrency());
    ~EventDispatcher();

    // Post immediate task
    void dispatch(std::function<void()> f);

    // Post a task and get its result (or exception) through a future
    template <typename F>
    [[nodiscard]] std::future<std::invoke_result_t<F>> submit(F&& f) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = task->get_future();
        dispatch([task]() { (*task)(); });
        return fut;
    }

    [[nodiscard]] asio::io_context& context() noexcept;

    // Control lifecycle
    void start();
    void stop();

    // non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace CONCURRENCY
