#pragma once

#include <webshell/core/Error.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace WS::Host {

template <typename T>
struct is_expected : std::false_type {};

template <typename T>
struct is_expected<std::expected<T, Error>> : std::true_type {};

/**
 * HostExecutor: the single writer for every host registry.
 *
 * One worker thread drains a FIFO queue, so two jobs posted from the same
 * thread always run in posting order and never overlap. That ordering is what
 * keeps a close posted behind an in-flight launch from touching a half-built
 * container.
 *
 * Jobs must not block on futures of jobs posted to the same executor; use
 * on_worker_thread() to detect re-entry.
 */
class HostExecutor {
public:
    using Job = std::function<void()>;

    HostExecutor();
    ~HostExecutor();

    HostExecutor(HostExecutor const&)                    = delete;
    auto operator=(HostExecutor const&) -> HostExecutor& = delete;

    // Returns an error when the executor no longer accepts work.
    auto post(Job job) -> std::optional<Error>;

    // Runs fn on the worker and hands its result back through a future. A job
    // refused after shutdown resolves to ExecutorShutdown when fn returns an
    // Expected, and to a std::runtime_error otherwise.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

    auto shutdown() -> void;

    [[nodiscard]] bool on_worker_thread() const;
    [[nodiscard]] bool accepting() const { return !shuttingDown.load(); }
    [[nodiscard]] auto pending() const -> std::size_t;

private:
    auto workerFunction() -> void;

    std::jthread                 worker;
    std::atomic<std::thread::id> workerId{};
    std::queue<Job>              jobs;
    mutable std::mutex           mutex;
    std::condition_variable      jobCV;
    std::atomic<bool>            shuttingDown{false};
};

template <typename F>
auto HostExecutor::submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
    using Result = std::invoke_result_t<std::decay_t<F>&>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future  = promise->get_future();

    auto job = [promise, task = std::forward<F>(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                task();
                promise->set_value();
            } else {
                promise->set_value(task());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    if (auto refused = post(std::move(job))) {
        if constexpr (is_expected<Result>::value) {
            promise->set_value(std::unexpected(*refused));
        } else {
            promise->set_exception(std::make_exception_ptr(std::runtime_error(describeError(*refused))));
        }
    }
    return future;
}

} // namespace WS::Host
