#include <webshell/host/HostExecutor.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace WS::Host {

HostExecutor::HostExecutor() {
    ws_log("HostExecutor::HostExecutor spawning worker", "HostExecutor");
    worker = std::jthread(&HostExecutor::workerFunction, this);
}

HostExecutor::~HostExecutor() {
    ws_log("HostExecutor::~HostExecutor", "HostExecutor");
    shutdown();
}

auto HostExecutor::post(Job job) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            ws_log("HostExecutor::post refused: shutting down", "HostExecutor");
            return Error{Error::Code::ExecutorShutdown, "Executor shutting down"};
        }
        jobs.push(std::move(job));
    }
    jobCV.notify_one();
    return std::nullopt;
}

auto HostExecutor::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown && !worker.joinable()) {
            return;
        }
        shuttingDown = true;
    }
    jobCV.notify_all();

    // Queued jobs still run so every issued future resolves.
    if (worker.joinable() && !on_worker_thread()) {
        ws_log("HostExecutor::shutdown joining worker", "HostExecutor");
        worker.join();
    }
}

bool HostExecutor::on_worker_thread() const {
    return std::this_thread::get_id() == workerId;
}

auto HostExecutor::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return jobs.size();
}

auto HostExecutor::workerFunction() -> void {
    workerId = std::this_thread::get_id();
#ifdef WS_LOG_DEBUG
    set_thread_name("HostExecutor");
#endif
    ws_log("HostExecutor::workerFunction start", "HostExecutor");
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobCV.wait(lock, [this] { return shuttingDown || !jobs.empty(); });
            if (jobs.empty()) {
                break;
            }
            job = std::move(jobs.front());
            jobs.pop();
        }
        try {
            job();
        } catch (std::exception const& ex) {
            std::cerr << "[executor] job failed: " << ex.what() << "\n";
        }
    }
    ws_log("HostExecutor::workerFunction exit", "HostExecutor");
}

} // namespace WS::Host
