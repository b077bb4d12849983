#pragma once
#ifdef WS_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace WS {

/**
 * Asynchronous tag-filtered logger for host tracing.
 *
 * Callers queue entries; one worker thread formats them and is the only
 * writer to stderr. An entry is dropped when any of its tags is skipped, or
 * when an enabled set is configured and one of its tags is missing from it.
 */
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           thread;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    void log_impl(std::string const& message, std::source_location const& location, Tags&&... tags);

    void set_thread_name(std::string const& name);
    void set_logging_enabled(bool enabled);
    void set_enabled_tags(std::set<std::string> tags);

private:
    void run();
    void write(Entry const& entry) const;
    bool accepts(std::set<std::string> const& tags) const;
    auto thread_name(std::thread::id id) -> std::string;

    std::queue<Entry>       queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    bool                    stopping_ = false;
    std::atomic<bool>       enabled_  = false;

    std::set<std::string> skip_tags_{"Executor", "Listener"};
    std::set<std::string> enabled_tags_;
    mutable std::mutex    tags_mutex_;

    std::unordered_map<std::thread::id, std::string> thread_names_;
    std::mutex                                       thread_names_mutex_;
    int                                              next_thread_number_ = 0;

    std::thread worker_;
};

TaggedLogger& logger();

template <typename... Tags>
void TaggedLogger::log_impl(std::string const& message, std::source_location const& location, Tags&&... tags) {
    if (!enabled_.load(std::memory_order_relaxed)) {
        return;
    }
    Entry entry{.timestamp = std::chrono::system_clock::now(),
                .tags      = {std::string{std::forward<Tags>(tags)}...},
                .message   = message,
                .thread    = thread_name(std::this_thread::get_id()),
                .location  = location};
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(entry));
    }
    cv_.notify_one();
}

#define ws_log(message, ...) ::WS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);

} // namespace WS

#else
#define ws_log(message, ...) ((void)0)
#endif // WS_LOG_DEBUG
