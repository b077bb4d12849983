#ifdef WS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace WS {

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : worker_([this] { run(); }) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TaggedLogger::set_thread_name(std::string const& name) {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

void TaggedLogger::set_logging_enabled(bool enabled) {
    enabled_.store(enabled, std::memory_order_relaxed);
}

void TaggedLogger::set_enabled_tags(std::set<std::string> tags) {
    std::lock_guard<std::mutex> lock(tags_mutex_);
    enabled_tags_ = std::move(tags);
}

// Drains everything queued before the destructor asked it to stop.
void TaggedLogger::run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        while (!queue_.empty()) {
            auto entry = std::move(queue_.front());
            queue_.pop();
            lock.unlock();
            write(entry);
            lock.lock();
        }
        if (stopping_) {
            return;
        }
    }
}

bool TaggedLogger::accepts(std::set<std::string> const& tags) const {
    std::lock_guard<std::mutex> lock(tags_mutex_);
    for (auto const& tag : tags) {
        if (skip_tags_.contains(tag)) {
            return false;
        }
        if (!enabled_tags_.empty() && !enabled_tags_.contains(tag)) {
            return false;
        }
    }
    return true;
}

void TaggedLogger::write(Entry const& entry) const {
    if (!accepts(entry.tags)) {
        return;
    }

    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    auto const seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::string_view file{entry.location.file_name()};
    file = file.substr(file.find_last_of('/') + 1);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : entry.tags) {
        line << '[' << tag << ']';
    }
    line << " [" << entry.thread << "] [" << file << ':' << entry.location.line() << "] " << entry.message << '\n';
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::thread_name(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(next_thread_number_++);
    }
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().set_thread_name(name);
}

void set_logging_enabled(bool enabled) {
    logger().set_logging_enabled(enabled);
}

} // namespace WS
#endif // WS_LOG_DEBUG
