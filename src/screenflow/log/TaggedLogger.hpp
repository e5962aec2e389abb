#pragma once

#ifdef SF_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace SF {

/**
 * Diagnostic log keyed by tags. Callers only queue a record; a single worker
 * formats and writes it to stderr, so the dispatch thread never waits on the
 * console. Records are dropped at the call site while logging is disabled.
 *
 * Filtering happens on the worker: with an allow-list set, a record needs at
 * least one allowed tag; otherwise records carrying a skipped tag are dropped.
 */
class TaggedLogger {
public:
    using Tags = std::set<std::string>;

    struct Record {
        std::chrono::system_clock::time_point when;
        Tags                                  tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)                    = delete;
    auto operator=(TaggedLogger const&) -> TaggedLogger& = delete;

    template <typename... TagArgs>
    auto write(std::string text, std::source_location const& where, TagArgs&&... tags) -> void;

    // Returns once every queued record has been written or filtered out.
    auto flush() -> void;

    auto setThreadName(std::string name) -> void;
    auto setLoggingEnabled(bool on) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    // A non-empty allow-list replaces the default skip list.
    auto setEnabledTags(Tags tags) -> void;
    [[nodiscard]] auto accepts(Tags const& tags) const -> bool;

    // Held by anything else printing to the console next to the log.
    static auto consoleMutex() -> std::mutex&;

private:
    auto drain() -> void;
    auto emit(Record const& record) const -> void;
    auto threadNameFor(std::thread::id id) -> std::string;

    std::atomic<bool> enabled{false};

    std::mutex              queueMutex;
    std::condition_variable queueChanged;
    std::deque<Record>      queue;
    std::size_t             inFlight = 0;
    bool                    stopping = false;

    mutable std::mutex filterMutex;
    Tags               skipped{"EventLoop", "Dispatch"};
    Tags               allowed;

    std::mutex                                       namesMutex;
    std::unordered_map<std::thread::id, std::string> names;
    int                                              unnamedThreads = 0;

    std::thread worker;
};

auto logger() -> TaggedLogger&;

template <typename... TagArgs>
auto TaggedLogger::write(std::string text, std::source_location const& where, TagArgs&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    Record record{std::chrono::system_clock::now(),
                  Tags{std::string(std::forward<TagArgs>(tags))...},
                  std::move(text),
                  this->threadNameFor(std::this_thread::get_id()),
                  where};
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->queue.push_back(std::move(record));
    }
    this->queueChanged.notify_all();
}

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);

} // namespace SF

#define sf_log(message, ...) ::SF::logger().write(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define sf_log(message, ...) ((void)0)
#endif // SF_LOG_DEBUG
