#ifdef SF_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SF {

namespace {

// "dir/File.cpp" rather than the full build path.
auto shortPath(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

auto TaggedLogger::consoleMutex() -> std::mutex& {
    static std::mutex console;
    return console;
}

TaggedLogger::TaggedLogger() {
    this->worker = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->stopping = true;
    }
    this->queueChanged.notify_all();
    if (this->worker.joinable())
        this->worker.join();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->queueChanged.wait(lock, [this] { return this->queue.empty() && this->inFlight == 0; });
}

auto TaggedLogger::setThreadName(std::string name) -> void {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    this->names[std::this_thread::get_id()] = std::move(name);
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    this->enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return this->enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(Tags tags) -> void {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    this->allowed = std::move(tags);
    this->skipped.clear();
}

auto TaggedLogger::accepts(Tags const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(this->filterMutex);
    auto contains = [&tags](Tags const& set) {
        for (auto const& tag : tags)
            if (set.contains(tag))
                return true;
        return false;
    };
    if (!this->allowed.empty() && !contains(this->allowed))
        return false;
    return !contains(this->skipped);
}

auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->queueChanged.wait(lock, [this] { return !this->queue.empty() || this->stopping; });
        if (this->queue.empty())
            return;

        auto record = std::move(this->queue.front());
        this->queue.pop_front();
        ++this->inFlight;
        lock.unlock();
        this->emit(record);
        lock.lock();
        --this->inFlight;
        if (this->queue.empty())
            this->queueChanged.notify_all();
    }
}

auto TaggedLogger::emit(Record const& record) const -> void {
    if (!this->accepts(record.tags))
        return;

    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.when.time_since_epoch()) % 1000;
    auto const seconds = std::chrono::system_clock::to_time_t(record.when);
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << " [";
    bool first = true;
    for (auto const& tag : record.tags) {
        line << (first ? "" : "][") << tag;
        first = false;
    }
    line << "] [" << record.thread << "] [" << shortPath(record.where.file_name()) << ':' << record.where.line() << "] "
         << record.text << '\n';

    std::lock_guard<std::mutex> lock(consoleMutex());
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadNameFor(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(this->namesMutex);
    auto [it, inserted] = this->names.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(this->unnamedThreads++);
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace SF
#endif // SF_LOG_DEBUG
