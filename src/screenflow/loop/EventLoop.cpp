#include "loop/EventLoop.hpp"
#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace SF {

class EventLoop::FrameGuard {
public:
    explicit FrameGuard(EventLoop& loop) : loop(loop) {
        std::lock_guard<std::mutex> lock(this->loop.mutex);
        ++this->loop.frameDepth;
    }
    ~FrameGuard() {
        std::lock_guard<std::mutex> lock(this->loop.mutex);
        --this->loop.frameDepth;
    }

    FrameGuard(FrameGuard const&)                    = delete;
    auto operator=(FrameGuard const&) -> FrameGuard& = delete;

private:
    EventLoop& loop;
};

EventLoop::EventLoop() : dispatchThread(std::this_thread::get_id()) {}

EventLoop::~EventLoop() {
    this->stop();
}

auto EventLoop::post(Event event) -> bool {
    if (!event)
        return false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->stopping.load(std::memory_order_acquire))
            return false;
        this->queue.push_back(std::move(event));
    }
    this->cv.notify_all();
    return true;
}

auto EventLoop::run() -> Expected<void> {
    if (auto onThread = this->checkDispatchThread("run"); !onThread)
        return onThread;

    RunFrame frame;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->runFrames.push_back(&frame);
    }
    struct RunFrameRelease {
        EventLoop& loop;
        ~RunFrameRelease() {
            std::lock_guard<std::mutex> lock(loop.mutex);
            loop.runFrames.pop_back();
        }
    } release{*this};

    sf_log("EventLoop::run entering", "EventLoop");
    return this->pumpUntil([&frame, this] {
        std::lock_guard<std::mutex> lock(this->mutex);
        return frame.quitRequested;
    });
}

auto EventLoop::quit() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->runFrames.empty())
            return;
        this->runFrames.back()->quitRequested = true;
        ++this->wakeRequests;
    }
    this->cv.notify_all();
}

auto EventLoop::stop() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->stopping.store(true, std::memory_order_release);
        this->queue.clear();
    }
    this->cv.notify_all();
}

auto EventLoop::wake() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        ++this->wakeRequests;
    }
    this->cv.notify_all();
}

auto EventLoop::pumpUntil(std::function<bool()> const& done) -> Expected<void> {
    if (auto onThread = this->checkDispatchThread("pumpUntil"); !onThread)
        return onThread;

    FrameGuard guard(*this);
    sf_log("EventLoop::pumpUntil depth " + std::to_string(this->depth()), "EventLoop");

    while (true) {
        if (done())
            return {};

        Event next;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->cv.wait(lock, [this] {
                return !this->queue.empty() || this->wakeRequests > 0 || this->stopping.load(std::memory_order_acquire);
            });
            if (this->stopping.load(std::memory_order_acquire))
                return std::unexpected(Error{Error::Code::LoopStopped, "event loop stopped while pumping"});
            if (this->wakeRequests > 0) {
                --this->wakeRequests;
                continue;
            }
            next = std::move(this->queue.front());
            this->queue.pop_front();
        }
        next();
    }
}

auto EventLoop::processPending() -> Expected<std::size_t> {
    if (auto onThread = this->checkDispatchThread("processPending"); !onThread)
        return std::unexpected(onThread.error());

    FrameGuard  guard(*this);
    std::size_t budget = 0;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->stopping.load(std::memory_order_acquire))
            return std::unexpected(Error{Error::Code::LoopStopped, "event loop stopped"});
        budget = this->queue.size();
    }

    // Only what was queued on entry; events posted while draining wait for the next pass.
    std::size_t serviced = 0;
    while (serviced < budget) {
        Event next;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (this->queue.empty() || this->stopping.load(std::memory_order_acquire))
                break;
            next = std::move(this->queue.front());
            this->queue.pop_front();
        }
        next();
        ++serviced;
    }
    return serviced;
}

auto EventLoop::depth() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->frameDepth;
}

auto EventLoop::pendingCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->queue.size();
}

auto EventLoop::stopped() const -> bool {
    return this->stopping.load(std::memory_order_acquire);
}

auto EventLoop::isDispatchThread() const -> bool {
    return std::this_thread::get_id() == this->dispatchThread;
}

auto EventLoop::checkDispatchThread(char const* operation) const -> Expected<void> {
    if (!this->isDispatchThread()) {
        sf_log(std::string("EventLoop::") + operation + " called off the dispatch thread", "EventLoop", "ERROR");
        return std::unexpected(Error{Error::Code::WrongThread, std::string(operation) + " must run on the dispatch thread"});
    }
    return {};
}

} // namespace SF
