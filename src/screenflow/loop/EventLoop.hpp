#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace SF {

/**
 * EventLoop: the single dispatch thread the orchestration layer runs on.
 *
 * Notes:
 * - The thread that constructs the loop is the dispatch thread. post(),
 *   wake() and stop() may be called from any thread; everything that
 *   services events must run on the dispatch thread.
 * - pumpUntil() is reentrant. An event serviced by a pumping frame may
 *   itself pump, which nests another frame; events are always serviced in
 *   FIFO order regardless of which frame picks them up.
 * - quit() ends the innermost run() frame. Frames opened by pumpUntil() only
 *   end when their own predicate holds.
 * - An exception thrown by an event unwinds out of the frame that serviced
 *   it; the frame bookkeeping is restored on the way out.
 */
class EventLoop {
public:
    using Event = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(EventLoop const&)                    = delete;
    auto operator=(EventLoop const&) -> EventLoop& = delete;

    auto post(Event event) -> bool;

    auto run() -> Expected<void>;
    auto quit() -> void;
    auto stop() -> void;

    auto pumpUntil(std::function<bool()> const& done) -> Expected<void>;
    auto processPending() -> Expected<std::size_t>;
    auto wake() -> void;

    [[nodiscard]] auto depth() const -> std::size_t;
    [[nodiscard]] auto pendingCount() const -> std::size_t;
    [[nodiscard]] auto stopped() const -> bool;
    [[nodiscard]] auto isDispatchThread() const -> bool;

private:
    struct RunFrame {
        bool quitRequested = false;
    };

    class FrameGuard;

    auto checkDispatchThread(char const* operation) const -> Expected<void>;

    std::thread::id                dispatchThread;
    mutable std::mutex             mutex;
    std::condition_variable        cv;
    std::deque<Event>              queue;
    std::vector<RunFrame*>         runFrames;
    std::size_t                    frameDepth = 0;
    std::size_t                    wakeRequests = 0;
    std::atomic<bool>              stopping{false};
};

} // namespace SF
