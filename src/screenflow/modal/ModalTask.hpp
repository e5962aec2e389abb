#pragma once
#include "core/Error.hpp"
#include "log/TaggedLogger.hpp"
#include "loop/EventLoop.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

namespace SF::Modal {

enum class ModalState {
    Created,
    Running,
    Completed
};

enum class ModalOutcome {
    Completed,
    Dismissed
};

template <typename T>
struct ModalResult {
    ModalOutcome     outcome = ModalOutcome::Dismissed;
    std::optional<T> value;

    [[nodiscard]] auto completed() const -> bool {
        return this->outcome == ModalOutcome::Completed;
    }
    [[nodiscard]] auto dismissed() const -> bool {
        return this->outcome == ModalOutcome::Dismissed;
    }
    [[nodiscard]] auto value_or(T fallback) const -> T {
        return this->value ? *this->value : std::move(fallback);
    }
};

// Result type for modal constructs that produce no value.
using NoValue = std::monostate;

namespace detail {

template <typename T>
struct ModalSlot {
    explicit ModalSlot(EventLoop& loop) : loop(&loop) {}

    // Cleared under mutex once the owning task is done with the loop.
    EventLoop*                    loop;
    mutable std::mutex            mutex;
    ModalState                    state = ModalState::Created;
    std::optional<ModalResult<T>> result;
    std::size_t                   ignoredSignals = 0;
    nlohmann::json                extras         = nlohmann::json::object();
};

} // namespace detail

/**
 * ModalCompletion: the handle a modal construct's callbacks use to deliver
 * the result.
 *
 * Exactly one signal is accepted: the first complete() or dismiss() wins and
 * every later signal is ignored (counted and logged). Handles are cheap to
 * copy and may outlive both the task and its event loop: once the task has
 * returned, a signal is still recorded but no longer wakes the loop.
 */
template <typename T>
class ModalCompletion {
public:
    explicit ModalCompletion(std::shared_ptr<detail::ModalSlot<T>> slot) : slot(std::move(slot)) {}

    auto complete(T value) const -> bool {
        return this->signal(ModalResult<T>{ModalOutcome::Completed, std::optional<T>{std::move(value)}});
    }

    auto dismiss() const -> bool {
        return this->signal(ModalResult<T>{ModalOutcome::Dismissed, std::nullopt});
    }

    [[nodiscard]] auto signaled() const -> bool {
        std::lock_guard<std::mutex> lock(this->slot->mutex);
        return this->slot->result.has_value();
    }

    // The task's auxiliary key/value bag. Only touch it on the dispatch thread.
    [[nodiscard]] auto extras() const -> nlohmann::json& {
        return this->slot->extras;
    }

private:
    auto signal(ModalResult<T> result) const -> bool {
        {
            std::lock_guard<std::mutex> lock(this->slot->mutex);
            if (this->slot->result.has_value()) {
                ++this->slot->ignoredSignals;
                sf_log("Ignoring modal completion after the first", "ModalTask", "ERROR");
                return false;
            }
            this->slot->result = std::move(result);
            this->slot->state  = ModalState::Completed;
            if (this->slot->loop != nullptr)
                this->slot->loop->wake();
        }
        return true;
    }

    std::shared_ptr<detail::ModalSlot<T>> slot;
};

/**
 * ModalTask: blocking-call semantics over an asynchronous modal construct.
 *
 * execute() runs the trigger, which presents the construct, hands the
 * completion handle to the construct's callbacks, and returns without
 * blocking. The task then pumps the event loop on the calling thread until
 * a completion signal arrives and returns the signaled result. Unrelated
 * events keep being serviced while waiting, and a trigger may itself be
 * serviced from inside another task's wait (nesting).
 *
 * Every path that can close the construct (confirm, cancel, back, error)
 * must signal the completion; a task that is never signaled never returns.
 * If the trigger throws, the exception propagates and the loop is not
 * entered. The task itself must not outlive its loop.
 */
template <typename T>
class ModalTask {
public:
    using Trigger = std::function<void(ModalCompletion<T> const&)>;

    explicit ModalTask(EventLoop& loop) : slot(std::make_shared<detail::ModalSlot<T>>(loop)) {}

    ~ModalTask() {
        this->detachLoop();
    }

    ModalTask(ModalTask const&)                    = delete;
    auto operator=(ModalTask const&) -> ModalTask& = delete;

    [[nodiscard]] auto completion() const -> ModalCompletion<T> {
        return ModalCompletion<T>{this->slot};
    }

    [[nodiscard]] auto extras() -> nlohmann::json& {
        return this->slot->extras;
    }

    [[nodiscard]] auto state() const -> ModalState {
        std::lock_guard<std::mutex> lock(this->slot->mutex);
        return this->slot->state;
    }

    [[nodiscard]] auto ignoredSignals() const -> std::size_t {
        std::lock_guard<std::mutex> lock(this->slot->mutex);
        return this->slot->ignoredSignals;
    }

    auto execute(Trigger const& trigger) -> Expected<ModalResult<T>> {
        if (!trigger)
            return std::unexpected(Error{Error::Code::InvalidArguments, "modal task needs a trigger"});
        EventLoop* loop = nullptr;
        {
            std::lock_guard<std::mutex> lock(this->slot->mutex);
            if (this->slot->state != ModalState::Created)
                return std::unexpected(Error{Error::Code::InvalidArguments, "modal task already executed"});
            loop = this->slot->loop;
            if (!loop->isDispatchThread())
                return std::unexpected(Error{Error::Code::WrongThread, "modal tasks must run on the dispatch thread"});
            this->slot->state = ModalState::Running;
        }

        try {
            trigger(this->completion());
        } catch (...) {
            std::lock_guard<std::mutex> lock(this->slot->mutex);
            if (!this->slot->result)
                this->slot->state = ModalState::Created;
            throw;
        }

        auto slotRef = this->slot;
        auto pumped  = loop->pumpUntil([slotRef] {
            std::lock_guard<std::mutex> lock(slotRef->mutex);
            return slotRef->result.has_value();
        });

        std::lock_guard<std::mutex> lock(this->slot->mutex);
        this->slot->loop = nullptr;
        if (!pumped)
            return std::unexpected(pumped.error());
        return *this->slot->result;
    }

private:
    auto detachLoop() -> void {
        std::lock_guard<std::mutex> lock(this->slot->mutex);
        this->slot->loop = nullptr;
    }

    std::shared_ptr<detail::ModalSlot<T>> slot;
};

template <typename T>
auto PresentModal(EventLoop& loop, typename ModalTask<T>::Trigger const& trigger) -> Expected<ModalResult<T>> {
    ModalTask<T> task(loop);
    return task.execute(trigger);
}

} // namespace SF::Modal
