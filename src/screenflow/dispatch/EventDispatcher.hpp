#pragma once
#include "dispatch/ArgumentTransformer.hpp"
#include "dispatch/CapabilityResolver.hpp"
#include "dispatch/HandlerTable.hpp"
#include "dispatch/TypeSignature.hpp"

#include <any>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace SF::Dispatch {

/**
 * EventDispatcher: routes one named event to whichever receiver it is given.
 *
 * The dispatcher owns its transformers and keeps no receiver state, so one
 * instance can serve any number of receivers.
 *
 * Failure semantics:
 * - No matching handler: invoke() returns std::nullopt, callMethodOn()
 *   returns false. This is not an error.
 * - A transformer that cannot produce its declared shape is treated the same
 *   way as a missing handler.
 * - A handler that throws a std::exception propagates that exception
 *   unchanged. Anything else thrown by a handler is rethrown once as
 *   HandlerFailure with the original nested inside.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(std::string eventName);
    virtual ~EventDispatcher() = default;

    EventDispatcher(EventDispatcher&&)                    = default;
    auto operator=(EventDispatcher&&) -> EventDispatcher& = default;

    [[nodiscard]] auto eventName() const -> std::string const&;

    auto addTransformer(ArgumentTransformer transformer) -> EventDispatcher&;

    [[nodiscard]] auto supportedByTypes(Receiver const& receiver, TypeSignature const& argTypes) const -> bool;
    [[nodiscard]] auto resolutionFor(Receiver const& receiver, TypeSignature const& argTypes) const -> std::optional<Resolution>;
    auto invokeWithArguments(Receiver& receiver, ArgumentList args) const -> std::optional<std::any>;

    template <typename... Args>
    [[nodiscard]] auto supportedBy(Receiver const& receiver, Args const&...) const -> bool {
        return this->supportedByTypes(receiver, SignatureOf<std::decay_t<Args>...>());
    }

    template <typename... Args>
    auto invoke(Receiver& receiver, Args&&... args) const -> std::optional<std::any> {
        return this->invokeWithArguments(receiver, MakeArguments(std::forward<Args>(args)...));
    }

    template <typename... Args>
    auto callMethodOn(Receiver& receiver, Args&&... args) const -> bool {
        return this->invoke(receiver, std::forward<Args>(args)...).has_value();
    }

protected:
    // Transformers worth trying for this receiver, in priority order.
    [[nodiscard]] virtual auto lookupTransformers(Receiver const& receiver, TypeSignature const& argTypes) const
        -> std::vector<ArgumentTransformer const*>;

private:
    std::string                      name;
    std::vector<ArgumentTransformer> transformers;
};

// One-shot routing without transformers: true when a handler ran.
template <typename... Args>
auto DispatchEvent(std::string eventName, Receiver& receiver, Args&&... args) -> bool {
    return EventDispatcher(std::move(eventName)).callMethodOn(receiver, std::forward<Args>(args)...);
}

template <typename... Args>
auto InvokeIfSupported(std::string eventName, Receiver& receiver, Args&&... args) -> std::optional<std::any> {
    return EventDispatcher(std::move(eventName)).invoke(receiver, std::forward<Args>(args)...);
}

} // namespace SF::Dispatch
