#pragma once
#include "dispatch/EventDispatcher.hpp"
#include "events/MotionEvent.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SF::Dispatch {

/**
 * Dispatcher for pointer motion events. In addition to any registered
 * transformers it offers the positional transformer, so a receiver may take
 * either (MotionEvent const&) or (float x, float y).
 */
class MotionEventDispatcher : public EventDispatcher {
public:
    explicit MotionEventDispatcher(std::string eventName);

    // (MotionEvent) -> (float x, float y); built on first use.
    [[nodiscard]] auto positionalTransformer() const -> ArgumentTransformer const&;

protected:
    [[nodiscard]] auto lookupTransformers(Receiver const& receiver, TypeSignature const& argTypes) const
        -> std::vector<ArgumentTransformer const*> override;

private:
    mutable std::optional<ArgumentTransformer> xyTransformer;
};

} // namespace SF::Dispatch
