#include "dispatch/MotionEventDispatcher.hpp"

#include <tuple>

namespace SF::Dispatch {

MotionEventDispatcher::MotionEventDispatcher(std::string eventName) : EventDispatcher(std::move(eventName)) {}

auto MotionEventDispatcher::positionalTransformer() const -> ArgumentTransformer const& {
    if (!this->xyTransformer) {
        this->xyTransformer.emplace(ArgumentTransformer::Unpack<Events::MotionEvent, float, float>(
            "motion.xy",
            [](Events::MotionEvent const& event) { return std::tuple<float, float>{event.x, event.y}; }));
    }
    return *this->xyTransformer;
}

auto MotionEventDispatcher::lookupTransformers(Receiver const& receiver, TypeSignature const& argTypes) const
    -> std::vector<ArgumentTransformer const*> {
    auto candidates = EventDispatcher::lookupTransformers(receiver, argTypes);
    this->positionalTransformer().addIfSupportedBy(receiver, this->eventName(), argTypes, candidates);
    return candidates;
}

} // namespace SF::Dispatch
