#include "dispatch/EventDispatcher.hpp"
#include "core/Error.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>

namespace SF::Dispatch {

EventDispatcher::EventDispatcher(std::string eventName) : name(std::move(eventName)) {}

auto EventDispatcher::eventName() const -> std::string const& {
    return this->name;
}

auto EventDispatcher::addTransformer(ArgumentTransformer transformer) -> EventDispatcher& {
    this->transformers.push_back(std::move(transformer));
    return *this;
}

auto EventDispatcher::lookupTransformers(Receiver const& receiver, TypeSignature const& argTypes) const
    -> std::vector<ArgumentTransformer const*> {
    std::vector<ArgumentTransformer const*> candidates;
    for (auto const& transformer : this->transformers)
        transformer.addIfSupportedBy(receiver, this->name, argTypes, candidates);
    return candidates;
}

auto EventDispatcher::resolutionFor(Receiver const& receiver, TypeSignature const& argTypes) const -> std::optional<Resolution> {
    auto candidates = this->lookupTransformers(receiver, argTypes);
    return CapabilityResolver::resolve(this->name, receiver, argTypes, candidates);
}

auto EventDispatcher::supportedByTypes(Receiver const& receiver, TypeSignature const& argTypes) const -> bool {
    return this->resolutionFor(receiver, argTypes).has_value();
}

auto EventDispatcher::invokeWithArguments(Receiver& receiver, ArgumentList args) const -> std::optional<std::any> {
    auto resolution = this->resolutionFor(receiver, signatureOf(args));
    if (!resolution) {
        sf_log("No handler " + this->name + describeSignature(signatureOf(args)), "Dispatch");
        return std::nullopt;
    }

    ArgumentList callArgs;
    if (resolution->identity()) {
        callArgs = std::move(args);
    } else {
        auto transformed = resolution->transformer->transform(args);
        if (!transformed) {
            sf_log("Transformer " + resolution->transformer->name() + " failed for " + this->name + ": "
                       + describeError(transformed.error()),
                   "Dispatch", "ERROR");
            return std::nullopt;
        }
        callArgs = std::move(*transformed);
    }

    try {
        return std::optional<std::any>{std::in_place, resolution->handler->invoke(receiver, callArgs)};
    } catch (std::exception const&) {
        throw;
    } catch (...) {
        std::throw_with_nested(HandlerFailure("handler " + this->name + " raised a non-standard exception"));
    }
}

} // namespace SF::Dispatch
