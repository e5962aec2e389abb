#include "dispatch/CapabilityResolver.hpp"

namespace SF::Dispatch {

namespace {

auto match(std::string_view handlerName,
           Receiver const& receiver,
           TypeSignature const& argTypes,
           ArgumentTransformer const* transformer) -> std::optional<Resolution> {
    auto const& outputTypes = transformer ? transformer->targetSignature() : argTypes;
    if (transformer && transformer->sourceSignature() != argTypes)
        return std::nullopt;
    if (auto const* handler = receiver.handlerTable().find(handlerName, outputTypes))
        return Resolution{.transformer = transformer, .handler = handler};
    return std::nullopt;
}

} // namespace

auto CapabilityResolver::candidates(std::string_view handlerName,
                                    Receiver const& receiver,
                                    TypeSignature const& argTypes,
                                    std::span<ArgumentTransformer const* const> transformers) -> std::vector<Resolution> {
    std::vector<Resolution> viable;
    if (auto identity = match(handlerName, receiver, argTypes, nullptr))
        viable.push_back(*identity);
    for (auto const* transformer : transformers) {
        if (transformer == nullptr)
            continue;
        if (auto adapted = match(handlerName, receiver, argTypes, transformer))
            viable.push_back(*adapted);
    }
    return viable;
}

auto CapabilityResolver::resolve(std::string_view handlerName,
                                 Receiver const& receiver,
                                 TypeSignature const& argTypes,
                                 std::span<ArgumentTransformer const* const> transformers) -> std::optional<Resolution> {
    if (auto identity = match(handlerName, receiver, argTypes, nullptr))
        return identity;
    for (auto const* transformer : transformers) {
        if (transformer == nullptr)
            continue;
        if (auto adapted = match(handlerName, receiver, argTypes, transformer))
            return adapted;
    }
    return std::nullopt;
}

} // namespace SF::Dispatch
