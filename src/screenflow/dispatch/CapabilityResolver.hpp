#pragma once
#include "dispatch/ArgumentTransformer.hpp"
#include "dispatch/HandlerTable.hpp"
#include "dispatch/TypeSignature.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace SF::Dispatch {

struct Resolution {
    ArgumentTransformer const* transformer = nullptr; // nullptr: arguments pass through unchanged
    HandlerEntry const*        handler     = nullptr;

    [[nodiscard]] auto identity() const -> bool {
        return this->transformer == nullptr;
    }
};

/**
 * CapabilityResolver: decides which handler, if any, a receiver exposes for
 * an event.
 *
 * Candidates are tried in a fixed order: the untransformed argument list
 * first, then each transformer in the order it was supplied. The first
 * candidate whose output types exactly match a handler with the event's name
 * wins; signature specificity plays no part in the choice.
 */
class CapabilityResolver {
public:
    [[nodiscard]] static auto candidates(std::string_view handlerName,
                                         Receiver const& receiver,
                                         TypeSignature const& argTypes,
                                         std::span<ArgumentTransformer const* const> transformers) -> std::vector<Resolution>;

    [[nodiscard]] static auto resolve(std::string_view handlerName,
                                      Receiver const& receiver,
                                      TypeSignature const& argTypes,
                                      std::span<ArgumentTransformer const* const> transformers) -> std::optional<Resolution>;
};

} // namespace SF::Dispatch
