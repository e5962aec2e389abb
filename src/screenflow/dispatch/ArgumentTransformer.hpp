#pragma once
#include "core/Error.hpp"
#include "dispatch/HandlerTable.hpp"
#include "dispatch/TypeSignature.hpp"

#include <any>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace SF::Dispatch {

/**
 * ArgumentTransformer: pure mapping from one argument shape to another.
 *
 * A transformer applies to argument lists whose types equal its source
 * signature and always yields a list matching its target signature. It
 * inspects a receiver only to decide whether that receiver exposes a handler
 * with the target signature.
 */
class ArgumentTransformer {
public:
    using Function = std::function<ArgumentList(ArgumentList const&)>;

    ArgumentTransformer(std::string name, TypeSignature source, TypeSignature target, Function function);

    // Unpacks a single payload of type From into the fields returned by fn.
    template <typename From, typename... To, typename Fn>
    [[nodiscard]] static auto Unpack(std::string name, Fn fn) -> ArgumentTransformer {
        return ArgumentTransformer(std::move(name),
                                   SignatureOf<From>(),
                                   SignatureOf<To...>(),
                                   [fn = std::move(fn)](ArgumentList const& args) -> ArgumentList {
                                       auto const& payload = std::any_cast<From const&>(args.front());
                                       std::tuple<To...> fields = fn(payload);
                                       return std::apply([](auto&&... values) { return MakeArguments(std::forward<decltype(values)>(values)...); },
                                                         std::move(fields));
                                   });
    }

    [[nodiscard]] auto name() const -> std::string const&;
    [[nodiscard]] auto sourceSignature() const -> TypeSignature const&;
    [[nodiscard]] auto targetSignature() const -> TypeSignature const&;

    [[nodiscard]] auto supports(Receiver const& receiver, std::string_view handlerName, TypeSignature const& originalTypes) const -> bool;
    auto addIfSupportedBy(Receiver const& receiver,
                          std::string_view handlerName,
                          TypeSignature const& originalTypes,
                          std::vector<ArgumentTransformer const*>& candidates) const -> bool;

    [[nodiscard]] auto transform(ArgumentList const& original) const -> Expected<ArgumentList>;

private:
    std::string   transformerName;
    TypeSignature source;
    TypeSignature target;
    Function      function;
};

} // namespace SF::Dispatch
