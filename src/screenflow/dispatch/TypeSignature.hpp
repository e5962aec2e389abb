#pragma once

#include <any>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace SF::Dispatch {

using ArgumentList  = std::vector<std::any>;
using TypeSignature = std::vector<std::type_index>;

// Parameter types are compared after stripping references and cv-qualifiers;
// no widening or conversion is ever applied.
template <typename... Ts>
[[nodiscard]] auto SignatureOf() -> TypeSignature {
    return TypeSignature{std::type_index(typeid(std::remove_cvref_t<Ts>))...};
}

[[nodiscard]] inline auto signatureOf(ArgumentList const& args) -> TypeSignature {
    TypeSignature signature;
    signature.reserve(args.size());
    for (auto const& arg : args)
        signature.emplace_back(arg.type());
    return signature;
}

template <typename... Args>
[[nodiscard]] auto MakeArguments(Args&&... args) -> ArgumentList {
    ArgumentList list;
    list.reserve(sizeof...(Args));
    (list.emplace_back(std::decay_t<Args>(std::forward<Args>(args))), ...);
    return list;
}

[[nodiscard]] inline auto describeSignature(TypeSignature const& signature) -> std::string {
    std::string out{"("};
    for (std::size_t i = 0; i < signature.size(); ++i) {
        if (i > 0)
            out.append(", ");
        out.append(signature[i].name());
    }
    out.push_back(')');
    return out;
}

} // namespace SF::Dispatch
