#pragma once
#include "core/Error.hpp"
#include "dispatch/HandlerTable.hpp"

#include <any>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace SF::Dispatch {

/**
 * Inspector: property view over a receiver's handler table.
 *
 * A property "fooBar" exists when the table holds a zero-parameter, non-void
 * getFooBar or isFooBar together with a setFooBar(T) returning void, where T
 * is exactly the getter's return type. Getters without a matching setter are
 * not properties. Properties are listed sorted by name.
 */
class Inspector {
public:
    struct Property {
        std::string         name;
        std::type_index     type;
        HandlerEntry const* getter = nullptr;
        HandlerEntry const* setter = nullptr;
    };

    explicit Inspector(HandlerTable const& table);

    [[nodiscard]] auto properties() const -> std::vector<Property> const&;
    [[nodiscard]] auto find(std::string_view name) const -> Property const*;

    auto get(Receiver& receiver, std::string_view name) const -> Expected<std::any>;
    auto set(Receiver& receiver, std::string_view name, std::any value) const -> Expected<void>;

    template <typename T>
    auto getAs(Receiver& receiver, std::string_view name) const -> Expected<T> {
        auto value = this->get(receiver, name);
        if (!value)
            return std::unexpected(value.error());
        if (auto const* typed = std::any_cast<T>(&*value))
            return *typed;
        return std::unexpected(Error{Error::Code::TypeMismatch, "property " + std::string(name) + " has another type"});
    }

    // "getFooBar" -> "fooBar"; nullopt when the name has no accessor prefix.
    [[nodiscard]] static auto PropertyNameFor(std::string_view accessor) -> std::optional<std::string>;

private:
    std::vector<Property> discovered;
};

} // namespace SF::Dispatch
