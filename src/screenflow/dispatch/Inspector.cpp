#include "dispatch/Inspector.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>

namespace SF::Dispatch {

namespace {

auto stripPrefix(std::string_view accessor, std::string_view prefix) -> std::optional<std::string> {
    if (accessor.size() <= prefix.size() || !accessor.starts_with(prefix))
        return std::nullopt;
    auto const first = static_cast<unsigned char>(accessor[prefix.size()]);
    if (!std::isupper(first))
        return std::nullopt;
    std::string name{accessor.substr(prefix.size())};
    name[0] = static_cast<char>(std::tolower(first));
    return name;
}

auto setterNameFor(std::string_view property) -> std::string {
    std::string name{"set"};
    name.append(property);
    name[3] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[3])));
    return name;
}

} // namespace

auto Inspector::PropertyNameFor(std::string_view accessor) -> std::optional<std::string> {
    if (auto name = stripPrefix(accessor, "get"))
        return name;
    return stripPrefix(accessor, "is");
}

Inspector::Inspector(HandlerTable const& table) {
    auto const voidType = std::type_index(typeid(void));
    for (auto const& entry : table.entries()) {
        if (!entry.parameters.empty() || entry.returnType == voidType)
            continue;
        auto name = PropertyNameFor(entry.name);
        if (!name)
            continue;
        auto const* setter = table.find(setterNameFor(*name), TypeSignature{entry.returnType});
        if (setter == nullptr || setter->returnType != voidType)
            continue;
        if (this->find(*name) != nullptr) {
            sf_log("Property " + *name + " has both get and is accessors; keeping the first", "Dispatch");
            continue;
        }
        this->discovered.push_back(Property{std::move(*name), entry.returnType, &entry, setter});
    }
    std::sort(this->discovered.begin(), this->discovered.end(), [](Property const& lhs, Property const& rhs) {
        return lhs.name < rhs.name;
    });
}

auto Inspector::properties() const -> std::vector<Property> const& {
    return this->discovered;
}

auto Inspector::find(std::string_view name) const -> Property const* {
    auto it = std::find_if(this->discovered.begin(), this->discovered.end(), [&](Property const& property) {
        return property.name == name;
    });
    return it == this->discovered.end() ? nullptr : &*it;
}

auto Inspector::get(Receiver& receiver, std::string_view name) const -> Expected<std::any> {
    auto const* property = this->find(name);
    if (property == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "no property " + std::string(name)});
    ArgumentList none;
    return property->getter->invoke(receiver, none);
}

auto Inspector::set(Receiver& receiver, std::string_view name, std::any value) const -> Expected<void> {
    auto const* property = this->find(name);
    if (property == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "no property " + std::string(name)});
    if (std::type_index(value.type()) != property->type)
        return std::unexpected(Error{Error::Code::TypeMismatch, "property " + property->name + " expects "
                                                                    + property->type.name()});
    ArgumentList args;
    args.push_back(std::move(value));
    property->setter->invoke(receiver, args);
    return {};
}

} // namespace SF::Dispatch
