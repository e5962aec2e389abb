#include "dispatch/HandlerTable.hpp"

namespace SF::Dispatch {

auto HandlerTable::add(HandlerEntry entry) -> bool {
    if (!entry.invoke || entry.name.empty())
        return false;
    if (this->contains(entry.name, entry.parameters))
        return false;

    auto index = this->handlers.size();
    this->byName[entry.name].push_back(index);
    this->handlers.push_back(std::move(entry));
    return true;
}

auto HandlerTable::find(std::string_view name, TypeSignature const& parameters) const -> HandlerEntry const* {
    auto it = this->byName.find(std::string(name));
    if (it == this->byName.end())
        return nullptr;
    for (auto index : it->second) {
        auto const& entry = this->handlers[index];
        if (entry.parameters == parameters)
            return &entry;
    }
    return nullptr;
}

auto HandlerTable::contains(std::string_view name, TypeSignature const& parameters) const -> bool {
    return this->find(name, parameters) != nullptr;
}

auto HandlerTable::overloads(std::string_view name) const -> std::vector<HandlerEntry const*> {
    std::vector<HandlerEntry const*> out;
    auto                             it = this->byName.find(std::string(name));
    if (it == this->byName.end())
        return out;
    out.reserve(it->second.size());
    for (auto index : it->second)
        out.push_back(&this->handlers[index]);
    return out;
}

auto HandlerTable::entries() const -> std::vector<HandlerEntry> const& {
    return this->handlers;
}

auto HandlerTable::size() const -> std::size_t {
    return this->handlers.size();
}

auto HandlerTable::empty() const -> bool {
    return this->handlers.empty();
}

} // namespace SF::Dispatch
