#include <screenflow/app/IdRegistry.hpp>

namespace SF::App {

auto IdRegistry::add(std::int32_t id, std::string name) -> bool {
    if (name.empty() || this->names.contains(id) || this->ids.contains(name))
        return false;
    this->ids.emplace(name, id);
    this->names.emplace(id, std::move(name));
    return true;
}

auto IdRegistry::remove(std::int32_t id) -> bool {
    auto it = this->names.find(id);
    if (it == this->names.end())
        return false;
    this->ids.erase(it->second);
    this->names.erase(it);
    return true;
}

auto IdRegistry::nameFor(std::int32_t id) const -> std::optional<std::string> {
    auto it = this->names.find(id);
    if (it == this->names.end())
        return std::nullopt;
    return it->second;
}

auto IdRegistry::idFor(std::string_view name) const -> std::optional<std::int32_t> {
    auto it = this->ids.find(std::string(name));
    if (it == this->ids.end())
        return std::nullopt;
    return it->second;
}

auto IdRegistry::size() const -> std::size_t {
    return this->names.size();
}

} // namespace SF::App
