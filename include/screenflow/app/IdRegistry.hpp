#pragma once

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SF::App {

// Numeric command ids <-> stable identifiers used to name handlers.
class IdRegistry {
public:
    auto add(std::int32_t id, std::string name) -> bool;
    auto remove(std::int32_t id) -> bool;

    [[nodiscard]] auto nameFor(std::int32_t id) const -> std::optional<std::string>;
    [[nodiscard]] auto idFor(std::string_view name) const -> std::optional<std::int32_t>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    phmap::flat_hash_map<std::int32_t, std::string> names;
    phmap::flat_hash_map<std::string, std::int32_t> ids;
};

} // namespace SF::App
