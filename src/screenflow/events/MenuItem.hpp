#pragma once

#include <cstdint>
#include <string>

namespace SF::Events {

struct MenuItem {
    std::int32_t item_id = 0;
    std::string title;
    bool checkable = false;
    bool checked = false;
};

} // namespace SF::Events
