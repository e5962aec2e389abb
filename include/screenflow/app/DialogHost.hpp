#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace SF::App {

struct DialogRequest {
    std::string title;
    std::string message;
    std::optional<std::string> positive_label{};
    std::optional<std::string> negative_label{};
    std::vector<std::string> items{};
};

// Each callback must be delivered through the event loop. Exactly one of
// them fires per shown dialog; on_cancel covers back-navigation and
// touches outside the dialog.
struct DialogCallbacks {
    std::function<void()> on_positive;
    std::function<void()> on_negative;
    std::function<void(std::size_t)> on_item;
    std::function<void()> on_cancel;
};

/**
 * Presents dialogs on behalf of a screen. show() must not block: it puts
 * the dialog up and returns; the callbacks report the user's choice later.
 */
class DialogHost {
public:
    virtual ~DialogHost() = default;

    virtual auto show(DialogRequest const& request, DialogCallbacks callbacks) -> SF::Expected<void> = 0;
};

} // namespace SF::App
