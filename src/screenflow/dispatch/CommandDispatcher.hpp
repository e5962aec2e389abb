#pragma once
#include "dispatch/EventDispatcher.hpp"
#include "events/MenuItem.hpp"

#include <string>
#include <string_view>

namespace SF::Dispatch {

/**
 * Routes a selected command to the handler named "<commandId>Clicked".
 * The one-argument form taking the MenuItem is preferred; the zero-argument
 * form is used when the receiver has no one-argument handler.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(std::string_view commandId);

    [[nodiscard]] static auto HandlerNameFor(std::string_view commandId) -> std::string;

    [[nodiscard]] auto commandId() const -> std::string const&;
    [[nodiscard]] auto handlerName() const -> std::string const&;
    [[nodiscard]] auto supportedBy(Receiver const& receiver) const -> bool;

    auto dispatch(Receiver& receiver, Events::MenuItem const& item) const -> bool;

private:
    std::string     id;
    EventDispatcher dispatcher;
};

} // namespace SF::Dispatch
