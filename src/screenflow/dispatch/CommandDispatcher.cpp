#include "dispatch/CommandDispatcher.hpp"

namespace SF::Dispatch {

CommandDispatcher::CommandDispatcher(std::string_view commandId)
    : id(commandId), dispatcher(HandlerNameFor(commandId)) {}

auto CommandDispatcher::HandlerNameFor(std::string_view commandId) -> std::string {
    std::string name{commandId};
    name.append("Clicked");
    return name;
}

auto CommandDispatcher::commandId() const -> std::string const& {
    return this->id;
}

auto CommandDispatcher::handlerName() const -> std::string const& {
    return this->dispatcher.eventName();
}

auto CommandDispatcher::supportedBy(Receiver const& receiver) const -> bool {
    return this->dispatcher.supportedBy(receiver, Events::MenuItem{}) || this->dispatcher.supportedBy(receiver);
}

auto CommandDispatcher::dispatch(Receiver& receiver, Events::MenuItem const& item) const -> bool {
    if (this->dispatcher.supportedBy(receiver, item))
        return this->dispatcher.callMethodOn(receiver, item);
    return this->dispatcher.callMethodOn(receiver);
}

} // namespace SF::Dispatch
