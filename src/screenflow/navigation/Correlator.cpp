#include "navigation/Correlator.hpp"
#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace SF::Navigation {

auto Correlator::Instance() -> Correlator& {
    static Correlator correlator;
    return correlator;
}

auto Correlator::registerArguments(Arguments const& args) -> CorrelationToken {
    auto token = this->tokens.next();
    std::lock_guard<std::mutex> lock(this->argumentsMutex);
    this->purgeExpiredArgumentsLocked();
    this->arguments[token] = args;
    return token;
}

auto Correlator::releaseArguments(CorrelationToken token) -> bool {
    std::lock_guard<std::mutex> lock(this->argumentsMutex);
    return this->arguments.erase(token) > 0;
}

auto Correlator::takeArguments(CorrelationToken token) -> Arguments {
    std::lock_guard<std::mutex> lock(this->argumentsMutex);
    auto it = this->arguments.find(token);
    if (it == this->arguments.end())
        return nullptr;
    auto strong = it->second.lock();
    if (!strong) {
        sf_log("Arguments for token " + std::to_string(token.value) + " were reclaimed", "Correlator");
        this->arguments.erase(it);
    }
    return strong;
}

auto Correlator::reclaim() -> std::size_t {
    std::lock_guard<std::mutex> lock(this->argumentsMutex);
    return this->purgeExpiredArgumentsLocked();
}

auto Correlator::purgeExpiredArgumentsLocked() -> std::size_t {
    std::size_t reclaimed = 0;
    for (auto it = this->arguments.begin(); it != this->arguments.end();) {
        if (it->second.expired()) {
            this->arguments.erase(it++);
            ++reclaimed;
        } else {
            ++it;
        }
    }
    return reclaimed;
}

auto Correlator::registerResult(std::any value) -> CorrelationToken {
    auto token = this->tokens.next();
    std::lock_guard<std::mutex> lock(this->resultsMutex);
    this->results.insert_or_assign(token, std::move(value));
    return token;
}

auto Correlator::takeResult(CorrelationToken token) -> std::optional<std::any> {
    std::lock_guard<std::mutex> lock(this->resultsMutex);
    auto it = this->results.find(token);
    if (it == this->results.end())
        return std::nullopt;
    std::optional<std::any> value{std::in_place, std::move(it->second)};
    this->results.erase(it);
    return value;
}

auto Correlator::registerPendingHandler(std::shared_ptr<ActivityStarter> handler) -> CorrelationToken {
    auto token = this->tokens.next();
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->handlers.insert_or_assign(token, std::move(handler));
    return token;
}

auto Correlator::takeAndDispatch(CorrelationToken token, ActivityResult const& result) -> bool {
    std::shared_ptr<ActivityStarter> handler;
    {
        std::lock_guard<std::mutex> lock(this->handlersMutex);
        auto it = this->handlers.find(token);
        if (it == this->handlers.end())
            return false;
        handler = std::move(it->second);
        this->handlers.erase(it);
    }
    if (!handler)
        return false;
    // Invoked outside the lock so the handler may register follow-up work.
    handler->handleActivityResult(result);
    return true;
}

auto Correlator::releasePendingHandler(CorrelationToken token) -> bool {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    return this->handlers.erase(token) > 0;
}

auto Correlator::argumentCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->argumentsMutex);
    return this->arguments.size();
}

auto Correlator::resultCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->resultsMutex);
    return this->results.size();
}

auto Correlator::pendingHandlerCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    return this->handlers.size();
}

auto Correlator::clear() -> void {
    {
        std::lock_guard<std::mutex> lock(this->argumentsMutex);
        this->arguments.clear();
    }
    {
        std::lock_guard<std::mutex> lock(this->resultsMutex);
        this->results.clear();
    }
    std::lock_guard<std::mutex> lock(this->handlersMutex);
    this->handlers.clear();
}

} // namespace SF::Navigation
