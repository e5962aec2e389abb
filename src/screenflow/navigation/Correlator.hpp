#pragma once
#include "dispatch/TypeSignature.hpp"
#include "navigation/ActivityResult.hpp"
#include "navigation/CorrelationToken.hpp"

#include <parallel_hashmap/phmap.h>

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace SF::Navigation {

/**
 * Correlator: token-keyed hand-off of transient data across navigation.
 *
 * Three independent tables, each guarded by its own mutex:
 * - arguments: held weakly. The registering side keeps the strong reference
 *   for as long as the arguments matter; once it lets go they may vanish
 *   before the target reads them. Reads do not remove the entry, so a target
 *   can re-read its arguments after restoring state. releaseArguments() drops
 *   an entry explicitly; reclaim() and every new registration drop entries
 *   whose arguments are gone.
 * - results: held strongly until the first take.
 * - pending activity starters: held strongly until dispatched once.
 *
 * Every miss reads as an absent value, never as an error.
 */
class Correlator {
public:
    using Arguments = std::shared_ptr<Dispatch::ArgumentList const>;

    static auto Instance() -> Correlator&;

    auto registerArguments(Arguments const& args) -> CorrelationToken;
    [[nodiscard]] auto takeArguments(CorrelationToken token) -> Arguments;
    auto releaseArguments(CorrelationToken token) -> bool;
    auto reclaim() -> std::size_t;

    auto registerResult(std::any value) -> CorrelationToken;
    [[nodiscard]] auto takeResult(CorrelationToken token) -> std::optional<std::any>;

    auto registerPendingHandler(std::shared_ptr<ActivityStarter> handler) -> CorrelationToken;
    auto takeAndDispatch(CorrelationToken token, ActivityResult const& result) -> bool;
    auto releasePendingHandler(CorrelationToken token) -> bool;

    [[nodiscard]] auto argumentCount() const -> std::size_t;
    [[nodiscard]] auto resultCount() const -> std::size_t;
    [[nodiscard]] auto pendingHandlerCount() const -> std::size_t;

    auto clear() -> void;

private:
    template <typename Value>
    using TokenMap = phmap::flat_hash_map<CorrelationToken, Value, std::hash<CorrelationToken>>;

    // Caller holds argumentsMutex.
    auto purgeExpiredArgumentsLocked() -> std::size_t;

    TokenGenerator tokens;

    mutable std::mutex                                      argumentsMutex;
    TokenMap<std::weak_ptr<Dispatch::ArgumentList const>>   arguments;

    mutable std::mutex                                      resultsMutex;
    TokenMap<std::any>                                      results;

    mutable std::mutex                                      handlersMutex;
    TokenMap<std::shared_ptr<ActivityStarter>>              handlers;
};

} // namespace SF::Navigation
