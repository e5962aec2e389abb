#pragma once
#include "dispatch/TypeSignature.hpp"
#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <any>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace SF::Dispatch {

class HandlerTable;

/**
 * Receiver: anything events can be routed to. The handler table describes
 * the receiver's public handler surface and is built once per concrete type.
 */
class Receiver {
public:
    virtual ~Receiver() = default;

    [[nodiscard]] virtual auto handlerTable() const -> HandlerTable const& = 0;
};

struct HandlerEntry {
    using Invoker = std::function<std::any(Receiver&, ArgumentList&)>;

    std::string     name;
    TypeSignature   parameters;
    std::type_index returnType = std::type_index(typeid(void));
    Invoker         invoke;
};

/**
 * HandlerTable: (name, exact parameter types) -> handler lookup.
 *
 * Entries keep their registration order; a second entry with the same name
 * and parameter list is rejected. Entry pointers handed out by find() stay
 * valid for the lifetime of the table once it has been built.
 */
class HandlerTable {
public:
    template <typename Host>
    class Builder;

    auto add(HandlerEntry entry) -> bool;

    [[nodiscard]] auto find(std::string_view name, TypeSignature const& parameters) const -> HandlerEntry const*;
    [[nodiscard]] auto contains(std::string_view name, TypeSignature const& parameters) const -> bool;
    [[nodiscard]] auto overloads(std::string_view name) const -> std::vector<HandlerEntry const*>;
    [[nodiscard]] auto entries() const -> std::vector<HandlerEntry> const&;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

private:
    std::vector<HandlerEntry>                                    handlers;
    phmap::flat_hash_map<std::string, std::vector<std::size_t>> byName;
};

namespace detail {

template <typename Param>
auto argumentAs(std::any& slot) -> Param {
    using Stored = std::remove_cvref_t<Param>;
    if constexpr (std::is_rvalue_reference_v<Param>) {
        return std::move(std::any_cast<Stored&>(slot));
    } else {
        return std::any_cast<Stored&>(slot);
    }
}

template <typename R, typename... Params>
struct MethodInvoker {
    template <typename Host, typename Method, std::size_t... I>
    static auto call(Host& host, Method method, ArgumentList& args, std::index_sequence<I...>) -> std::any {
        if constexpr (std::is_void_v<R>) {
            (host.*method)(argumentAs<Params>(args[I])...);
            return {};
        } else {
            return std::any((host.*method)(argumentAs<Params>(args[I])...));
        }
    }
};

template <typename Host, typename R, typename... Params, typename Method>
auto makeEntry(std::string name, Method method) -> HandlerEntry {
    HandlerEntry entry;
    entry.name       = std::move(name);
    entry.parameters = SignatureOf<Params...>();
    entry.returnType = std::type_index(typeid(std::remove_cvref_t<R>));
    entry.invoke     = [method](Receiver& receiver, ArgumentList& args) -> std::any {
        if (args.size() != sizeof...(Params))
            throw std::invalid_argument("handler argument count mismatch");
        auto& host = static_cast<Host&>(receiver);
        return MethodInvoker<R, Params...>::call(host, method, args, std::index_sequence_for<Params...>{});
    };
    return entry;
}

} // namespace detail

template <typename Host>
class HandlerTable::Builder {
public:
    template <typename R, typename... Params>
    auto handler(std::string name, R (Host::*method)(Params...)) -> Builder& {
        this->record(detail::makeEntry<Host, R, Params...>(std::move(name), method));
        return *this;
    }

    template <typename R, typename... Params>
    auto handler(std::string name, R (Host::*method)(Params...) const) -> Builder& {
        this->record(detail::makeEntry<Host, R, Params...>(std::move(name), method));
        return *this;
    }

    [[nodiscard]] auto build() -> HandlerTable {
        return std::move(this->table);
    }

private:
    auto record(HandlerEntry entry) -> void {
        auto name = entry.name;
        if (!this->table.add(std::move(entry))) {
            sf_log("Duplicate handler registration ignored: " + name, "Dispatch", "ERROR");
        }
    }

    HandlerTable table;
};

/**
 * HandlerHost: CRTP base that wires a receiver type to its handler table.
 *
 * Derived must provide
 *     static void exposeHandlers(HandlerTable::Builder<Derived>&);
 * which is run exactly once, the first time any instance is asked for its
 * table. Base must itself derive (non-virtually) from Receiver.
 */
template <typename Derived, typename Base = Receiver>
class HandlerHost : public Base {
    static_assert(std::is_base_of_v<Receiver, Base>, "HandlerHost base must derive from Receiver");

public:
    using Base::Base;

    [[nodiscard]] auto handlerTable() const -> HandlerTable const& override {
        return HandlerHost::table();
    }

    [[nodiscard]] static auto table() -> HandlerTable const& {
        static HandlerTable const instance = [] {
            HandlerTable::Builder<Derived> builder;
            Derived::exposeHandlers(builder);
            return builder.build();
        }();
        return instance;
    }
};

} // namespace SF::Dispatch
