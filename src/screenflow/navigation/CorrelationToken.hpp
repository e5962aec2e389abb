#pragma once

#include <atomic>
#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>

namespace SF::Navigation {

/**
 * Opaque key for data handed across a navigation boundary. Zero means "no
 * token" so an absent payload field reads back as an invalid token.
 */
struct CorrelationToken {
    std::uint64_t value = 0;

    [[nodiscard]] constexpr auto valid() const -> bool {
        return this->value != 0;
    }

    friend constexpr auto operator<=>(CorrelationToken const&, CorrelationToken const&) = default;
};

/**
 * Time-ordered token source: the wall-clock millisecond at registration,
 * bumped past the previous token whenever two registrations share a tick.
 */
class TokenGenerator {
public:
    using Clock = std::chrono::system_clock;

    auto next() -> CorrelationToken {
        auto const now = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count());
        auto previous = this->last.load(std::memory_order_relaxed);
        std::uint64_t candidate = 0;
        do {
            candidate = now > previous ? now : previous + 1;
        } while (!this->last.compare_exchange_weak(previous, candidate, std::memory_order_acq_rel, std::memory_order_relaxed));
        return CorrelationToken{candidate};
    }

private:
    std::atomic<std::uint64_t> last{0};
};

} // namespace SF::Navigation

template <>
struct std::hash<SF::Navigation::CorrelationToken> {
    auto operator()(SF::Navigation::CorrelationToken const& token) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(token.value);
    }
};
