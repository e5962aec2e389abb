#pragma once
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace SF {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        NotSupported,
        TypeMismatch,
        InvalidArguments,
        MalformedInput,
        TransformFailed,
        WrongThread,
        LoopStopped,
        NavigationFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

/**
 * Raised in place of a handler failure whose type does not derive from
 * std::exception. The original failure is attached as the nested exception.
 */
class HandlerFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::InvalidArguments:
        return "invalid_arguments";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::TransformFailed:
        return "transform_failed";
    case Error::Code::WrongThread:
        return "wrong_thread";
    case Error::Code::LoopStopped:
        return "loop_stopped";
    case Error::Code::NavigationFailed:
        return "navigation_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace SF
