#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <exception>
#include <vector>

using namespace SF;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NavigationFailed);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::WrongThread, "pumpUntil"};
        CHECK(describeError(withMsg) == "wrong_thread:pumpUntil");

        Error withoutMsg{Error::Code::TransformFailed, {}};
        CHECK(describeError(withoutMsg) == "transform_failed");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either value or error") {
        Expected<int> ok = 7;
        REQUIRE(ok.has_value());
        CHECK(*ok == 7);

        Expected<int> failed = std::unexpected(Error{Error::Code::NotFound, "missing"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::NotFound);
        REQUIRE(failed.error().message.has_value());
        CHECK(*failed.error().message == "missing");
    }

    TEST_CASE("HandlerFailure nests the original failure") {
        struct Custom {
            int code;
        };
        bool sawNested = false;
        try {
            try {
                throw Custom{42};
            } catch (...) {
                std::throw_with_nested(HandlerFailure("wrapped"));
            }
        } catch (HandlerFailure const& failure) {
            CHECK(std::string{failure.what()} == "wrapped");
            try {
                std::rethrow_if_nested(failure);
            } catch (Custom const& inner) {
                sawNested = inner.code == 42;
            }
        }
        CHECK(sawNested);
    }
}
