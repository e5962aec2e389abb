#include <screenflow/app/RuntimeOptions.hpp>

#include <doctest/doctest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace SF;
using namespace SF::App;

TEST_SUITE("app.runtime_options") {
    TEST_CASE("Defaults") {
        RuntimeOptions options;
        CHECK(options.confirm_positive_label == "Yes");
        CHECK(options.confirm_negative_label == "No");
        CHECK(options.alert_button_label == "OK");
        CHECK(options.activity_starter_request_code == 0x50F1A001);
        CHECK(options.present_screen_request_code == 0x50F1A002);
        CHECK_FALSE(options.logging_enabled);
        CHECK(options.log_tags.empty());
    }

    TEST_CASE("Missing keys keep defaults and unknown keys are ignored") {
        auto options = LoadRuntimeOptions(R"({"confirm_positive_label": "Sure", "theme": "dark"})");
        REQUIRE(options.has_value());
        CHECK(options->confirm_positive_label == "Sure");
        CHECK(options->confirm_negative_label == "No");
        CHECK(options->present_screen_request_code == 0x50F1A002);
    }

    TEST_CASE("All keys are read") {
        auto options = LoadRuntimeOptions(R"({
            "confirm_positive_label": "Ja",
            "confirm_negative_label": "Nein",
            "alert_button_label": "Gut",
            "activity_starter_request_code": 10,
            "present_screen_request_code": 11,
            "logging_enabled": true,
            "log_tags": ["Screen", "ModalTask"]
        })");
        REQUIRE(options.has_value());
        CHECK(options->alert_button_label == "Gut");
        CHECK(options->activity_starter_request_code == 10);
        CHECK(options->present_screen_request_code == 11);
        CHECK(options->logging_enabled);
        CHECK(options->log_tags == std::vector<std::string>{"Screen", "ModalTask"});
    }

    TEST_CASE("Malformed input is rejected") {
        auto notJson = LoadRuntimeOptions("{not json");
        REQUIRE_FALSE(notJson.has_value());
        CHECK(notJson.error().code == Error::Code::MalformedInput);

        auto notObject = LoadRuntimeOptions("[1, 2]");
        REQUIRE_FALSE(notObject.has_value());
        CHECK(notObject.error().code == Error::Code::MalformedInput);

        auto wrongType = LoadRuntimeOptions(R"({"alert_button_label": 5})");
        REQUIRE_FALSE(wrongType.has_value());
        CHECK(wrongType.error().code == Error::Code::MalformedInput);

        auto wrongCode = LoadRuntimeOptions(R"({"present_screen_request_code": "high"})");
        REQUIRE_FALSE(wrongCode.has_value());
        CHECK(wrongCode.error().code == Error::Code::MalformedInput);

        auto clashing = LoadRuntimeOptions(R"({"activity_starter_request_code": 4, "present_screen_request_code": 4})");
        REQUIRE_FALSE(clashing.has_value());
        CHECK(clashing.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("Request codes must fit in 32 bits") {
        auto tooLarge = LoadRuntimeOptions(R"({"present_screen_request_code": 4294967297})");
        REQUIRE_FALSE(tooLarge.has_value());
        CHECK(tooLarge.error().code == Error::Code::MalformedInput);

        auto tooSmall = LoadRuntimeOptions(R"({"activity_starter_request_code": -2147483649})");
        REQUIRE_FALSE(tooSmall.has_value());
        CHECK(tooSmall.error().code == Error::Code::MalformedInput);

        auto edge = LoadRuntimeOptions(R"({"present_screen_request_code": 2147483647, "activity_starter_request_code": -2147483648})");
        REQUIRE(edge.has_value());
        CHECK(edge->present_screen_request_code == 2147483647);
        CHECK(edge->activity_starter_request_code == -2147483647 - 1);
    }

    TEST_CASE("Options survive a trip through JSON") {
        RuntimeOptions options;
        options.alert_button_label = "Got it";
        options.log_tags           = {"Correlator"};
        auto reloaded              = LoadRuntimeOptions(RuntimeOptionsToJson(options).dump());
        REQUIRE(reloaded.has_value());
        CHECK(reloaded->alert_button_label == "Got it");
        CHECK(reloaded->log_tags == options.log_tags);
    }

    TEST_CASE("Files are loaded from disk") {
        auto path = std::filesystem::temp_directory_path() / "screenflow_runtime_options_test.json";
        {
            std::ofstream out(path);
            out << R"({"confirm_negative_label": "Never"})";
        }
        auto options = LoadRuntimeOptionsFile(path);
        std::filesystem::remove(path);
        REQUIRE(options.has_value());
        CHECK(options->confirm_negative_label == "Never");

        auto missing = LoadRuntimeOptionsFile(path);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }

    TEST_CASE("Applying logging options is safe in any build") {
        RuntimeOptions options;
        options.logging_enabled = false;
        ApplyLoggingOptions(options);
        CHECK_FALSE(options.logging_enabled);
    }
}
