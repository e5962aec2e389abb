#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace SF::App {

struct RuntimeOptions {
    std::string confirm_positive_label = "Yes";
    std::string confirm_negative_label = "No";
    std::string alert_button_label = "OK";
    std::int32_t activity_starter_request_code = 0x50F1A001;
    std::int32_t present_screen_request_code = 0x50F1A002;
    bool logging_enabled = false;
    std::vector<std::string> log_tags{};
};

[[nodiscard]] auto LoadRuntimeOptions(std::string_view json_text) -> SF::Expected<RuntimeOptions>;

[[nodiscard]] auto LoadRuntimeOptionsFile(std::filesystem::path const& path) -> SF::Expected<RuntimeOptions>;

[[nodiscard]] auto RuntimeOptionsToJson(RuntimeOptions const& options) -> nlohmann::json;

// No-op unless the library is built with SF_LOG_DEBUG.
auto ApplyLoggingOptions(RuntimeOptions const& options) -> void;

} // namespace SF::App
