#include <screenflow/app/RuntimeOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string>

namespace SF::App {

namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

template <typename T>
auto read_field(json const& root, char const* key, T& out) -> SF::Expected<void> {
    auto it = root.find(key);
    if (it == root.end() || it->is_null())
        return {};
    try {
        out = it->template get<T>();
    } catch (json::exception const& e) {
        return std::unexpected(malformed(std::string(key) + ": " + e.what()));
    }
    return {};
}

auto read_request_code(json const& root, char const* key, std::int32_t& out) -> SF::Expected<void> {
    auto it = root.find(key);
    if (it == root.end() || it->is_null())
        return {};
    if (!it->is_number_integer())
        return std::unexpected(malformed(std::string(key) + " must be an integer"));
    auto const outOfRange = it->is_number_unsigned()
                                ? it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())
                                : it->get<std::int64_t>() < std::numeric_limits<std::int32_t>::min()
                                      || it->get<std::int64_t>() > std::numeric_limits<std::int32_t>::max();
    if (outOfRange)
        return std::unexpected(malformed(std::string(key) + " is outside the 32-bit range"));
    out = it->get<std::int32_t>();
    return {};
}

} // namespace

auto LoadRuntimeOptions(std::string_view json_text) -> SF::Expected<RuntimeOptions> {
    auto root = json::parse(json_text, nullptr, false);
    if (root.is_discarded())
        return std::unexpected(malformed("runtime options are not valid JSON"));
    if (!root.is_object())
        return std::unexpected(malformed("runtime options must be a JSON object"));

    RuntimeOptions options{};
    if (auto status = read_field(root, "confirm_positive_label", options.confirm_positive_label); !status)
        return std::unexpected(status.error());
    if (auto status = read_field(root, "confirm_negative_label", options.confirm_negative_label); !status)
        return std::unexpected(status.error());
    if (auto status = read_field(root, "alert_button_label", options.alert_button_label); !status)
        return std::unexpected(status.error());
    if (auto status = read_request_code(root, "activity_starter_request_code", options.activity_starter_request_code); !status)
        return std::unexpected(status.error());
    if (auto status = read_request_code(root, "present_screen_request_code", options.present_screen_request_code); !status)
        return std::unexpected(status.error());
    if (auto status = read_field(root, "logging_enabled", options.logging_enabled); !status)
        return std::unexpected(status.error());
    if (auto status = read_field(root, "log_tags", options.log_tags); !status)
        return std::unexpected(status.error());

    if (options.activity_starter_request_code == options.present_screen_request_code)
        return std::unexpected(malformed("request codes for activity starters and presented screens must differ"));

    sf_log("Loaded runtime options", "Config");
    return options;
}

auto LoadRuntimeOptionsFile(std::filesystem::path const& path) -> SF::Expected<RuntimeOptions> {
    std::ifstream input(path);
    if (!input)
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + path.string()});
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadRuntimeOptions(buffer.str());
}

auto RuntimeOptionsToJson(RuntimeOptions const& options) -> nlohmann::json {
    return json{{"confirm_positive_label", options.confirm_positive_label},
                {"confirm_negative_label", options.confirm_negative_label},
                {"alert_button_label", options.alert_button_label},
                {"activity_starter_request_code", options.activity_starter_request_code},
                {"present_screen_request_code", options.present_screen_request_code},
                {"logging_enabled", options.logging_enabled},
                {"log_tags", options.log_tags}};
}

auto ApplyLoggingOptions(RuntimeOptions const& options) -> void {
#ifdef SF_LOG_DEBUG
    SF::set_logging_enabled(options.logging_enabled);
    if (!options.log_tags.empty())
        SF::logger().setEnabledTags(std::set<std::string>(options.log_tags.begin(), options.log_tags.end()));
#else
    (void)options;
#endif
}

} // namespace SF::App
