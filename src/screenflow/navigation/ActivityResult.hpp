#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace SF::Navigation {

enum class ResultCode : std::int32_t {
    Canceled = 0,
    Ok       = -1,
    FirstUser = 1
};

// Request to bring up another screen or external activity. The payload
// format of extras belongs to whoever interprets the request.
struct NavigationRequest {
    std::string    target;
    nlohmann::json extras = nlohmann::json::object();
};

struct ActivityResult {
    std::int32_t                  requestCode = 0;
    ResultCode                    resultCode  = ResultCode::Canceled;
    std::optional<nlohmann::json> data;
};

// Handler waiting for an external activity to report back.
class ActivityStarter {
public:
    virtual ~ActivityStarter() = default;

    virtual auto handleActivityResult(ActivityResult const& result) -> void = 0;
};

} // namespace SF::Navigation
