#pragma once

#include "core/Error.hpp"
#include "navigation/ActivityResult.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace SF::App {

/**
 * The host's navigation surface. startForResult() begins bringing up the
 * requested screen or activity and returns immediately; when it exits, the
 * host reports back through ScreenController::handleActivityResult() on the
 * dispatch thread with the same request code.
 */
class Navigator {
public:
    virtual ~Navigator() = default;

    virtual auto startForResult(SF::Navigation::NavigationRequest const& request,
                                std::int32_t request_code) -> SF::Expected<void> = 0;

    virtual auto finish(SF::Navigation::ResultCode result_code, nlohmann::json data) -> void = 0;
};

} // namespace SF::App
