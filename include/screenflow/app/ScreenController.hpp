#pragma once

#include <screenflow/app/DialogHost.hpp>
#include <screenflow/app/IdRegistry.hpp>
#include <screenflow/app/LifecycleInjection.hpp>
#include <screenflow/app/Navigator.hpp>
#include <screenflow/app/RuntimeOptions.hpp>

#include "core/Error.hpp"
#include "dispatch/CommandDispatcher.hpp"
#include "dispatch/HandlerTable.hpp"
#include "dispatch/MotionEventDispatcher.hpp"
#include "events/MenuItem.hpp"
#include "events/MotionEvent.hpp"
#include "loop/EventLoop.hpp"
#include "modal/ModalTask.hpp"
#include "navigation/Correlator.hpp"

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SF::App {

inline constexpr std::string_view kScreenArgumentsKey = "screenflow.arguments";
inline constexpr std::string_view kScreenResultKey    = "screenflow.result";
inline constexpr std::string_view kInstanceDataKey    = "screenflow.instanceData";
inline constexpr std::string_view kStartedActivityKey = "startedActivity";

/**
 * ScreenController: the orchestration a screen object composes in.
 *
 * Everything here runs on the loop's dispatch thread. The blocking calls
 * (dialogs, presentScreen, presentActivity) return only once the user has
 * answered, while the loop keeps servicing other events in the meantime.
 */
class ScreenController {
public:
    ScreenController(SF::Dispatch::Receiver& screen,
                     SF::EventLoop& loop,
                     DialogHost& dialogs,
                     Navigator& navigator,
                     RuntimeOptions options = {},
                     SF::Navigation::Correlator& correlator = SF::Navigation::Correlator::Instance());

    ScreenController(ScreenController const&)                    = delete;
    auto operator=(ScreenController const&) -> ScreenController& = delete;

    [[nodiscard]] auto options() const -> RuntimeOptions const&;
    [[nodiscard]] auto idRegistry() -> IdRegistry&;

    // Transient per-instance data that survives state save/restore.
    [[nodiscard]] auto instanceData() -> nlohmann::json&;
    auto saveInstanceState(nlohmann::json& bundle) const -> void;
    auto restoreInstanceState(nlohmann::json const* bundle) -> void;

    auto addLifecycleInjection(std::shared_ptr<LifecycleInjection> const& injection) -> void;
    auto removeLifecycleInjection(std::shared_ptr<LifecycleInjection> const& injection) -> void;
    auto runPauseInjections() -> void;
    auto runResumeInjections() -> void;
    [[nodiscard]] auto lifecycleInjectionCount() const -> std::size_t;

    // true for the positive button; false for the negative button or cancel.
    [[nodiscard]] auto showConfirmationDialog(std::string title, std::string message) -> SF::Expected<bool>;
    auto showAlertDialog(std::string title, std::string message) -> SF::Expected<void>;
    // Index of the chosen item, or nullopt when the list was cancelled.
    [[nodiscard]] auto selectItemFromList(std::string title, std::vector<std::string> items)
        -> SF::Expected<std::optional<std::size_t>>;

    [[nodiscard]] auto presentScreen(std::string target, SF::Dispatch::ArgumentList args)
        -> SF::Expected<std::optional<std::any>>;
    auto presentActivity(SF::Navigation::NavigationRequest request) -> SF::Expected<void>;
    auto finish(std::any result) -> void;
    [[nodiscard]] auto screenArguments(SF::Navigation::NavigationRequest const& request) const
        -> SF::Navigation::Correlator::Arguments;

    // One started activity is tracked at a time; the request code defaults
    // to RuntimeOptions::activity_starter_request_code.
    auto startActivityForResult(std::shared_ptr<SF::Navigation::ActivityStarter> starter,
                                SF::Navigation::NavigationRequest const& request,
                                std::optional<std::int32_t> request_code = std::nullopt) -> SF::Expected<void>;
    auto handleActivityResult(SF::Navigation::ActivityResult const& result) -> void;

    auto invokeInitialize(SF::Dispatch::ArgumentList args) -> bool;
    auto onOptionsItemSelected(SF::Events::MenuItem const& item) -> bool;
    auto dispatchMotion(std::string const& event_name, SF::Events::MotionEvent const& event) -> bool;

private:
    auto presentForResult(SF::Navigation::NavigationRequest const& request)
        -> SF::Expected<SF::Modal::ModalResult<std::any>>;

    SF::Dispatch::Receiver&      screen;
    SF::EventLoop&               loop;
    DialogHost&                  dialogs;
    Navigator&                   navigator;
    RuntimeOptions               runtimeOptions;
    SF::Navigation::Correlator&  correlator;

    IdRegistry                                              ids;
    nlohmann::json                                          instanceState = nlohmann::json::object();
    std::vector<std::weak_ptr<LifecycleInjection>>          injections;
    std::optional<SF::Modal::ModalCompletion<std::any>>     pendingPresentation;
    SF::Navigation::Correlator::Arguments                   presentedArguments;

    // Node maps: a handler may select another command while its dispatcher is still running.
    phmap::node_hash_map<std::string, SF::Dispatch::CommandDispatcher>     commandDispatchers;
    phmap::node_hash_map<std::string, SF::Dispatch::MotionEventDispatcher> motionDispatchers;
};

} // namespace SF::App
