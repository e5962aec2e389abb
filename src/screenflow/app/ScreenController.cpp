#include <screenflow/app/ScreenController.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace SF::App {

using SF::Modal::ModalCompletion;
using SF::Modal::ModalResult;
using SF::Modal::PresentModal;
using SF::Navigation::CorrelationToken;
using SF::Navigation::NavigationRequest;

namespace {

auto tokenFrom(nlohmann::json const& data, std::string_view key) -> CorrelationToken {
    if (!data.is_object())
        return {};
    auto it = data.find(std::string{key});
    if (it == data.end() || !it->is_number_unsigned())
        return {};
    return CorrelationToken{it->get<std::uint64_t>()};
}

} // namespace

ScreenController::ScreenController(SF::Dispatch::Receiver& screen,
                                   SF::EventLoop& loop,
                                   DialogHost& dialogs,
                                   Navigator& navigator,
                                   RuntimeOptions options,
                                   SF::Navigation::Correlator& correlator)
    : screen(screen),
      loop(loop),
      dialogs(dialogs),
      navigator(navigator),
      runtimeOptions(std::move(options)),
      correlator(correlator) {}

auto ScreenController::options() const -> RuntimeOptions const& {
    return this->runtimeOptions;
}

auto ScreenController::idRegistry() -> IdRegistry& {
    return this->ids;
}

auto ScreenController::instanceData() -> nlohmann::json& {
    return this->instanceState;
}

auto ScreenController::saveInstanceState(nlohmann::json& bundle) const -> void {
    if (!bundle.is_object())
        bundle = nlohmann::json::object();
    bundle[std::string{kInstanceDataKey}] = this->instanceState;
}

auto ScreenController::restoreInstanceState(nlohmann::json const* bundle) -> void {
    if (bundle == nullptr || !bundle->is_object())
        return;
    auto it = bundle->find(std::string{kInstanceDataKey});
    if (it != bundle->end() && it->is_object())
        this->instanceState = *it;
}

auto ScreenController::addLifecycleInjection(std::shared_ptr<LifecycleInjection> const& injection) -> void {
    if (!injection)
        return;
    std::erase_if(this->injections, [](auto const& weak) { return weak.expired(); });
    auto const present = std::any_of(this->injections.begin(), this->injections.end(), [&](auto const& weak) {
        return weak.lock() == injection;
    });
    if (!present)
        this->injections.emplace_back(injection);
}

auto ScreenController::removeLifecycleInjection(std::shared_ptr<LifecycleInjection> const& injection) -> void {
    std::erase_if(this->injections, [&](auto const& weak) {
        auto locked = weak.lock();
        return !locked || locked == injection;
    });
}

auto ScreenController::runPauseInjections() -> void {
    std::erase_if(this->injections, [](auto const& weak) { return weak.expired(); });
    auto snapshot = this->injections;
    for (auto const& weak : snapshot) {
        if (auto injection = weak.lock())
            injection->pause();
    }
}

auto ScreenController::runResumeInjections() -> void {
    std::erase_if(this->injections, [](auto const& weak) { return weak.expired(); });
    auto snapshot = this->injections;
    for (auto const& weak : snapshot) {
        if (auto injection = weak.lock())
            injection->resume();
    }
}

auto ScreenController::lifecycleInjectionCount() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(this->injections.begin(), this->injections.end(), [](auto const& weak) {
        return !weak.expired();
    }));
}

auto ScreenController::showConfirmationDialog(std::string title, std::string message) -> SF::Expected<bool> {
    DialogRequest request{std::move(title), std::move(message)};
    request.positive_label = this->runtimeOptions.confirm_positive_label;
    request.negative_label = this->runtimeOptions.confirm_negative_label;

    std::optional<Error> failure;
    auto outcome = PresentModal<bool>(this->loop, [&](ModalCompletion<bool> const& completion) {
        DialogCallbacks callbacks;
        callbacks.on_positive = [completion] { completion.complete(true); };
        callbacks.on_negative = [completion] { completion.complete(false); };
        callbacks.on_cancel   = [completion] { completion.complete(false); };
        callbacks.on_item     = [completion](std::size_t) { completion.complete(false); };
        auto shown = this->dialogs.show(request, std::move(callbacks));
        if (!shown) {
            failure = shown.error();
            completion.dismiss();
        }
    });
    if (!outcome)
        return std::unexpected(outcome.error());
    if (failure)
        return std::unexpected(*failure);
    return outcome->value_or(false);
}

auto ScreenController::showAlertDialog(std::string title, std::string message) -> SF::Expected<void> {
    DialogRequest request{std::move(title), std::move(message)};
    request.positive_label = this->runtimeOptions.alert_button_label;

    std::optional<Error> failure;
    auto outcome = PresentModal<SF::Modal::NoValue>(this->loop, [&](ModalCompletion<SF::Modal::NoValue> const& completion) {
        DialogCallbacks callbacks;
        callbacks.on_positive = [completion] { completion.complete({}); };
        callbacks.on_negative = [completion] { completion.dismiss(); };
        callbacks.on_cancel   = [completion] { completion.dismiss(); };
        callbacks.on_item     = [completion](std::size_t) { completion.dismiss(); };
        auto shown = this->dialogs.show(request, std::move(callbacks));
        if (!shown) {
            failure = shown.error();
            completion.dismiss();
        }
    });
    if (!outcome)
        return std::unexpected(outcome.error());
    if (failure)
        return std::unexpected(*failure);
    return {};
}

auto ScreenController::selectItemFromList(std::string title, std::vector<std::string> items)
    -> SF::Expected<std::optional<std::size_t>> {
    DialogRequest request{std::move(title), std::string{}};
    request.items = std::move(items);
    auto const itemCount = request.items.size();

    std::optional<Error> failure;
    auto outcome = PresentModal<std::size_t>(this->loop, [&](ModalCompletion<std::size_t> const& completion) {
        DialogCallbacks callbacks;
        callbacks.on_item = [completion, itemCount](std::size_t index) {
            if (index < itemCount)
                completion.complete(index);
            else
                completion.dismiss();
        };
        callbacks.on_positive = [completion] { completion.dismiss(); };
        callbacks.on_negative = [completion] { completion.dismiss(); };
        callbacks.on_cancel   = [completion] { completion.dismiss(); };
        auto shown = this->dialogs.show(request, std::move(callbacks));
        if (!shown) {
            failure = shown.error();
            completion.dismiss();
        }
    });
    if (!outcome)
        return std::unexpected(outcome.error());
    if (failure)
        return std::unexpected(*failure);
    return outcome->value;
}

auto ScreenController::presentForResult(NavigationRequest const& request) -> SF::Expected<ModalResult<std::any>> {
    auto previous = std::exchange(this->pendingPresentation, std::nullopt);

    std::optional<Error> failure;
    SF::Expected<ModalResult<std::any>> outcome = std::unexpected(Error{Error::Code::UnknownError, "presentation never ran"});
    try {
        outcome = PresentModal<std::any>(this->loop, [&](ModalCompletion<std::any> const& completion) {
            this->pendingPresentation = completion;
            auto started = this->navigator.startForResult(request, this->runtimeOptions.present_screen_request_code);
            if (!started) {
                failure = started.error();
                completion.dismiss();
            }
        });
    } catch (...) {
        this->pendingPresentation = std::move(previous);
        throw;
    }
    this->pendingPresentation = std::move(previous);

    if (!outcome)
        return std::unexpected(outcome.error());
    if (failure) {
        sf_log("Could not start " + request.target + ": " + describeError(*failure), "Screen", "ERROR");
        return std::unexpected(*failure);
    }
    return outcome;
}

auto ScreenController::presentScreen(std::string target, SF::Dispatch::ArgumentList args)
    -> SF::Expected<std::optional<std::any>> {
    auto arguments = std::make_shared<SF::Dispatch::ArgumentList const>(std::move(args));
    auto token     = this->correlator.registerArguments(arguments);

    NavigationRequest request{std::move(target)};
    request.extras[std::string{kScreenArgumentsKey}] = token.value;

    // The presenter keeps the arguments alive until the presented screen exits.
    auto previousArguments = std::exchange(this->presentedArguments, arguments);
    SF::Expected<ModalResult<std::any>> outcome = std::unexpected(Error{Error::Code::UnknownError, "presentation never ran"});
    try {
        outcome = this->presentForResult(request);
    } catch (...) {
        this->presentedArguments = std::move(previousArguments);
        this->correlator.releaseArguments(token);
        throw;
    }
    this->presentedArguments = std::move(previousArguments);
    this->correlator.releaseArguments(token);

    if (!outcome)
        return std::unexpected(outcome.error());
    if (!outcome->completed())
        return std::optional<std::any>{};
    return std::move(outcome->value);
}

auto ScreenController::presentActivity(NavigationRequest request) -> SF::Expected<void> {
    auto outcome = this->presentForResult(request);
    if (!outcome)
        return std::unexpected(outcome.error());
    return {};
}

auto ScreenController::finish(std::any result) -> void {
    auto token = this->correlator.registerResult(std::move(result));
    nlohmann::json data{{std::string{kScreenResultKey}, token.value}};
    this->navigator.finish(SF::Navigation::ResultCode::Ok, std::move(data));
}

auto ScreenController::screenArguments(NavigationRequest const& request) const -> SF::Navigation::Correlator::Arguments {
    auto token = tokenFrom(request.extras, kScreenArgumentsKey);
    if (!token.valid())
        return nullptr;
    return this->correlator.takeArguments(token);
}

auto ScreenController::startActivityForResult(std::shared_ptr<SF::Navigation::ActivityStarter> starter,
                                              NavigationRequest const& request,
                                              std::optional<std::int32_t> request_code) -> SF::Expected<void> {
    if (!starter)
        return std::unexpected(Error{Error::Code::InvalidArguments, "activity starter is null"});
    auto const code = request_code.value_or(this->runtimeOptions.activity_starter_request_code);
    if (code == this->runtimeOptions.present_screen_request_code)
        return std::unexpected(Error{Error::Code::InvalidArguments, "request code is reserved for screen presentation"});

    auto token = this->correlator.registerPendingHandler(std::move(starter));
    this->instanceState[std::string{kStartedActivityKey}] = token.value;

    auto started = this->navigator.startForResult(request, code);
    if (!started) {
        this->correlator.releasePendingHandler(token);
        this->instanceState.erase(std::string{kStartedActivityKey});
        sf_log("Could not start " + request.target + ": " + describeError(started.error()), "Screen", "ERROR");
        return std::unexpected(started.error());
    }
    return {};
}

auto ScreenController::handleActivityResult(SF::Navigation::ActivityResult const& result) -> void {
    if (result.requestCode == this->runtimeOptions.present_screen_request_code) {
        if (!this->pendingPresentation) {
            sf_log("Presentation result with no presentation pending", "Screen", "ERROR");
            return;
        }
        auto completion = *this->pendingPresentation;
        std::optional<std::any> value;
        if (result.resultCode == SF::Navigation::ResultCode::Ok && result.data) {
            auto token = tokenFrom(*result.data, kScreenResultKey);
            if (token.valid())
                value = this->correlator.takeResult(token);
        }
        if (value)
            completion.complete(std::move(*value));
        else
            completion.dismiss();
        return;
    }

    auto token = tokenFrom(this->instanceState, kStartedActivityKey);
    if (!token.valid()) {
        sf_log("Activity result " + std::to_string(result.requestCode) + " with no started activity", "Screen");
        return;
    }
    this->instanceState.erase(std::string{kStartedActivityKey});
    if (!this->correlator.takeAndDispatch(token, result))
        sf_log("Started activity handler already gone", "Screen", "ERROR");
}

auto ScreenController::invokeInitialize(SF::Dispatch::ArgumentList args) -> bool {
    auto const* entry = this->screen.handlerTable().find("initialize", SF::Dispatch::signatureOf(args));
    if (entry == nullptr) {
        sf_log("No initialize" + SF::Dispatch::describeSignature(SF::Dispatch::signatureOf(args)), "Screen");
        return false;
    }
    entry->invoke(this->screen, args);
    return true;
}

auto ScreenController::onOptionsItemSelected(SF::Events::MenuItem const& item) -> bool {
    auto name = this->ids.nameFor(item.item_id);
    if (!name) {
        sf_log("Unregistered command id " + std::to_string(item.item_id), "Screen");
        return false;
    }
    auto it = this->commandDispatchers.try_emplace(*name, *name).first;
    return it->second.dispatch(this->screen, item);
}

auto ScreenController::dispatchMotion(std::string const& event_name, SF::Events::MotionEvent const& event) -> bool {
    auto it = this->motionDispatchers.try_emplace(event_name, event_name).first;
    return it->second.callMethodOn(this->screen, event);
}

} // namespace SF::App
