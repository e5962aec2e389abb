#include <screenflow/ScreenFlow.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace {

// Console stand-in for a toolkit: prints the dialog and answers it on the
// next turn of the loop.
class ConsoleDialogHost : public SF::App::DialogHost {
public:
    ConsoleDialogHost(SF::EventLoop& loop, bool accept) : loop(loop), accept(accept) {}

    auto show(SF::App::DialogRequest const& request, SF::App::DialogCallbacks callbacks) -> SF::Expected<void> override {
        std::cout << "[dialog] " << request.title << ": " << request.message;
        if (request.positive_label)
            std::cout << " [" << *request.positive_label << "]";
        if (request.negative_label)
            std::cout << " [" << *request.negative_label << "]";
        std::cout << '\n';
        this->loop.post([callbacks = std::move(callbacks), accept = this->accept] {
            if (accept)
                callbacks.on_positive();
            else
                callbacks.on_negative();
        });
        return {};
    }

private:
    SF::EventLoop& loop;
    bool           accept;
};

class ConsoleNavigator : public SF::App::Navigator {
public:
    auto startForResult(SF::Navigation::NavigationRequest const& request, std::int32_t) -> SF::Expected<void> override {
        return std::unexpected(SF::Error{SF::Error::Code::NotSupported, "no screen named " + request.target});
    }
    auto finish(SF::Navigation::ResultCode, nlohmann::json) -> void override {}
};

struct EditorScreen : SF::Dispatch::HandlerHost<EditorScreen> {
    EditorScreen(SF::EventLoop& loop, SF::App::DialogHost& dialogs, SF::App::Navigator& navigator)
        : controller(*this, loop, dialogs, navigator) {}

    void deleteClicked() {
        auto confirmed = this->controller.showConfirmationDialog("Delete", "Delete the current note?");
        if (!confirmed) {
            std::cerr << "dialog failed: " << SF::describeError(confirmed.error()) << '\n';
            return;
        }
        std::cout << (*confirmed ? "note deleted" : "note kept") << '\n';
    }

    void onMove(float x, float y) {
        std::cout << "pointer at " << x << ", " << y << '\n';
    }

    static void exposeHandlers(SF::Dispatch::HandlerTable::Builder<EditorScreen>& builder) {
        builder.handler("deleteClicked", &EditorScreen::deleteClicked).handler("onMove", &EditorScreen::onMove);
    }

    SF::App::ScreenController controller;
};

} // namespace

int main(int argc, char** argv) {
    bool accept = true;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--decline") {
            accept = false;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--decline]\n";
            return 1;
        }
    }

    SF::EventLoop     loop;
    ConsoleDialogHost dialogs(loop, accept);
    ConsoleNavigator  navigator;
    EditorScreen      screen(loop, dialogs, navigator);

    constexpr std::int32_t kDeleteId = 0x7f0a0001;
    screen.controller.idRegistry().add(kDeleteId, "delete");

    loop.post([&] {
        screen.controller.onOptionsItemSelected(SF::Events::MenuItem{kDeleteId, "Delete"});
        SF::Events::MotionEvent event;
        event.x = 12.0f;
        event.y = 34.5f;
        screen.controller.dispatchMotion("onMove", event);
        loop.quit();
    });

    auto ran = loop.run();
    if (!ran) {
        std::cerr << "event loop failed: " << SF::describeError(ran.error()) << '\n';
        return 1;
    }
    return 0;
}
