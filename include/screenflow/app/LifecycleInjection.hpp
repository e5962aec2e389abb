#pragma once

namespace SF::App {

// Behaviour attached to a screen that follows its pause/resume cycle.
class LifecycleInjection {
public:
    virtual ~LifecycleInjection() = default;

    virtual auto pause() -> void = 0;
    virtual auto resume() -> void = 0;
};

} // namespace SF::App
