#pragma once

#include <chrono>
#include <cstdint>

namespace SF::Events {

enum class MotionAction : std::uint8_t {
    Down = 0,
    Move,
    Up,
    Cancel,
    Hover
};

enum class PointerType : std::uint8_t {
    Mouse = 0,
    Stylus,
    Touch
};

struct MotionEvent {
    MotionAction action = MotionAction::Move;
    PointerType type = PointerType::Touch;
    std::uint64_t pointer_id = 0;
    float x = 0.0f; // view-local coordinates
    float y = 0.0f;
    float pressure = 0.0f; // 0..1
    std::chrono::nanoseconds timestamp{};
};

} // namespace SF::Events
