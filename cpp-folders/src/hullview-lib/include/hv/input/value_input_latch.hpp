#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: value_input_latch.hpp
    МОДУЛЬ: input
    ЗОРИЛГО: Кадр тутмын input-ийн value-oriented reducer: дарж буй хөдөлгөөний товч,
            хуримтлагдсан mouse delta, нэг удаагийн key command.
*/


#include <cstdint>
#include <span>
#include <vector>

namespace hv
{
    // Нэг удаа дарахад нэг удаа гарах (edge-triggered) командууд. Key repeat орохгүй.
    enum class KeyCommand : uint8_t
    {
        ToggleLighting = 0,
        ToggleShadow,
        ToggleGround,
        ToggleWireframe,
        TogglePoints,
        TogglePause,
        ToggleLightOrbit,
        ToggleLightBob,
        ToggleLightPath,
        CycleMotionMode,
        CycleColoringMode,
        SelectColorScheme,
        ApplyPreset,
        SpeedUp,
        SpeedDown,
        SpeedUpFine,
        SpeedDownFine,
        NudgeLight,
        ShininessUp,
        ShininessDown,
        ResetAnimations,
        ResetAll,
        LogSegmentation
    };

    struct KeyPress
    {
        KeyCommand command = KeyCommand::ToggleLighting;
        uint8_t value = 0;
    };

    // Дарж байх хугацаандаа идэвхтэй оролтууд (камерын хөдөлгөөн, харах товч).
    enum class HeldInput : uint8_t
    {
        Forward = 0,
        Backward,
        Left,
        Right,
        Ascend,
        Descend,
        Boost,
        LookLeft,
        LookRight
    };

    struct RuntimeInputLatch
    {
        bool forward = false;
        bool backward = false;
        bool left = false;
        bool right = false;
        bool ascend = false;
        bool descend = false;
        bool boost = false;
        bool left_mouse_down = false;
        bool right_mouse_down = false;
        float mouse_dx_accum = 0.0f;
        float mouse_dy_accum = 0.0f;
        std::vector<KeyPress> key_presses{};
        bool quit_requested = false;
    };

    inline bool& held_flag(RuntimeInputLatch& latch, HeldInput h)
    {
        switch (h)
        {
            case HeldInput::Forward: return latch.forward;
            case HeldInput::Backward: return latch.backward;
            case HeldInput::Left: return latch.left;
            case HeldInput::Right: return latch.right;
            case HeldInput::Ascend: return latch.ascend;
            case HeldInput::Descend: return latch.descend;
            case HeldInput::Boost: return latch.boost;
            case HeldInput::LookLeft: return latch.left_mouse_down;
            case HeldInput::LookRight: return latch.right_mouse_down;
        }
        return latch.forward;
    }

    /*
        Platform давхаргаас ирэх нэг оролтын өөрчлөлт:
            SetHeld: held + down, AddMouseDelta: dx/dy, KeyPressed: key, RequestQuit.
    */
    struct RuntimeInputEvent
    {
        enum class Kind : uint8_t
        {
            SetHeld = 0,
            AddMouseDelta,
            KeyPressed,
            RequestQuit
        };

        Kind kind = Kind::SetHeld;
        HeldInput held = HeldInput::Forward;
        bool down = false;
        float dx = 0.0f;
        float dy = 0.0f;
        KeyPress key{};
    };

    inline RuntimeInputEvent make_held_input_event(HeldInput held, bool down)
    {
        RuntimeInputEvent e{};
        e.kind = RuntimeInputEvent::Kind::SetHeld;
        e.held = held;
        e.down = down;
        return e;
    }

    inline RuntimeInputEvent make_mouse_delta_input_event(float dx, float dy)
    {
        RuntimeInputEvent e{};
        e.kind = RuntimeInputEvent::Kind::AddMouseDelta;
        e.dx = dx;
        e.dy = dy;
        return e;
    }

    inline RuntimeInputEvent make_key_press_input_event(KeyCommand command, uint8_t value = 0)
    {
        RuntimeInputEvent e{};
        e.kind = RuntimeInputEvent::Kind::KeyPressed;
        e.key = KeyPress{command, value};
        return e;
    }

    inline RuntimeInputEvent make_quit_input_event()
    {
        RuntimeInputEvent e{};
        e.kind = RuntimeInputEvent::Kind::RequestQuit;
        return e;
    }

    // Event-үүдийг дарааллаар нь хэрэглэнэ. Нэг held оролтын сүүлчийн утга үлдэнэ.
    inline RuntimeInputLatch reduce_runtime_input_latch(
        RuntimeInputLatch latch,
        std::span<const RuntimeInputEvent> events)
    {
        for (const RuntimeInputEvent& e : events)
        {
            switch (e.kind)
            {
                case RuntimeInputEvent::Kind::SetHeld:
                    held_flag(latch, e.held) = e.down;
                    break;
                case RuntimeInputEvent::Kind::AddMouseDelta:
                    latch.mouse_dx_accum += e.dx;
                    latch.mouse_dy_accum += e.dy;
                    break;
                case RuntimeInputEvent::Kind::KeyPressed:
                    latch.key_presses.push_back(e.key);
                    break;
                case RuntimeInputEvent::Kind::RequestQuit:
                    latch.quit_requested = true;
                    break;
            }
        }
        return latch;
    }

    // Held төлөвүүд үлдэнэ. Mouse delta болон key press зөвхөн нэг кадрт хамаарна.
    inline RuntimeInputLatch clear_runtime_input_frame_deltas(RuntimeInputLatch latch)
    {
        latch.mouse_dx_accum = 0.0f;
        latch.mouse_dy_accum = 0.0f;
        latch.key_presses.clear();
        return latch;
    }
}
