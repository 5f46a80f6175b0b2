#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: animation_presets.hpp
    МОДУЛЬ: animation
    ЗОРИЛГО: 1-5 товчоор сонгох бэлэн анимацийн тохиргоонууд.
*/


#include <array>
#include <optional>

#include "hv/animation/light_motion.hpp"
#include "hv/animation/motion_controller.hpp"

namespace hv
{
    struct AnimationPreset
    {
        int number = 1;
        const char* name = "";
        MotionMode motion_mode = MotionMode::Orbital;
        float spin_speed_deg = 30.0f;
        LightMotionFlags light{};
        float light_orbit_speed_deg = 45.0f;
        float light_bob_frequency = 2.0f;
        float global_speed = 1.0f;
    };

    inline const std::array<AnimationPreset, 5>& animation_presets()
    {
        static const std::array<AnimationPreset, 5> presets{{
            {1, "Showcase", MotionMode::Orbital, 20.0f, {true, false, false}, 30.0f, 2.0f, 1.0f},
            {2, "Dynamic", MotionMode::Bobbing, 60.0f, {false, true, false}, 45.0f, 3.0f, 1.5f},
            {3, "Cinematic", MotionMode::None, 0.0f, {true, true, false}, 20.0f, 1.5f, 0.8f},
            {4, "Hyperdrive", MotionMode::FigureEight, 120.0f, {true, false, true}, 90.0f, 2.0f, 2.5f},
            {5, "Zen", MotionMode::Bobbing, 10.0f, {true, true, false}, 15.0f, 0.5f, 0.3f},
        }};
        return presets;
    }

    inline std::optional<AnimationPreset> find_animation_preset(int number)
    {
        for (const AnimationPreset& p : animation_presets())
        {
            if (p.number == number) return p;
        }
        return std::nullopt;
    }
}
