#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Кадрын хугацаа (dt) болон анимацийн хугацааны хуримтлуулагч.
*/


#include <algorithm>
#include <cstdint>

namespace hv
{
    constexpr float HV_MAX_FRAME_DT = 0.1f;
    constexpr float HV_MIN_ANIMATION_SPEED = 0.1f;
    constexpr float HV_MAX_ANIMATION_SPEED = 5.0f;

    // Monotonic tick-ээс dt гаргана. Эхний кадр 0 буцаана.
    struct FrameClock
    {
        uint64_t ticks_prev = 0;
        double tick_hz = 1.0;
        float max_dt = HV_MAX_FRAME_DT;
        double elapsed = 0.0;

        float begin_frame(uint64_t ticks_now)
        {
            if (ticks_prev == 0 || ticks_now < ticks_prev)
            {
                ticks_prev = ticks_now;
                return 0.0f;
            }
            float dt = (float)((double)(ticks_now - ticks_prev) / tick_hz);
            ticks_prev = ticks_now;
            // Цонх чирэх, breakpoint зэрэг урт завсарлагаа анимацийг үсрүүлэхгүй.
            if (max_dt > 0.0f) dt = std::min(dt, max_dt);
            elapsed += (double)dt;
            return dt;
        }
    };

    /*
        Анимацийн хугацаа: t = sum(dt * speed).
        Pause төлөв ToggleState дээр байх тул advance-г дуудагч шийднэ.
    */
    struct AnimationClock
    {
        double time = 0.0;
        float speed = 1.0f;

        void advance(float dt)
        {
            if (dt <= 0.0f) return;
            time += (double)dt * (double)speed;
        }

        void set_speed(float s)
        {
            speed = std::clamp(s, HV_MIN_ANIMATION_SPEED, HV_MAX_ANIMATION_SPEED);
        }

        void adjust_speed(float delta)
        {
            set_speed(speed + delta);
        }

        void reset()
        {
            time = 0.0;
            speed = 1.0f;
        }

        float seconds() const
        {
            return (float)time;
        }
    };
}
