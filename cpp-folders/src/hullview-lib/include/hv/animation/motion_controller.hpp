#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: motion_controller.hpp
    МОДУЛЬ: animation
    ЗОРИЛГО: Объектын pose-г анимацийн хугацаа t-ийн цэвэр функцээр тооцно.
            Кадрын давтамжаас хамаарахгүй. Горим солиход үсрэлт гарч болно.
*/


#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "hv/scene/pose.hpp"

namespace hv
{
    enum class MotionMode : uint8_t
    {
        Orbital = 0,
        Bobbing = 1,
        FigureEight = 2,
        None = 3
    };

    constexpr uint8_t HV_MOTION_MODE_COUNT = 4;

    /*
        Горим бүрийн тогтмолууд.
        orbit_speed, bob_speed, figure8_speed нь rad/s (omega).
        spin_speed_deg нь bobbing горимд yaw тэнхлэгээр эргэх хурд (deg/s).
    */
    struct MotionParams
    {
        glm::vec3 center{0.0f};
        float base_height = 0.0f;
        float orbit_radius = 3.0f;
        float orbit_speed = 0.5f;
        float bob_amplitude = 0.5f;
        float bob_speed = glm::pi<float>();
        float figure8_radius = 3.0f;
        float figure8_speed = 0.4f;
        float spin_speed_deg = 30.0f;
    };

    inline const char* motion_mode_name(MotionMode m)
    {
        switch (m)
        {
            case MotionMode::Orbital: return "orbital";
            case MotionMode::Bobbing: return "bobbing";
            case MotionMode::FigureEight: return "figure_eight";
            case MotionMode::None: return "none";
        }
        return "unknown";
    }

    inline std::optional<MotionMode> motion_mode_from_name(std::string_view s)
    {
        if (s == "orbital") return MotionMode::Orbital;
        if (s == "bobbing") return MotionMode::Bobbing;
        if (s == "figure_eight" || s == "figure8") return MotionMode::FigureEight;
        if (s == "none") return MotionMode::None;
        return std::nullopt;
    }

    inline bool motion_mode_valid(uint8_t raw)
    {
        return raw < HV_MOTION_MODE_COUNT;
    }

    // Ry(yaw)*(0,0,1) = (sin yaw, 0, cos yaw) тул +Z нүүрийг tangent руу эргүүлнэ.
    inline float yaw_facing_tangent(const glm::vec3& tangent, float fallback_yaw)
    {
        if (std::abs(tangent.x) + std::abs(tangent.z) <= 1e-8f) return fallback_yaw;
        return std::atan2(tangent.x, tangent.z);
    }

    inline Pose orbital_pose(float t, const MotionParams& p, const Pose& manual)
    {
        const float a = p.orbit_speed * t;
        Pose out = manual;
        out.position = p.center + glm::vec3(p.orbit_radius * std::cos(a), p.base_height, p.orbit_radius * std::sin(a));
        const glm::vec3 tangent{-std::sin(a) * p.orbit_speed, 0.0f, std::cos(a) * p.orbit_speed};
        out.yaw = yaw_facing_tangent(tangent, manual.yaw);
        return out;
    }

    // x/z нь гараар тавьсан pose-оос. Зөвхөн өндөр хэлбэлзэнэ.
    inline Pose bobbing_pose(float t, const MotionParams& p, const Pose& manual)
    {
        Pose out = manual;
        out.position.y = p.base_height + p.bob_amplitude * std::sin(p.bob_speed * t);
        out.yaw = manual.yaw + glm::radians(p.spin_speed_deg) * t;
        return out;
    }

    inline Pose figure_eight_pose(float t, const MotionParams& p, const Pose& manual)
    {
        const float a = p.figure8_speed * t;
        const float s = std::sin(a);
        const float c = std::cos(a);
        Pose out = manual;
        out.position = p.center + glm::vec3(p.figure8_radius * s, p.base_height, p.figure8_radius * s * c);
        // d/dt (R sin a, R sin a cos a) = R w (cos a, cos 2a)
        const glm::vec3 tangent{c, 0.0f, std::cos(2.0f * a)};
        out.yaw = yaw_facing_tangent(tangent * p.figure8_speed, manual.yaw);
        return out;
    }

    inline Pose evaluate_object_pose(MotionMode mode, float t, const MotionParams& params, const Pose& manual)
    {
        switch (mode)
        {
            case MotionMode::Orbital: return orbital_pose(t, params, manual);
            case MotionMode::Bobbing: return bobbing_pose(t, params, manual);
            case MotionMode::FigureEight: return figure_eight_pose(t, params, manual);
            case MotionMode::None: return manual;
        }
        return manual;
    }

    inline MotionMode next_motion_mode(MotionMode m)
    {
        return (MotionMode)(((uint8_t)m + 1u) % HV_MOTION_MODE_COUNT);
    }
}
