#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: light_motion.hpp
    МОДУЛЬ: animation
    ЗОРИЛГО: Гэрлийн байрлалын анимаци (тойрог, дээш доош хэлбэлзэл, 8 дүрс зам).
            Бүгд t-ийн цэвэр функц бөгөөд хоорондоо нийлж болно.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace hv
{
    struct LightMotionFlags
    {
        bool orbit = false;
        bool bob = false;
        bool path = false;

        bool any() const
        {
            return orbit || bob || path;
        }
    };

    struct LightMotionParams
    {
        glm::vec3 orbit_center{0.0f, 3.0f, 0.0f};
        float orbit_radius = 6.0f;
        float orbit_speed_deg = 45.0f;
        float bob_amplitude = 1.5f;
        // Hz: sin(2*pi*bob_frequency*t)
        float bob_frequency = 2.0f;
        float path_scale = 4.0f;
        float path_speed = 1.0f;
        float min_height = 0.5f;
        float nudge_step = 1.5f;
        float nudge_min_height = 0.1f;
    };

    // Гэрлийн байрлал ба чиглүүлэх цэг. Чиглэл = target - position.
    struct LightRig
    {
        glm::vec3 position{5.0f, 5.0f, 5.0f};
        glm::vec3 target{0.0f};

        glm::vec3 direction() const
        {
            const glm::vec3 d = target - position;
            const float len = glm::length(d);
            if (!(len > 1e-8f)) return glm::vec3(0.0f, -1.0f, 0.0f);
            return d / len;
        }
    };

    inline LightRig make_light_rig(const glm::vec3& light_dir, float distance, const glm::vec3& target = glm::vec3(0.0f))
    {
        LightRig rig{};
        rig.target = target;
        const float len = glm::length(light_dir);
        const glm::vec3 d = (len > 1e-8f) ? (light_dir / len) : glm::vec3(0.0f, -1.0f, 0.0f);
        rig.position = target - d * distance;
        return rig;
    }

    /*
        manual_position: гараар тавьсан (эсвэл анхны) гэрлийн байрлал.
        Ямар ч анимаци асаагүй бол manual_position-ийг өөрчлөхгүй буцаана.
    */
    inline glm::vec3 evaluate_light_position(
        const LightMotionFlags& flags,
        float t,
        const LightMotionParams& p,
        const glm::vec3& manual_position)
    {
        if (!flags.any()) return manual_position;

        glm::vec3 pos = manual_position;
        if (flags.orbit)
        {
            const float a = glm::radians(p.orbit_speed_deg) * t;
            pos.x = p.orbit_center.x + p.orbit_radius * std::cos(a);
            pos.z = p.orbit_center.z + p.orbit_radius * std::sin(a);
            pos.y = p.orbit_center.y;
        }
        if (flags.bob)
        {
            pos.y += p.bob_amplitude * std::sin(glm::two_pi<float>() * p.bob_frequency * t);
        }
        if (flags.path)
        {
            const float pt = t * p.path_speed;
            pos.x += p.path_scale * std::sin(pt);
            pos.z += p.path_scale * std::sin(2.0f * pt) * 0.5f;
        }
        pos.y = std::max(p.min_height, pos.y);
        return pos;
    }

    enum class LightNudge : uint8_t
    {
        Left = 0,
        Right = 1,
        Forward = 2,
        Back = 3,
        Up = 4,
        Down = 5
    };

    constexpr uint8_t HV_LIGHT_NUDGE_COUNT = 6;

    // Forward = -Z (камер анхны байрлалаасаа харах чиглэл).
    inline glm::vec3 nudge_light_position(glm::vec3 pos, LightNudge dir, const LightMotionParams& p)
    {
        switch (dir)
        {
            case LightNudge::Left: pos.x -= p.nudge_step; break;
            case LightNudge::Right: pos.x += p.nudge_step; break;
            case LightNudge::Forward: pos.z -= p.nudge_step; break;
            case LightNudge::Back: pos.z += p.nudge_step; break;
            case LightNudge::Up: pos.y += p.nudge_step; break;
            case LightNudge::Down: pos.y = std::max(p.nudge_min_height, pos.y - p.nudge_step); break;
        }
        return pos;
    }
}
