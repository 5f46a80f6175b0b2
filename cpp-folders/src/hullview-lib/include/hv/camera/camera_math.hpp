#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: camera_math.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: yaw/pitch өнцгөөс камерын суурь векторуудыг гаргах.
*/


#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace hv
{
    inline glm::vec3 world_up()
    {
        return glm::vec3(0.0f, 1.0f, 0.0f);
    }

    inline glm::vec3 forward_from_yaw_pitch(float yaw, float pitch)
    {
        glm::vec3 f{};
        f.x = std::cos(pitch) * std::cos(yaw);
        f.y = std::sin(pitch);
        f.z = std::cos(pitch) * std::sin(yaw);
        return glm::normalize(f);
    }

    // LH дээр right = up x forward (glm::lookAtLH-тэй ижил).
    inline glm::vec3 right_from_forward(const glm::vec3& fwd, const glm::vec3& up = world_up())
    {
        return glm::normalize(glm::cross(up, fwd));
    }

    inline glm::vec3 up_from_forward_right(const glm::vec3& fwd, const glm::vec3& right)
    {
        return glm::cross(fwd, right);
    }
}
