#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: pose.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Хатуу биеийн pose (байрлал, yaw/pitch/roll, масштаб) ба model матриц.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace hv
{
    // Өнцгүүд радианаар. Масштаб нь тэнхлэг бүрээр өөр байж болно.
    struct Pose
    {
        glm::vec3 position{0.0f};
        float yaw = 0.0f;
        float pitch = 0.0f;
        float roll = 0.0f;
        glm::vec3 scale{1.0f};
    };

    inline glm::mat4 rotation_from_pose(const Pose& p)
    {
        glm::mat4 r{1.0f};
        r = glm::rotate(r, p.yaw, glm::vec3(0.0f, 1.0f, 0.0f));
        r = glm::rotate(r, p.pitch, glm::vec3(1.0f, 0.0f, 0.0f));
        r = glm::rotate(r, p.roll, glm::vec3(0.0f, 0.0f, 1.0f));
        return r;
    }

    // model = T * Ry(yaw) * Rx(pitch) * Rz(roll) * S
    inline glm::mat4 pose_to_matrix(const Pose& p)
    {
        const glm::mat4 t = glm::translate(glm::mat4(1.0f), p.position);
        const glm::mat4 s = glm::scale(glm::mat4(1.0f), p.scale);
        return t * rotation_from_pose(p) * s;
    }
}
