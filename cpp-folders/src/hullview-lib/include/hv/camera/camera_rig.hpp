#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: camera_rig.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Камерын pose (байрлал + yaw/pitch) ба түүнээс world/view матриц гаргах.
*/


#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "hv/camera/camera_math.hpp"

namespace hv
{
    struct CameraRig
    {
        glm::vec3 pos{0.0f, 0.0f, 8.0f};
        // yaw = -pi/2 үед forward = -Z, өөрөөр хэлбэл эх цэг рүү харна.
        float yaw = -glm::half_pi<float>();
        float pitch = 0.0f;

        glm::vec3 forward() const
        {
            return forward_from_yaw_pitch(yaw, pitch);
        }

        glm::vec3 right() const
        {
            return right_from_forward(forward());
        }

        glm::vec3 up() const
        {
            return up_from_forward_right(forward(), right());
        }
    };

    /*
        Камерын world transform: баганууд нь (right, up, forward, position).
        Pitch нь +-89 градусаас хэтрэхгүй тул forward ба world up хэзээ ч параллель болохгүй.
    */
    inline glm::mat4 camera_world_matrix(const CameraRig& cam)
    {
        const glm::vec3 f = cam.forward();
        const glm::vec3 r = right_from_forward(f);
        const glm::vec3 u = up_from_forward_right(f, r);

        glm::mat4 m{1.0f};
        m[0] = glm::vec4(r, 0.0f);
        m[1] = glm::vec4(u, 0.0f);
        m[2] = glm::vec4(f, 0.0f);
        m[3] = glm::vec4(cam.pos, 1.0f);
        return m;
    }

    // View = inverse(camera world). Rigid transform тул transpose-оор урвуулна.
    inline glm::mat4 view_from_camera(const CameraRig& cam)
    {
        const glm::mat4 world = camera_world_matrix(cam);
        const glm::mat3 rot_t = glm::transpose(glm::mat3(world));
        glm::mat4 view{rot_t};
        view[3] = glm::vec4(-(rot_t * cam.pos), 1.0f);
        return view;
    }
}
