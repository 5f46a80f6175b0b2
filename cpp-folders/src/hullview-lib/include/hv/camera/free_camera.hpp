#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: free_camera.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Оролтын latch-аас камерын pose шинэчлэх цэвэр функц.
            Mouse look (товч дарж байх үед) + WASD/QE хөдөлгөөн + boost.
            Бүх хурд dt-ээр үржигдэнэ.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "hv/camera/camera_rig.hpp"
#include "hv/input/value_input_latch.hpp"

namespace hv
{
    struct CameraControlParams
    {
        float move_speed = 4.0f;
        float look_speed = 0.003f;
        float boost_multiplier = 3.0f;
        float pitch_limit_deg = 89.0f;

        // WSL2/Remote-д гарч болох mouse spike-ийг шүүх утгууд
        float mouse_spike_threshold = 180.0f;
        float mouse_delta_clamp = 70.0f;
    };

    inline float clamp_pitch(float pitch, float pitch_limit_deg)
    {
        const float limit = glm::radians(std::clamp(pitch_limit_deg, 0.0f, 89.9f));
        return std::clamp(pitch, -limit, limit);
    }

    inline CameraRig apply_camera_look(CameraRig cam, float mouse_dx, float mouse_dy, const CameraControlParams& params)
    {
        // Spike filtering
        if (std::abs(mouse_dx) > params.mouse_spike_threshold || std::abs(mouse_dy) > params.mouse_spike_threshold)
        {
            mouse_dx = 0.0f;
            mouse_dy = 0.0f;
        }
        mouse_dx = std::clamp(mouse_dx, -params.mouse_delta_clamp, params.mouse_delta_clamp);
        mouse_dy = std::clamp(mouse_dy, -params.mouse_delta_clamp, params.mouse_delta_clamp);

        // LH: mouse баруун тийш -> yaw буурна -> forward камерын right тал руу эргэнэ.
        cam.yaw -= mouse_dx * params.look_speed;
        cam.pitch -= mouse_dy * params.look_speed;
        cam.pitch = clamp_pitch(cam.pitch, params.pitch_limit_deg);
        return cam;
    }

    inline CameraRig apply_camera_input(
        CameraRig cam,
        const RuntimeInputLatch& input,
        const CameraControlParams& params,
        float dt)
    {
        if (input.left_mouse_down || input.right_mouse_down)
        {
            cam = apply_camera_look(cam, input.mouse_dx_accum, input.mouse_dy_accum, params);
        }
        if (!(dt > 0.0f)) return cam;

        const glm::vec3 fwd = cam.forward();
        const glm::vec3 right = cam.right();
        const glm::vec3 up = world_up();
        const float step = params.move_speed * (input.boost ? params.boost_multiplier : 1.0f) * dt;

        if (input.forward)  cam.pos += fwd * step;
        if (input.backward) cam.pos -= fwd * step;
        if (input.right)    cam.pos += right * step;
        if (input.left)     cam.pos -= right * step;
        if (input.ascend)   cam.pos += up * step;
        if (input.descend)  cam.pos -= up * step;
        return cam;
    }
}
