#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: transform_stack.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Камер ба объектын pose-оос model/view/projection/normal матрицуудыг
            нэг кадарт нэг удаа бэлдэнэ. NaN/inf гарвал кадрыг хүчингүй гэж тэмдэглэнэ.
*/


#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_inverse.hpp>

#include "hv/camera/camera_rig.hpp"
#include "hv/camera/convention.hpp"
#include "hv/scene/pose.hpp"

namespace hv
{
    struct ProjectionParams
    {
        float fov_y_deg = 45.0f;
        float z_near = 0.1f;
        float z_far = 100.0f;
    };

    struct FrameTransforms
    {
        glm::mat4 model{1.0f};
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::mat4 viewproj{1.0f};
        glm::mat3 normal{1.0f};
        glm::vec3 camera_pos{0.0f};
        bool valid = false;
    };

    inline glm::mat4 projection_matrix(const ProjectionParams& p, float aspect)
    {
        return perspective_lh_no(glm::radians(p.fov_y_deg), aspect, p.z_near, p.z_far);
    }

    /*
        Normal матриц = inverse(transpose(model 3x3)).
        Тэгш бус масштабтай үед ч normal гадаргуутай перпендикуляр хэвээр үлдэнэ.
        Singular үед (scale 0) энгийн 3x3-ийг буцаана.
    */
    inline glm::mat3 normal_matrix(const glm::mat4& model)
    {
        const glm::mat3 m3 = glm::mat3(model);
        if (std::abs(glm::determinant(m3)) <= 1e-12f) return m3;
        return glm::inverseTranspose(m3);
    }

    inline bool matrix_is_finite(const glm::mat4& m)
    {
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (!std::isfinite(m[c][r])) return false;
            }
        }
        return true;
    }

    inline bool matrix_is_finite(const glm::mat3& m)
    {
        for (int c = 0; c < 3; ++c)
        {
            for (int r = 0; r < 3; ++r)
            {
                if (!std::isfinite(m[c][r])) return false;
            }
        }
        return true;
    }

    inline FrameTransforms build_frame_transforms(
        const Pose& object_pose,
        const CameraRig& camera,
        const ProjectionParams& projection,
        float aspect)
    {
        FrameTransforms out{};
        out.model = pose_to_matrix(object_pose);
        out.view = view_from_camera(camera);
        out.camera_pos = camera.pos;
        if (!(aspect > 0.0f) || !std::isfinite(aspect)) return out;

        out.proj = projection_matrix(projection, aspect);
        out.viewproj = out.proj * out.view;
        out.normal = normal_matrix(out.model);
        out.valid =
            matrix_is_finite(out.model) &&
            matrix_is_finite(out.view) &&
            matrix_is_finite(out.proj) &&
            matrix_is_finite(out.viewproj) &&
            matrix_is_finite(out.normal);
        return out;
    }
}
