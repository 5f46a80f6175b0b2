#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: planar_shadow.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Гэрлийн чиглэлийн дагуу цэгийг газрын хавтгай дээр буулгах (planar shadow).
            P' = P - ((P - Q).n / (L.n)) * L
            L.n ~ 0 үед проекц тодорхойлогдохгүй тул std::nullopt буцаана.
*/


#include <cmath>
#include <optional>

#include <glm/glm.hpp>

namespace hv
{
    constexpr float HV_SHADOW_PARALLEL_EPS = 1e-3f;

    struct GroundPlane
    {
        glm::vec3 point{0.0f, -3.0f, 0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
    };

    inline GroundPlane make_ground_plane(const glm::vec3& point, const glm::vec3& normal)
    {
        GroundPlane p{};
        p.point = point;
        const float len = glm::length(normal);
        p.normal = (len > 1e-8f) ? (normal / len) : glm::vec3(0.0f, 1.0f, 0.0f);
        return p;
    }

    inline float signed_distance_to_plane(const glm::vec3& p, const GroundPlane& plane)
    {
        return glm::dot(p - plane.point, plane.normal);
    }

    inline bool light_parallel_to_plane(const glm::vec3& light_dir, const GroundPlane& plane, float eps = HV_SHADOW_PARALLEL_EPS)
    {
        const float len = glm::length(light_dir);
        if (!(len > 1e-8f)) return true;
        return std::abs(glm::dot(light_dir / len, plane.normal)) < eps;
    }

    inline std::optional<glm::vec3> project_point_to_plane(
        const glm::vec3& p,
        const glm::vec3& light_dir,
        const GroundPlane& plane,
        float eps = HV_SHADOW_PARALLEL_EPS)
    {
        if (light_parallel_to_plane(light_dir, plane, eps)) return std::nullopt;
        const glm::vec3 l = glm::normalize(light_dir);
        const float ln = glm::dot(l, plane.normal);
        const float t = signed_distance_to_plane(p, plane) / ln;
        return p - t * l;
    }

    /*
        Проекц нь affine тул 4x4 хэлбэрийг суурь цэгүүдийн проекцоос угсарна:
            translation = proj(0), багана i = proj(e_i) - proj(0).
        Гэрэл хавтгайтай параллель бол nullopt.
    */
    inline std::optional<glm::mat4> make_planar_shadow_matrix(
        const glm::vec3& light_dir,
        const GroundPlane& plane,
        float eps = HV_SHADOW_PARALLEL_EPS)
    {
        const std::optional<glm::vec3> origin = project_point_to_plane(glm::vec3(0.0f), light_dir, plane, eps);
        if (!origin) return std::nullopt;

        glm::mat4 m{1.0f};
        for (int c = 0; c < 3; ++c)
        {
            glm::vec3 axis{0.0f};
            axis[c] = 1.0f;
            const std::optional<glm::vec3> p = project_point_to_plane(axis, light_dir, plane, eps);
            if (!p) return std::nullopt;
            m[c] = glm::vec4(*p - *origin, 0.0f);
        }
        m[3] = glm::vec4(*origin, 1.0f);
        return m;
    }

    /*
        Цэгэн гэрлийн homogeneous flattening матриц (light.w = 1 бол цэгэн, 0 бол чиглэлт).
        plane = (a, b, c, d), dot = plane . light, M = dot * I - light (x) plane.
        Гэрэл хавтгай дээр байвал (dot ~ 0) nullopt.
    */
    inline std::optional<glm::mat4> make_point_light_shadow_matrix(
        const glm::vec4& light,
        const GroundPlane& plane,
        float eps = HV_SHADOW_PARALLEL_EPS)
    {
        const glm::vec3 n = plane.normal;
        const glm::vec4 pl{n, -glm::dot(n, plane.point)};
        const float d = glm::dot(pl, light);
        if (std::abs(d) < eps) return std::nullopt;

        glm::mat4 m{0.0f};
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                m[c][r] = ((c == r) ? d : 0.0f) - light[r] * pl[c];
            }
        }
        return m;
    }

    // Z-fighting-аас сэргийлж хавтгайг normal дагуу бага зэрэг өргөнө.
    inline GroundPlane lifted_plane(const GroundPlane& plane, float lift)
    {
        GroundPlane p = plane;
        p.point += plane.normal * lift;
        return p;
    }
}
