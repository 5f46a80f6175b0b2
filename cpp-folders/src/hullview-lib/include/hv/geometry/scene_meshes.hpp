#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: scene_meshes.hpp
    МОДУЛЬ: geometry
    ЗОРИЛГО: Үзэгдлийн туслах mesh-үүд: газрын тор ба гэрлийн тэмдэглэгээний бөмбөлөг.
            Бүгд гадагш харсан эргэлттэй.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "hv/resources/mesh.hpp"

namespace hv
{
    // XZ тор, y = height. Төв нь эх цэг дээр.
    struct GroundMeshDesc
    {
        float size = 20.0f;
        float height = -3.0f;
        int subdivisions = 10;
    };

    struct MarkerMeshDesc
    {
        float radius = 0.2f;
        int rings = 8;
        int slices = 12;
    };

    namespace detail
    {
        inline uint32_t push_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv)
        {
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            return (uint32_t)(m.positions.size() - 1);
        }

        // Face normal нь оройн normal-уудын нийлбэртэй нэг тал руу харна.
        inline void emit_triangle(MeshData& m, uint32_t a, uint32_t b, uint32_t c)
        {
            const glm::vec3 fn = glm::cross(m.positions[b] - m.positions[a], m.positions[c] - m.positions[a]);
            const glm::vec3 vn = m.normals[a] + m.normals[b] + m.normals[c];
            if (glm::dot(fn, vn) < 0.0f) std::swap(b, c);
            m.indices.insert(m.indices.end(), {a, b, c});
        }

        // a-b-c-d нь дөрвөлжний хүрээг дагасан дараалал.
        inline void emit_quad(MeshData& m, uint32_t a, uint32_t b, uint32_t c, uint32_t d)
        {
            emit_triangle(m, a, b, c);
            emit_triangle(m, a, c, d);
        }
    }

    inline MeshData make_ground_mesh(const GroundMeshDesc& d)
    {
        MeshData m{};
        const int n = std::max(1, d.subdivisions);
        const float half = d.size * 0.5f;
        const float step = d.size / (float)n;

        for (int iz = 0; iz <= n; ++iz)
        {
            for (int ix = 0; ix <= n; ++ix)
            {
                const glm::vec3 p{-half + step * (float)ix, d.height, -half + step * (float)iz};
                detail::push_vertex(m, p, glm::vec3(0.0f, 1.0f, 0.0f), glm::vec2((float)ix / (float)n, (float)iz / (float)n));
            }
        }

        const uint32_t row = (uint32_t)n + 1u;
        for (uint32_t iz = 0; iz < (uint32_t)n; ++iz)
        {
            for (uint32_t ix = 0; ix < (uint32_t)n; ++ix)
            {
                const uint32_t a = iz * row + ix;
                detail::emit_quad(m, a, a + row, a + row + 1u, a + 1u);
            }
        }
        return m;
    }

    /*
        Туйл бүр нэг оройтой UV бөмбөлөг (туйл дээр доройтсон гурвалжин үүсэхгүй).
        Оройн дараалал: дээд туйл, (rings - 1) цагираг x slices, доод туйл.
    */
    inline MeshData make_marker_sphere(const MarkerMeshDesc& d)
    {
        MeshData m{};
        const int rings = std::max(2, d.rings);
        const int slices = std::max(3, d.slices);

        const auto push_dir = [&](const glm::vec3& n, const glm::vec2& uv)
        {
            return detail::push_vertex(m, n * d.radius, n, uv);
        };

        const uint32_t top = push_dir(glm::vec3(0.0f, 1.0f, 0.0f), glm::vec2(0.5f, 0.0f));
        for (int r = 1; r < rings; ++r)
        {
            const float phi = glm::pi<float>() * (float)r / (float)rings;
            for (int s = 0; s < slices; ++s)
            {
                const float theta = glm::two_pi<float>() * (float)s / (float)slices;
                const glm::vec3 n{std::sin(phi) * std::cos(theta), std::cos(phi), std::sin(phi) * std::sin(theta)};
                push_dir(n, glm::vec2((float)s / (float)slices, (float)r / (float)rings));
            }
        }
        const uint32_t bottom = push_dir(glm::vec3(0.0f, -1.0f, 0.0f), glm::vec2(0.5f, 1.0f));

        const auto ring_vertex = [slices](int r, int s)
        {
            return 1u + (uint32_t)((r - 1) * slices + (s % slices));
        };

        for (int s = 0; s < slices; ++s)
        {
            detail::emit_triangle(m, top, ring_vertex(1, s), ring_vertex(1, s + 1));
            detail::emit_triangle(m, bottom, ring_vertex(rings - 1, s + 1), ring_vertex(rings - 1, s));
        }
        for (int r = 1; r < rings - 1; ++r)
        {
            for (int s = 0; s < slices; ++s)
            {
                detail::emit_quad(m, ring_vertex(r, s), ring_vertex(r + 1, s), ring_vertex(r + 1, s + 1), ring_vertex(r, s + 1));
            }
        }
        return m;
    }
}
