#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Phong (face өнгө + хэсгийн материалтай) ба гэрэлтүүлэггүй flat програмууд.
*/


#include <glm/glm.hpp>

#include "hv/lighting/phong.hpp"
#include "hv/shader/program.hpp"
#include "hv/segmentation/region_colors.hpp"

namespace hv
{
    // Normal нь inverse-transpose матрицаар хувирч дахин нормчлогдоно.
    inline VertexOut transform_vertex(const ShaderVertex& in, const ShaderUniforms& u)
    {
        VertexOut out{};
        const glm::vec4 wp = u.model * glm::vec4(in.position, 1.0f);
        out.world_pos = glm::vec3(wp);
        out.clip = u.viewproj * wp;
        const glm::vec3 n = u.normal_matrix * in.normal;
        const float len = glm::length(n);
        out.normal_ws = (len > 1e-8f) ? (n / len) : glm::vec3(0.0f, 1.0f, 0.0f);
        out.uv = in.uv;
        return out;
    }

    inline glm::vec3 surface_base_color(const FragmentIn& in, const ShaderUniforms& u)
    {
        if (u.face_colors && in.face_index < u.face_colors->size()) return (*u.face_colors)[in.face_index];
        return u.material.diffuse;
    }

    inline PhongMaterial surface_material(const FragmentIn& in, const ShaderUniforms& u)
    {
        PhongMaterial m = u.material;
        if (u.use_region_materials && u.face_labels && in.face_index < u.face_labels->size())
        {
            m = region_material((*u.face_labels)[in.face_index]);
        }
        if (u.face_colors) m = with_base_color(m, surface_base_color(in, u));
        return m;
    }

    inline FragmentOut phong_fragment(const FragmentIn& in, const ShaderUniforms& u)
    {
        SurfaceSample s{};
        s.position_ws = in.world_pos;
        s.normal_ws = in.normal_ws;
        s.camera_pos = u.camera_pos;
        s.material = surface_material(in, u);

        const glm::vec3 c = shade_surface(s, u.light, u.lighting_enabled);
        FragmentOut out{};
        out.color = ColorF{c.r, c.g, c.b, u.alpha};
        return out;
    }

    inline ShaderProgram make_phong_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& in, const ShaderUniforms& u) { return transform_vertex(in, u); };
        p.fs = [](const FragmentIn& in, const ShaderUniforms& u) { return phong_fragment(in, u); };
        return p;
    }

    // Сүүдэр, гэрлийн тэмдэглэгээ: material.diffuse өнгөөр гэрэлгүй будна.
    inline ShaderProgram make_flat_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& in, const ShaderUniforms& u) { return transform_vertex(in, u); };
        p.fs = [](const FragmentIn&, const ShaderUniforms& u)
        {
            FragmentOut out{};
            out.color = ColorF{u.material.diffuse.r, u.material.diffuse.g, u.material.diffuse.b, u.alpha};
            return out;
        };
        return p;
    }

    inline ShaderProgramSet make_builtin_programs()
    {
        ShaderProgramSet out{};
        out.set(DrawProgram::Phong, make_phong_program());
        out.set(DrawProgram::Flat, make_flat_program());
        return out;
    }
}
