#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment шатны өгөгдөл ба нэг draw-ийн uniform-ууд.
*/


#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "hv/gfx/rt_types.hpp"
#include "hv/lighting/phong.hpp"
#include "hv/segmentation/region_colors.hpp"

namespace hv
{
    struct ShaderVertex
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
    };

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
    };

    struct FragmentIn
    {
        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
        // Энэ fragment-ийг үүсгэсэн гурвалжны индекс (wireframe/points үед ч хадгалагдана).
        uint32_t face_index = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    /*
        face_colors != nullptr бол face бүрийн суурь өнгө material-ийн ambient/diffuse-ийг орлоно.
        face_labels + use_region_materials үед specular/shininess хэсгийн материалаас авна.
    */
    struct ShaderUniforms
    {
        glm::mat4 model{1.0f};
        glm::mat4 viewproj{1.0f};
        glm::mat3 normal_matrix{1.0f};
        glm::vec3 camera_pos{0.0f};

        DirectionalLight light{};
        PhongMaterial material{};
        bool lighting_enabled = true;
        float alpha = 1.0f;

        const std::vector<glm::vec3>* face_colors = nullptr;
        const std::vector<RegionLabel>* face_labels = nullptr;
        bool use_region_materials = false;
    };
}
