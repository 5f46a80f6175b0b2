#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Гурвалжин mesh-ийн өгөгдөл (байрлал, normal, uv, индекс).
*/


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace hv
{
    struct MeshData
    {
        std::string source_path{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec2> uvs{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        size_t triangle_count() const
        {
            return indices.size() / 3;
        }
    };
}
