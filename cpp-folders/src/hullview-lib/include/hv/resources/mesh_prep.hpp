#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: mesh_prep.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Ачаалсан mesh-ийг шалгаж, normal дутуу бол үүсгэж, төвлөрүүлж масштаблана.
            Үр дүн нь зөвхөн уншигдах PreparedMesh (сегментчлэл нэг удаа тооцогдоно).
*/


#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "hv/core/result.hpp"
#include "hv/resources/mesh.hpp"
#include "hv/segmentation/region_classifier.hpp"

namespace hv
{
    struct MeshPrepOptions
    {
        bool center_and_scale = true;
        // Хамгийн урт тэнхлэгийн хэмжээ энэ утгад хүрнэ.
        float target_extent = 4.0f;
        bool regenerate_normals = false;
    };

    struct MeshBounds
    {
        glm::vec3 min{0.0f};
        glm::vec3 max{0.0f};

        glm::vec3 center() const { return (min + max) * 0.5f; }
        glm::vec3 size() const { return max - min; }
        float max_extent() const
        {
            const glm::vec3 s = size();
            return std::max(s.x, std::max(s.y, s.z));
        }
    };

    inline MeshBounds compute_mesh_bounds(const MeshData& mesh)
    {
        MeshBounds b{};
        if (mesh.positions.empty()) return b;
        b.min = mesh.positions.front();
        b.max = mesh.positions.front();
        for (const glm::vec3& p : mesh.positions)
        {
            b.min = glm::min(b.min, p);
            b.max = glm::max(b.max, p);
        }
        return b;
    }

    inline Status validate_mesh(const MeshData& mesh)
    {
        const std::string label = mesh.source_path.empty() ? std::string("<memory>") : mesh.source_path;
        if (mesh.positions.empty()) return Status::failure("mesh '" + label + "' has no vertices");
        if (mesh.indices.empty()) return Status::failure("mesh '" + label + "' has no faces");
        if ((mesh.indices.size() % 3) != 0)
        {
            return Status::failure("mesh '" + label + "' index count " + std::to_string(mesh.indices.size()) + " is not a multiple of 3");
        }
        for (size_t i = 0; i < mesh.indices.size(); ++i)
        {
            if (mesh.indices[i] >= mesh.positions.size())
            {
                return Status::failure(
                    "mesh '" + label + "' face " + std::to_string(i / 3) +
                    " references vertex " + std::to_string(mesh.indices[i]) +
                    " (vertex count " + std::to_string(mesh.positions.size()) + ")");
            }
        }
        for (size_t i = 0; i < mesh.positions.size(); ++i)
        {
            const glm::vec3& p = mesh.positions[i];
            if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            {
                return Status::failure("mesh '" + label + "' vertex " + std::to_string(i) + " is not finite");
            }
        }
        if (!mesh.normals.empty() && mesh.normals.size() != mesh.positions.size())
        {
            return Status::failure("mesh '" + label + "' normal count does not match vertex count");
        }
        return Status::success();
    }

    // Face normal-уудыг талбайгаар жинлэн орой бүрт нэмж нормчилно.
    inline void generate_vertex_normals(MeshData& mesh)
    {
        mesh.normals.assign(mesh.positions.size(), glm::vec3(0.0f));
        for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
        {
            const uint32_t a = mesh.indices[i + 0];
            const uint32_t b = mesh.indices[i + 1];
            const uint32_t c = mesh.indices[i + 2];
            const glm::vec3 fn = glm::cross(mesh.positions[b] - mesh.positions[a], mesh.positions[c] - mesh.positions[a]);
            mesh.normals[a] += fn;
            mesh.normals[b] += fn;
            mesh.normals[c] += fn;
        }
        for (glm::vec3& n : mesh.normals)
        {
            const float len = glm::length(n);
            n = (len > 1e-12f) ? (n / len) : glm::vec3(0.0f, 1.0f, 0.0f);
        }
    }

    inline bool normals_usable(const MeshData& mesh)
    {
        if (mesh.normals.size() != mesh.positions.size()) return false;
        for (const glm::vec3& n : mesh.normals)
        {
            if (!std::isfinite(n.x) || !std::isfinite(n.y) || !std::isfinite(n.z)) return false;
            if (glm::length(n) < 1e-6f) return false;
        }
        return true;
    }

    inline void renormalize_normals(MeshData& mesh)
    {
        for (glm::vec3& n : mesh.normals) n = glm::normalize(n);
    }

    // Bounding box-ийн төвийг эх цэгт аваачиж, хамгийн урт талыг target_extent болгоно.
    inline void center_and_scale_mesh(MeshData& mesh, float target_extent)
    {
        const MeshBounds b = compute_mesh_bounds(mesh);
        const glm::vec3 c = b.center();
        const float ext = b.max_extent();
        const float s = (ext > 0.0f && target_extent > 0.0f) ? (target_extent / ext) : 1.0f;
        for (glm::vec3& p : mesh.positions) p = (p - c) * s;
    }

    /*
        Ачаалсны дараа өөрчлөгдөхгүй mesh. Frame loop зөвхөн const& барина.
        Сегментчлэлийн үр дүн mesh-тэй хамт кэшлэгдэнэ.
    */
    struct PreparedMesh
    {
        MeshData mesh{};
        MeshBounds bounds{};
        SegmentationResult segmentation{};
        bool normals_generated = false;
    };

    inline Result<std::shared_ptr<const PreparedMesh>> prepare_mesh(
        MeshData mesh,
        const SegmentationThresholds& thresholds,
        const MeshPrepOptions& opt = {})
    {
        using Out = std::shared_ptr<const PreparedMesh>;
        const Status valid = validate_mesh(mesh);
        if (!valid.ok) return Result<Out>::failure(valid.error);

        const Status th = validate_segmentation_thresholds(thresholds);
        if (!th.ok) return Result<Out>::failure(th.error);

        auto prepared = std::make_shared<PreparedMesh>();
        if (opt.regenerate_normals || !normals_usable(mesh))
        {
            generate_vertex_normals(mesh);
            prepared->normals_generated = true;
        }
        else
        {
            renormalize_normals(mesh);
        }
        if (mesh.uvs.size() != mesh.positions.size()) mesh.uvs.assign(mesh.positions.size(), glm::vec2(0.0f));
        if (opt.center_and_scale) center_and_scale_mesh(mesh, opt.target_extent);

        prepared->bounds = compute_mesh_bounds(mesh);
        prepared->segmentation = classify_faces(mesh, thresholds);
        prepared->mesh = std::move(mesh);
        return Result<Out>::success(Out(std::move(prepared)));
    }
}
