#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: mesh_loader_assimp.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Assimp-аар mesh файл уншиж, бүх дэд mesh-ийг нэг MeshData болгон нэгтгэнэ.
            Алдаа гарвал хоосон биш, тайлбартай Result буцаана.
*/


#include <string>
#include <utility>

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>
#include <glm/glm.hpp>

#include "hv/core/result.hpp"
#include "hv/resources/mesh.hpp"

namespace hv
{
    struct MeshLoadOptions
    {
        bool triangulate = true;
        bool join_identical_vertices = true;
        // Node-ийн transform-уудыг оройд шингээнэ (нэгтгэхэд шаардлагатай).
        bool pre_transform_vertices = true;
    };

    inline unsigned int to_assimp_flags(const MeshLoadOptions& opt)
    {
        unsigned int flags = 0;
        if (opt.triangulate) flags |= aiProcess_Triangulate;
        if (opt.join_identical_vertices) flags |= aiProcess_JoinIdenticalVertices;
        if (opt.pre_transform_vertices) flags |= aiProcess_PreTransformVertices;
        return flags;
    }

    /*
        Normal байхгүй дэд mesh-ийн normal-ыг (0,0,0) үлдээнэ. prepare_mesh түүнийг
        ашиглах боломжгүй гэж үзээд face-ээс дахин үүсгэнэ.
    */
    inline Result<MeshData> load_mesh_assimp(const std::string& path, const MeshLoadOptions& opt = {})
    {
        Assimp::Importer importer;
        const aiScene* scene = importer.ReadFile(path.c_str(), to_assimp_flags(opt));
        if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode)
        {
            return Result<MeshData>::failure("failed to load mesh '" + path + "': " + importer.GetErrorString());
        }
        if (scene->mNumMeshes == 0)
        {
            return Result<MeshData>::failure("mesh file '" + path + "' contains no meshes");
        }

        MeshData out{};
        out.source_path = path;
        size_t skipped_faces = 0;
        for (unsigned int mi = 0; mi < scene->mNumMeshes; ++mi)
        {
            const aiMesh* m = scene->mMeshes[mi];
            if (!m) continue;

            const uint32_t base = (uint32_t)out.positions.size();
            for (unsigned int vi = 0; vi < m->mNumVertices; ++vi)
            {
                const aiVector3D p = m->mVertices[vi];
                out.positions.push_back(glm::vec3(p.x, p.y, p.z));

                if (m->HasNormals())
                {
                    const aiVector3D n = m->mNormals[vi];
                    out.normals.push_back(glm::vec3(n.x, n.y, n.z));
                }
                else
                {
                    out.normals.push_back(glm::vec3(0.0f));
                }

                if (m->HasTextureCoords(0))
                {
                    const aiVector3D uv = m->mTextureCoords[0][vi];
                    out.uvs.push_back(glm::vec2(uv.x, uv.y));
                }
                else
                {
                    out.uvs.push_back(glm::vec2(0.0f));
                }
            }

            for (unsigned int fi = 0; fi < m->mNumFaces; ++fi)
            {
                const aiFace& face = m->mFaces[fi];
                // Triangulate-ийн дараа үлдсэн цэг, шугам primitive-ууд.
                if (face.mNumIndices != 3)
                {
                    skipped_faces++;
                    continue;
                }
                out.indices.push_back(base + (uint32_t)face.mIndices[0]);
                out.indices.push_back(base + (uint32_t)face.mIndices[1]);
                out.indices.push_back(base + (uint32_t)face.mIndices[2]);
            }
        }

        if (out.empty())
        {
            return Result<MeshData>::failure(
                "mesh file '" + path + "' has no triangles (" + std::to_string(skipped_faces) + " non-triangle faces skipped)");
        }
        return Result<MeshData>::success(std::move(out));
    }
}
