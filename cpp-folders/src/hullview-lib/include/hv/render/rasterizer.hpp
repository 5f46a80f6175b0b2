#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: CPU дээрх mesh rasterizer. Гурвалжин, шугам (wireframe), цэг гэсэн
            гурван топологи ижил vertex/fragment shader-ээр дамжина.
            Clip space-д тайрч, 1/w-ээр perspective-correct интерполяц хийнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "hv/gfx/rt_types.hpp"
#include "hv/resources/mesh.hpp"
#include "hv/shader/program.hpp"

namespace hv
{
    enum class RasterizerCullMode
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class PrimitiveTopology : uint8_t
    {
        Triangles = 0,
        Lines = 1,
        Points = 2
    };

    struct RasterizerConfig
    {
        RasterizerCullMode cull_mode = RasterizerCullMode::Back;
        bool front_face_ccw = true;
        PrimitiveTopology topology = PrimitiveTopology::Triangles;
        bool depth_test = true;
        bool depth_write = true;
        // Шугаман depth (0..1) дээр нэмэгдэнэ. Сөрөг утга камер руу ойртуулна.
        float depth_bias = 0.0f;
        // alpha-аар өмнөх өнгөтэй холино.
        bool blend = false;
        // true үед нэг draw дотор пиксел бүрт нэг л удаа бичнэ (coverage mask шаардана).
        bool single_coverage = false;
        int point_size = 2;
    };

    struct RasterizerTarget
    {
        RT_ColorHDR* color = nullptr;
        RT_DepthBuffer* depth = nullptr;
        RT_CoverageMask* coverage = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t lines_raster = 0;
        uint64_t points_raster = 0;
        uint64_t fragments_written = 0;
    };

    namespace detail
    {
        struct RasterVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
            glm::vec3 world_pos{0.0f};
            glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
            glm::vec2 uv{0.0f};
        };

        inline RasterVertex to_raster_vertex(const VertexOut& v)
        {
            return RasterVertex{v.clip, v.world_pos, v.normal_ws, v.uv};
        }

        inline RasterVertex lerp_rv(const RasterVertex& a, const RasterVertex& b, float t)
        {
            RasterVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.world_pos = glm::mix(a.world_pos, b.world_pos, t);
            o.normal_ws = glm::mix(a.normal_ws, b.normal_ws, t);
            o.uv = glm::mix(a.uv, b.uv, t);
            return o;
        }

        inline float plane_dist_left(const RasterVertex& v) { return v.clip.x + v.clip.w; }
        inline float plane_dist_right(const RasterVertex& v) { return v.clip.w - v.clip.x; }
        inline float plane_dist_bottom(const RasterVertex& v) { return v.clip.y + v.clip.w; }
        inline float plane_dist_top(const RasterVertex& v) { return v.clip.w - v.clip.y; }
        inline float plane_dist_near(const RasterVertex& v) { return v.clip.z + v.clip.w; }
        inline float plane_dist_far(const RasterVertex& v) { return v.clip.w - v.clip.z; }

        using PlaneDistFn = float (*)(const RasterVertex&);

        inline const PlaneDistFn* clip_planes()
        {
            static const PlaneDistFn planes[6] = {
                plane_dist_left, plane_dist_right, plane_dist_bottom,
                plane_dist_top, plane_dist_near, plane_dist_far
            };
            return planes;
        }

        inline std::vector<RasterVertex> clip_polygon_plane(const std::vector<RasterVertex>& in_poly, PlaneDistFn plane_dist_fn)
        {
            std::vector<RasterVertex> out{};
            if (in_poly.empty()) return out;

            out.reserve(in_poly.size() + 2);
            for (size_t i = 0; i < in_poly.size(); ++i)
            {
                const RasterVertex& cur = in_poly[i];
                const RasterVertex& nxt = in_poly[(i + 1) % in_poly.size()];
                const float da = plane_dist_fn(cur);
                const float db = plane_dist_fn(nxt);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in && nxt_in)
                {
                    out.push_back(nxt);
                }
                else if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_rv(cur, nxt, da / denom));
                    if (nxt_in) out.push_back(nxt);
                }
            }
            return out;
        }

        inline std::vector<RasterVertex> clip_polygon_frustum(const std::vector<RasterVertex>& in_poly)
        {
            std::vector<RasterVertex> poly = in_poly;
            const PlaneDistFn* planes = clip_planes();
            for (int i = 0; i < 6 && poly.size() >= 3; ++i) poly = clip_polygon_plane(poly, planes[i]);
            return poly;
        }

        // Шугамын хэрчмийг параметрээр (t0, t1) тайрна. Бүхэлдээ гадна бол false.
        inline bool clip_segment_frustum(RasterVertex& a, RasterVertex& b)
        {
            float t0 = 0.0f;
            float t1 = 1.0f;
            const PlaneDistFn* planes = clip_planes();
            for (int i = 0; i < 6; ++i)
            {
                const float da = planes[i](a);
                const float db = planes[i](b);
                if (da < 0.0f && db < 0.0f) return false;
                if (da >= 0.0f && db >= 0.0f) continue;
                const float t = da / (da - db);
                if (da < 0.0f) t0 = std::max(t0, t);
                else t1 = std::min(t1, t);
                if (t0 > t1) return false;
            }
            const RasterVertex a0 = a;
            const RasterVertex b0 = b;
            if (t0 > 0.0f) a = lerp_rv(a0, b0, t0);
            if (t1 < 1.0f) b = lerp_rv(a0, b0, t1);
            return true;
        }

        inline bool inside_clip(const glm::vec4& c)
        {
            if (!(c.w > 0.0f)) return false;
            return
                (c.x >= -c.w && c.x <= c.w) &&
                (c.y >= -c.w && c.y <= c.w) &&
                (c.z >= -c.w && c.z <= c.w);
        }

        inline bool to_screen(const glm::vec4& clip, int W, int H, glm::vec2& out)
        {
            const glm::vec3 ndc = glm::vec3(clip) / clip.w;
            if (!std::isfinite(ndc.x) || !std::isfinite(ndc.y) || !std::isfinite(ndc.z)) return false;
            out = glm::vec2((ndc.x * 0.5f + 0.5f) * (float)(W - 1), (ndc.y * 0.5f + 0.5f) * (float)(H - 1));
            return true;
        }

        // Perspective projection үед 1/w-ээс view-space z сэргээж шугаман depth гаргана.
        inline float linear_depth01(float inv_w, const RT_DepthBuffer* depth)
        {
            if (!depth || !(inv_w > 1e-10f)) return 1.0f;
            const float view_z = 1.0f / inv_w;
            if (!(depth->zf > depth->zn + 1e-6f)) return 1.0f;
            return std::clamp((view_z - depth->zn) / (depth->zf - depth->zn), 0.0f, 1.0f);
        }

        struct FragmentSink
        {
            const ShaderProgram& program;
            const ShaderUniforms& uniforms;
            RasterizerTarget target;
            const RasterizerConfig& config;
            RasterizerStats& stats;

            void emit(FragmentIn& fin, float z01)
            {
                const int x = fin.px;
                const int y = fin.py;
                const float zt = std::clamp(z01 + config.depth_bias, 0.0f, 1.0f);
                if (target.depth && config.depth_test && zt >= target.depth->depth.at(x, y)) return;
                if (config.single_coverage && target.coverage && target.coverage->at(x, y) != 0u) return;

                fin.depth01 = zt;
                const FragmentOut fout = program.fs(fin, uniforms);
                if (fout.discard) return;

                if (target.depth && config.depth_write) target.depth->depth.at(x, y) = zt;
                if (config.single_coverage && target.coverage) target.coverage->at(x, y) = 1u;

                ColorF& dst = target.color->color.at(x, y);
                if (config.blend)
                {
                    const float a = std::clamp(fout.color.a, 0.0f, 1.0f);
                    dst.r = fout.color.r * a + dst.r * (1.0f - a);
                    dst.g = fout.color.g * a + dst.g * (1.0f - a);
                    dst.b = fout.color.b * a + dst.b * (1.0f - a);
                }
                else
                {
                    dst = fout.color;
                }
                stats.fragments_written++;
            }
        };
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-8f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        const float u = 1.0f - v - w;
        return glm::vec3(u, v, w);
    }

    namespace detail
    {
        inline void raster_triangle(
            const RasterVertex& rv0,
            const RasterVertex& rv1,
            const RasterVertex& rv2,
            uint32_t face_index,
            int W,
            int H,
            FragmentSink& sink)
        {
            glm::vec2 s0{}, s1{}, s2{};
            if (!to_screen(rv0.clip, W, H, s0) || !to_screen(rv1.clip, W, H, s1) || !to_screen(rv2.clip, W, H, s2)) return;

            const glm::vec2 e0 = s1 - s0;
            const glm::vec2 e1 = s2 - s0;
            const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
            if (std::abs(signed_area2) < 1e-10f) return;
            const bool tri_ccw = signed_area2 > 0.0f;
            const bool is_front = (tri_ccw == sink.config.front_face_ccw);
            if (sink.config.cull_mode == RasterizerCullMode::Back && !is_front) return;
            if (sink.config.cull_mode == RasterizerCullMode::Front && is_front) return;

            const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
            const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
            const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
            const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
            if (minx > maxx || miny > maxy) return;
            sink.stats.tri_raster++;

            const float invw0 = 1.0f / rv0.clip.w;
            const float invw1 = 1.0f / rv1.clip.w;
            const float invw2 = 1.0f / rv2.clip.w;
            const glm::vec3 wpw0 = rv0.world_pos * invw0;
            const glm::vec3 wpw1 = rv1.world_pos * invw1;
            const glm::vec3 wpw2 = rv2.world_pos * invw2;
            const glm::vec3 npw0 = rv0.normal_ws * invw0;
            const glm::vec3 npw1 = rv1.normal_ws * invw1;
            const glm::vec3 npw2 = rv2.normal_ws * invw2;
            const glm::vec2 uvw0 = rv0.uv * invw0;
            const glm::vec2 uvw1 = rv1.uv * invw1;
            const glm::vec2 uvw2 = rv2.uv * invw2;

            for (int y = miny; y <= maxy; ++y)
            {
                for (int x = minx; x <= maxx; ++x)
                {
                    const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                    const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                    if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                    // 1/w interpolation: perspective-correct position/normal/uv тооцоо.
                    const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                    if (denom <= 1e-10f) continue;
                    const float inv_denom = 1.0f / denom;

                    FragmentIn fin{};
                    fin.world_pos = (bc.x * wpw0 + bc.y * wpw1 + bc.z * wpw2) * inv_denom;
                    fin.normal_ws = glm::normalize((bc.x * npw0 + bc.y * npw1 + bc.z * npw2) * inv_denom);
                    fin.uv = (bc.x * uvw0 + bc.y * uvw1 + bc.z * uvw2) * inv_denom;
                    fin.px = x;
                    fin.py = y;
                    fin.face_index = face_index;
                    sink.emit(fin, linear_depth01(denom, sink.target.depth));
                }
            }
        }

        inline void raster_line(const RasterVertex& a, const RasterVertex& b, uint32_t face_index, int W, int H, FragmentSink& sink)
        {
            glm::vec2 sa{}, sb{};
            if (!to_screen(a.clip, W, H, sa) || !to_screen(b.clip, W, H, sb)) return;
            sink.stats.lines_raster++;

            const float invwa = 1.0f / a.clip.w;
            const float invwb = 1.0f / b.clip.w;
            const glm::vec2 d = sb - sa;
            const int steps = std::max(1, (int)std::ceil(std::max(std::abs(d.x), std::abs(d.y))));
            for (int i = 0; i <= steps; ++i)
            {
                const float s = (float)i / (float)steps;
                const int x = (int)std::lround(sa.x + d.x * s);
                const int y = (int)std::lround(sa.y + d.y * s);
                if (x < 0 || x >= W || y < 0 || y >= H) continue;

                const float invw = invwa + (invwb - invwa) * s;
                if (invw <= 1e-10f) continue;
                const float wa = (1.0f - s) * invwa / invw;
                const float wb = s * invwb / invw;

                FragmentIn fin{};
                fin.world_pos = a.world_pos * wa + b.world_pos * wb;
                const glm::vec3 n = a.normal_ws * wa + b.normal_ws * wb;
                const float nlen = glm::length(n);
                fin.normal_ws = (nlen > 1e-8f) ? (n / nlen) : a.normal_ws;
                fin.uv = a.uv * wa + b.uv * wb;
                fin.px = x;
                fin.py = y;
                fin.face_index = face_index;
                sink.emit(fin, linear_depth01(invw, sink.target.depth));
            }
        }

        inline void raster_point(const RasterVertex& v, uint32_t face_index, int W, int H, FragmentSink& sink)
        {
            if (!inside_clip(v.clip)) return;
            glm::vec2 s{};
            if (!to_screen(v.clip, W, H, s)) return;
            sink.stats.points_raster++;

            const int size = std::max(1, sink.config.point_size);
            const int x0 = (int)std::lround(s.x) - (size - 1) / 2;
            const int y0 = (int)std::lround(s.y) - (size - 1) / 2;
            const float z01 = linear_depth01(1.0f / v.clip.w, sink.target.depth);
            for (int y = y0; y < y0 + size; ++y)
            {
                for (int x = x0; x < x0 + size; ++x)
                {
                    if (x < 0 || x >= W || y < 0 || y >= H) continue;
                    FragmentIn fin{};
                    fin.world_pos = v.world_pos;
                    fin.normal_ws = v.normal_ws;
                    fin.uv = v.uv;
                    fin.px = x;
                    fin.py = y;
                    fin.face_index = face_index;
                    sink.emit(fin, z01);
                }
            }
        }
    }

    inline RasterizerStats rasterize_mesh(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        RasterizerTarget target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target.color || !program.valid()) return stats;
        if (mesh.positions.empty()) return stats;
        const int W = target.color->w;
        const int H = target.color->h;
        if (W <= 0 || H <= 0) return stats;
        if (target.depth && (target.depth->w != W || target.depth->h != H)) return stats;
        if (target.coverage && (target.coverage->w != W || target.coverage->h != H)) return stats;
        if (config.single_coverage && target.coverage) target.coverage->clear(0u);

        auto read_v = [&](uint32_t idx) -> ShaderVertex {
            ShaderVertex v{};
            v.position = mesh.positions[(size_t)idx];
            if (idx < mesh.normals.size()) v.normal = mesh.normals[(size_t)idx];
            if (idx < mesh.uvs.size()) v.uv = mesh.uvs[(size_t)idx];
            return v;
        };

        detail::FragmentSink sink{program, uniforms, target, config, stats};
        // Points горимд нэг оройг нэг л удаа зурна.
        std::vector<uint8_t> point_seen{};
        if (config.topology == PrimitiveTopology::Points) point_seen.assign(mesh.positions.size(), 0u);

        const bool indexed = !mesh.indices.empty();
        const size_t tri_count = indexed ? (mesh.indices.size() / 3) : (mesh.positions.size() / 3);
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats.tri_input++;
            uint32_t idx[3] = {0, 0, 0};
            for (int k = 0; k < 3; ++k)
            {
                idx[k] = indexed ? mesh.indices[ti * 3 + (size_t)k] : (uint32_t)(ti * 3 + (size_t)k);
            }
            if (idx[0] >= mesh.positions.size() || idx[1] >= mesh.positions.size() || idx[2] >= mesh.positions.size()) continue;

            const uint32_t face_index = (uint32_t)ti;
            detail::RasterVertex rv[3];
            for (int k = 0; k < 3; ++k)
            {
                if (config.topology == PrimitiveTopology::Points && point_seen[idx[k]] != 0u) continue;
                rv[k] = detail::to_raster_vertex(program.vs(read_v(idx[k]), uniforms));
            }

            if (config.topology == PrimitiveTopology::Points)
            {
                for (int k = 0; k < 3; ++k)
                {
                    if (point_seen[idx[k]] != 0u) continue;
                    point_seen[idx[k]] = 1u;
                    detail::raster_point(rv[k], face_index, W, H, sink);
                }
                continue;
            }

            if (config.topology == PrimitiveTopology::Lines)
            {
                for (int k = 0; k < 3; ++k)
                {
                    detail::RasterVertex a = rv[k];
                    detail::RasterVertex b = rv[(k + 1) % 3];
                    if (!detail::clip_segment_frustum(a, b)) continue;
                    detail::raster_line(a, b, face_index, W, H, sink);
                }
                continue;
            }

            std::vector<detail::RasterVertex> poly = {rv[0], rv[1], rv[2]};
            // Ихэнх гурвалжин clip volume дотор байдаг тул clip-ийг алгасна.
            if (!(detail::inside_clip(rv[0].clip) && detail::inside_clip(rv[1].clip) && detail::inside_clip(rv[2].clip)))
            {
                poly = detail::clip_polygon_frustum(poly);
            }
            if (poly.size() < 3) continue;

            // Клип хийсний дараах олон өнцөгтийг fan аргаар гурвалжилна.
            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                detail::raster_triangle(poly[0], poly[k], poly[k + 1], face_index, W, H, sink);
            }
        }
        return stats;
    }
}
