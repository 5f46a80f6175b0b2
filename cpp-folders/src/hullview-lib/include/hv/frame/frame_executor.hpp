#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: frame_executor.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: FramePlan-ийг CPU rasterizer-ээр өнгө/depth target руу гүйцэтгэнэ.
*/


#include <cstdint>
#include <vector>

#include "hv/frame/frame_plan.hpp"
#include "hv/gfx/rt_types.hpp"
#include "hv/render/rasterizer.hpp"
#include "hv/shader/builtin_shaders.hpp"

namespace hv
{
    struct FrameExecStats
    {
        uint32_t draws_executed = 0;
        RasterizerStats raster{};
    };

    inline void accumulate_stats(RasterizerStats& dst, const RasterizerStats& s)
    {
        dst.tri_input += s.tri_input;
        dst.tri_after_clip += s.tri_after_clip;
        dst.tri_raster += s.tri_raster;
        dst.lines_raster += s.lines_raster;
        dst.points_raster += s.points_raster;
        dst.fragments_written += s.fragments_written;
    }

    class SoftwareFrameExecutor
    {
    public:
        SoftwareFrameExecutor(int width, int height)
            : targets_(width, height, 0.1f, 100.0f)
            , programs_(make_builtin_programs())
        {}

        const FrameTargets& targets() const { return targets_; }
        const FrameExecStats& last_stats() const { return stats_; }

        FrameExecStats execute(const FramePlan& plan)
        {
            stats_ = FrameExecStats{};
            targets_.depth.zn = plan.z_near;
            targets_.depth.zf = plan.z_far;
            targets_.color.clear(ColorF{plan.clear_color.r, plan.clear_color.g, plan.clear_color.b, 1.0f});
            targets_.depth.clear(1.0f);

            RasterizerTarget rt{};
            rt.color = &targets_.color;
            rt.depth = &targets_.depth;
            rt.coverage = &targets_.coverage;

            for (const DrawCommand& d : plan.draws)
            {
                if (!d.mesh) continue;

                ShaderUniforms u = d.uniforms;
                if (d.use_face_colors) u.face_colors = &plan.face_colors;

                RasterizerConfig rc{};
                rc.cull_mode = RasterizerCullMode::None;
                rc.topology = d.topology;
                rc.depth_bias = d.depth_bias;
                rc.depth_write = d.depth_write;
                rc.blend = d.blend;
                rc.single_coverage = d.single_coverage;

                accumulate_stats(stats_.raster, rasterize_mesh(*d.mesh, programs_.get(d.program), u, rt, rc));
                stats_.draws_executed++;
            }
            return stats_;
        }

        void resolve_rgba8(std::vector<uint8_t>& out) const
        {
            resolve_hdr_to_rgba8(targets_.color, out);
        }

    private:
        FrameTargets targets_{};
        ShaderProgramSet programs_{};
        FrameExecStats stats_{};
    };
}
