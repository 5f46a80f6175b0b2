#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: frame_plan.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Нэг кадрын зурах тушаалуудыг цэвэр функцээр (plan_frame) бэлдэнэ.
            ViewerState + ViewerConfig + PreparedMesh -> FramePlan.
            Render context шаардахгүй тул тестэд шууд шалгагдана.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "hv/animation/light_motion.hpp"
#include "hv/animation/motion_controller.hpp"
#include "hv/app/viewer_config.hpp"
#include "hv/app/viewer_state.hpp"
#include "hv/geometry/scene_meshes.hpp"
#include "hv/lighting/planar_shadow.hpp"
#include "hv/render/rasterizer.hpp"
#include "hv/resources/mesh_prep.hpp"
#include "hv/scene/transform_stack.hpp"
#include "hv/segmentation/region_colors.hpp"
#include "hv/shader/program.hpp"
#include "hv/shader/types.hpp"

namespace hv
{
    enum class DrawKind : uint8_t
    {
        Ground = 0,
        Shadow = 1,
        Mesh = 2,
        LightMarker = 3
    };

    enum class ShadowSkipReason : uint8_t
    {
        None = 0,
        Disabled = 1,
        LightParallel = 2,
        LightBelowPlane = 3,
        TransformsInvalid = 4
    };

    inline const char* shadow_skip_reason_name(ShadowSkipReason r)
    {
        switch (r)
        {
            case ShadowSkipReason::None: return "none";
            case ShadowSkipReason::Disabled: return "disabled";
            case ShadowSkipReason::LightParallel: return "light parallel to ground";
            case ShadowSkipReason::LightBelowPlane: return "light below ground";
            case ShadowSkipReason::TransformsInvalid: return "invalid transforms";
        }
        return "unknown";
    }

    inline PrimitiveTopology topology_for_render_mode(RenderMode m)
    {
        switch (m)
        {
            case RenderMode::Filled: return PrimitiveTopology::Triangles;
            case RenderMode::Wireframe: return PrimitiveTopology::Lines;
            case RenderMode::Points: return PrimitiveTopology::Points;
        }
        return PrimitiveTopology::Triangles;
    }

    /*
        Кадар хооронд өөрчлөгдөхгүй mesh-үүд. DrawCommand эдгээр рүү заагч барина,
        тиймээс SceneAssets нь plan-ийг гүйцэтгэж дуустал амьд байх ёстой.
    */
    struct SceneAssets
    {
        std::shared_ptr<const PreparedMesh> model{};
        MeshData ground{};
        MeshData light_marker{};
    };

    inline SceneAssets make_scene_assets(std::shared_ptr<const PreparedMesh> model, const ViewerConfig& cfg)
    {
        SceneAssets a{};
        a.model = std::move(model);

        GroundMeshDesc gd{};
        gd.size = cfg.ground.size;
        gd.height = cfg.ground.height;
        gd.subdivisions = cfg.ground.subdivisions;
        a.ground = make_ground_mesh(gd);

        MarkerMeshDesc md{};
        md.radius = cfg.light_marker.radius;
        a.light_marker = make_marker_sphere(md);
        return a;
    }

    struct DrawCommand
    {
        DrawKind kind = DrawKind::Mesh;
        DrawProgram program = DrawProgram::Phong;
        PrimitiveTopology topology = PrimitiveTopology::Triangles;
        const MeshData* mesh = nullptr;
        ShaderUniforms uniforms{};
        // true бол гүйцэтгэгч FramePlan::face_colors-ийг uniform-д холбоно.
        bool use_face_colors = false;
        float depth_bias = 0.0f;
        bool depth_write = true;
        bool blend = false;
        bool single_coverage = false;
    };

    struct FramePlan
    {
        glm::vec3 clear_color{0.0f};
        float z_near = 0.1f;
        float z_far = 100.0f;
        bool transforms_valid = false;
        FrameTransforms transforms{};
        Pose object_pose{};
        glm::vec3 light_position{0.0f};
        DirectionalLight light{};
        std::vector<DrawCommand> draws{};
        std::vector<glm::vec3> face_colors{};
        bool shadow_skipped = false;
        ShadowSkipReason shadow_skip_reason = ShadowSkipReason::None;

        const DrawCommand* find(DrawKind kind) const
        {
            for (const DrawCommand& d : draws)
            {
                if (d.kind == kind) return &d;
            }
            return nullptr;
        }
    };

    struct FrameInputs
    {
        const ViewerState& state;
        const ViewerConfig& config;
        const SceneAssets& assets;
        float aspect = 1.0f;
    };

    // Preset-ээр солигдсон хурдыг тохиргооны үлдсэн утгуудтай нийлүүлнэ.
    inline MotionParams effective_motion_params(const ViewerState& s, const ViewerConfig& cfg)
    {
        MotionParams p = cfg.motion;
        p.spin_speed_deg = s.spin_speed_deg;
        return p;
    }

    inline LightMotionParams effective_light_motion_params(const ViewerState& s, const ViewerConfig& cfg)
    {
        LightMotionParams p = cfg.light_motion;
        p.orbit_speed_deg = s.light_orbit_speed_deg;
        p.bob_frequency = s.light_bob_frequency;
        return p;
    }

    /*
        Зурах дараалал: газар -> сүүдэр -> mesh -> гэрлийн тэмдэг.
        Сүүдэр depth бичихгүй, камер руу бага зэрэг татагдаж, пиксел бүрт нэг удаа
        alpha-аар холигдоно. Гурвалжны эргэлт ачаалсан файлаас хамаарах тул culling хийхгүй.
        Transform хүчингүй бол зөвхөн clear үлдэнэ.
    */
    inline FramePlan plan_frame(const FrameInputs& in)
    {
        const ViewerState& s = in.state;
        const ViewerConfig& cfg = in.config;
        const ToggleState& tg = s.toggles;

        FramePlan plan{};
        plan.clear_color = cfg.clear_color;
        plan.z_near = cfg.projection.z_near;
        plan.z_far = cfg.projection.z_far;

        const float t = s.clock.seconds();
        plan.object_pose = evaluate_object_pose(tg.motion_mode, t, effective_motion_params(s, cfg), s.manual_pose);
        plan.transforms = build_frame_transforms(plan.object_pose, s.camera, cfg.projection, in.aspect);
        plan.transforms_valid = plan.transforms.valid;

        plan.light_position = evaluate_light_position(tg.light_motion, t, effective_light_motion_params(s, cfg), s.manual_light_position);
        plan.light = make_directional_light(cfg.light, LightRig{plan.light_position, cfg.light.target}.direction());

        if (!plan.transforms_valid || !in.assets.model)
        {
            plan.shadow_skipped = tg.shadow_enabled;
            plan.shadow_skip_reason = tg.shadow_enabled ? ShadowSkipReason::TransformsInvalid : ShadowSkipReason::Disabled;
            return plan;
        }

        ShaderUniforms base{};
        base.viewproj = plan.transforms.viewproj;
        base.camera_pos = plan.transforms.camera_pos;
        base.light = plan.light;
        base.lighting_enabled = tg.lighting_enabled;

        if (tg.ground_enabled)
        {
            DrawCommand d{};
            d.kind = DrawKind::Ground;
            d.program = DrawProgram::Phong;
            d.mesh = &in.assets.ground;
            d.uniforms = base;
            d.uniforms.material = cfg.ground.material;
            plan.draws.push_back(d);
        }

        if (!tg.shadow_enabled)
        {
            plan.shadow_skip_reason = ShadowSkipReason::Disabled;
        }
        else
        {
            const GroundPlane ground = make_config_ground_plane(cfg.ground);
            const std::optional<glm::mat4> flatten = make_planar_shadow_matrix(
                plan.light.direction, lifted_plane(ground, cfg.shadow.lift), cfg.shadow.parallel_eps);
            if (!flatten)
            {
                plan.shadow_skipped = true;
                plan.shadow_skip_reason = ShadowSkipReason::LightParallel;
            }
            else if (glm::dot(plan.light.direction, ground.normal) > 0.0f)
            {
                plan.shadow_skipped = true;
                plan.shadow_skip_reason = ShadowSkipReason::LightBelowPlane;
            }
            else
            {
                DrawCommand d{};
                d.kind = DrawKind::Shadow;
                d.program = DrawProgram::Flat;
                d.mesh = &in.assets.model->mesh;
                d.uniforms = base;
                d.uniforms.model = (*flatten) * plan.transforms.model;
                d.uniforms.lighting_enabled = false;
                d.uniforms.material.diffuse = cfg.shadow.color;
                d.uniforms.alpha = cfg.shadow.alpha;
                d.depth_bias = -cfg.shadow.depth_bias;
                d.depth_write = false;
                d.blend = true;
                d.single_coverage = true;
                plan.draws.push_back(d);
            }
        }

        {
            const PreparedMesh& pm = *in.assets.model;
            build_face_colors(pm.segmentation, tg.coloring_mode, tg.color_scheme, t, cfg.coloring, plan.face_colors);

            DrawCommand d{};
            d.kind = DrawKind::Mesh;
            d.program = DrawProgram::Phong;
            d.topology = topology_for_render_mode(tg.render_mode);
            d.mesh = &pm.mesh;
            d.uniforms = base;
            d.uniforms.model = plan.transforms.model;
            d.uniforms.normal_matrix = plan.transforms.normal;
            d.uniforms.material = cfg.material;
            d.uniforms.material.shininess = s.material_shininess;
            d.uniforms.face_labels = &pm.segmentation.labels;
            d.uniforms.use_region_materials = coloring_uses_region_materials(tg.coloring_mode);
            d.use_face_colors = true;
            plan.draws.push_back(d);
        }

        if (tg.lighting_enabled)
        {
            DrawCommand d{};
            d.kind = DrawKind::LightMarker;
            d.program = DrawProgram::Flat;
            d.mesh = &in.assets.light_marker;
            d.uniforms = base;
            d.uniforms.model = glm::translate(glm::mat4(1.0f), plan.light_position);
            d.uniforms.material.diffuse = cfg.light_marker.color;
            plan.draws.push_back(d);
        }
        return plan;
    }
}
