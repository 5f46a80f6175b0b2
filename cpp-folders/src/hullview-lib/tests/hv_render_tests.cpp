#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "hv/animation/animation_presets.hpp"
#include "hv/app/viewer_config.hpp"
#include "hv/app/viewer_state.hpp"
#include "hv/camera/convention.hpp"
#include "hv/frame/frame_plan.hpp"
#include "hv/frame/frame_runner.hpp"
#include "hv/geometry/scene_meshes.hpp"
#include "hv/gfx/rt_types.hpp"
#include "hv/render/rasterizer.hpp"
#include "hv/resources/mesh_prep.hpp"
#include "hv/segmentation/region_classifier.hpp"
#include "hv/segmentation/region_colors.hpp"
#include "hv/shader/builtin_shaders.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_vec(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    // Тал бүр өөрийн 4 оройтой, гадагш харсан хайрцаг.
    hv::MeshData make_box(const glm::vec3& size)
    {
        hv::MeshData m{};
        const glm::vec3 h = size * 0.5f;
        // (normal, u, v) тэнхлэгүүд, u x v = +normal тэнхлэг
        const int axes[3][3] = {{0, 1, 2}, {1, 2, 0}, {2, 0, 1}};
        for (const auto& ax : axes)
        {
            for (float sign : {1.0f, -1.0f})
            {
                glm::vec3 n{0.0f};
                glm::vec3 u{0.0f};
                glm::vec3 v{0.0f};
                n[ax[0]] = sign;
                u[ax[1]] = h[ax[1]];
                v[ax[2]] = h[ax[2]];
                const glm::vec3 c = n * h[ax[0]];

                const uint32_t base = (uint32_t)m.positions.size();
                m.positions.insert(m.positions.end(), {c - u - v, c + u - v, c + u + v, c - u + v});
                m.normals.insert(m.normals.end(), 4, n);
                m.uvs.insert(m.uvs.end(), {glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f)});
                if (sign > 0.0f)
                {
                    m.indices.insert(m.indices.end(), {base, base + 1u, base + 2u, base, base + 2u, base + 3u});
                }
                else
                {
                    m.indices.insert(m.indices.end(), {base, base + 2u, base + 1u, base, base + 3u, base + 2u});
                }
            }
        }
        return m;
    }

    std::shared_ptr<const hv::PreparedMesh> make_test_ship(const hv::ViewerConfig& cfg)
    {
        const hv::Result<std::shared_ptr<const hv::PreparedMesh>> r =
            hv::prepare_mesh(make_box(glm::vec3(2.0f, 1.0f, 3.0f)), cfg.segmentation, cfg.mesh_prep);
        return r.ok ? r.value : nullptr;
    }

    // z хавтгай дээрх 2 гурвалжинтай дөрвөлжин.
    hv::MeshData make_quad(float z, float half)
    {
        hv::MeshData m{};
        m.positions = {
            glm::vec3(-half, -half, z),
            glm::vec3(half, -half, z),
            glm::vec3(half, half, z),
            glm::vec3(-half, half, z),
        };
        m.normals.assign(4, glm::vec3(0.0f, 0.0f, -1.0f));
        m.indices = {0, 1, 2, 0, 2, 3};
        return m;
    }

    hv::ShaderUniforms flat_uniforms(const glm::vec3& color, const glm::mat4& viewproj = glm::mat4(1.0f))
    {
        hv::ShaderUniforms u{};
        u.viewproj = viewproj;
        u.material.diffuse = color;
        u.lighting_enabled = false;
        return u;
    }

    hv::RasterizerConfig no_cull(hv::PrimitiveTopology topology = hv::PrimitiveTopology::Triangles)
    {
        hv::RasterizerConfig rc{};
        rc.cull_mode = hv::RasterizerCullMode::None;
        rc.topology = topology;
        return rc;
    }

    bool test_every_face_gets_exactly_one_region()
    {
        const hv::SegmentationThresholds t{};
        if (hv::classify_position(glm::vec3(0.0f, 1.5f, 0.0f), t) != hv::RegionLabel::Bridge) return false;
        if (hv::classify_position(glm::vec3(2.5f, 0.0f, 0.0f), t) != hv::RegionLabel::Nacelle) return false;
        if (hv::classify_position(glm::vec3(-2.5f, 0.0f, 0.0f), t) != hv::RegionLabel::Nacelle) return false;
        if (hv::classify_position(glm::vec3(1.2f, 0.0f, 0.0f), t) != hv::RegionLabel::Pylon) return false;
        if (hv::classify_position(glm::vec3(0.0f, -1.0f, 0.0f), t) != hv::RegionLabel::EngineeringHull) return false;
        if (hv::classify_position(glm::vec3(0.0f, 5.0f, 5.0f), t) != hv::RegionLabel::Saucer) return false;

        // Нэг bridge, нэг ямар ч band-д ороогүй face.
        hv::MeshData m{};
        m.positions = {
            glm::vec3(-0.1f, 1.5f, 0.0f), glm::vec3(0.1f, 1.5f, 0.0f), glm::vec3(0.0f, 1.5f, 0.1f),
            glm::vec3(-0.1f, 5.0f, 5.0f), glm::vec3(0.1f, 5.0f, 5.0f), glm::vec3(0.0f, 5.1f, 5.0f),
        };
        m.indices = {0, 1, 2, 3, 4, 5};
        const hv::SegmentationResult seg = hv::classify_faces(m, t);
        if (seg.face_count() != 2 || seg.faces.size() != 2) return false;
        if (seg.labels[0] != hv::RegionLabel::Bridge || seg.labels[1] != hv::RegionLabel::Saucer) return false;
        if (seg.count(hv::RegionLabel::Bridge) != 1 || seg.count(hv::RegionLabel::Saucer) != 1) return false;
        if (seg.fallback_count != 1) return false;
        if (!approx_eq(seg.faces[0].area, 0.01f)) return false;

        const hv::ViewerConfig cfg{};
        const auto ship = make_test_ship(cfg);
        if (!ship) return false;
        const hv::SegmentationResult& s = ship->segmentation;
        if (s.face_count() != ship->mesh.triangle_count()) return false;
        uint32_t total = 0;
        for (uint32_t c : s.counts) total += c;
        return total == s.face_count();
    }

    bool test_mesh_validation_and_preparation()
    {
        const hv::SegmentationThresholds t{};

        hv::MeshData bad_index{};
        bad_index.positions = {glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
        bad_index.indices = {0, 1, 5};
        const hv::Status s1 = hv::validate_mesh(bad_index);
        if (s1.ok || s1.error.find("vertex 5") == std::string::npos) return false;
        if (hv::prepare_mesh(bad_index, t).ok) return false;

        hv::MeshData ragged = bad_index;
        ragged.indices = {0, 1, 2, 0};
        if (hv::validate_mesh(ragged).ok) return false;
        if (hv::validate_mesh(hv::MeshData{}).ok) return false;

        hv::SegmentationThresholds broken = t;
        broken.saucer_y = hv::RangeBand{1.0f, -1.0f};
        hv::MeshData tri = bad_index;
        tri.indices = {0, 1, 2};
        if (hv::prepare_mesh(tri, broken).ok) return false;

        // Normal байхгүй бол талбайгаар жинлэн үүсгэнэ.
        hv::MeshData flat = tri;
        hv::generate_vertex_normals(flat);
        for (const glm::vec3& n : flat.normals)
        {
            if (!approx_vec(n, glm::vec3(0.0f, 0.0f, 1.0f))) return false;
        }

        hv::MeshData box = make_box(glm::vec3(2.0f, 1.0f, 1.0f));
        for (glm::vec3& p : box.positions) p.x += 10.0f;
        box.normals.clear();
        const hv::Result<std::shared_ptr<const hv::PreparedMesh>> prepared = hv::prepare_mesh(std::move(box), t);
        if (!prepared.ok || !prepared.value) return false;
        const hv::PreparedMesh& pm = *prepared.value;
        if (!pm.normals_generated) return false;
        if (pm.mesh.normals.size() != pm.mesh.positions.size()) return false;
        for (const glm::vec3& n : pm.mesh.normals)
        {
            if (!approx_eq(glm::length(n), 1.0f)) return false;
        }
        return
            approx_vec(pm.bounds.center(), glm::vec3(0.0f)) &&
            approx_eq(pm.bounds.max_extent(), 4.0f) &&
            approx_eq(pm.bounds.size().y, 2.0f);
    }

    bool test_face_coloring_modes()
    {
        const hv::ColoringParams params{};
        const glm::vec3 solid = hv::resolve_face_color(
            hv::ColoringMode::Solid, hv::RegionLabel::Nacelle, 1.0f, hv::ColorSchemeId::Battle, 0.0f, params);
        if (!approx_vec(solid, params.solid_color)) return false;

        for (uint8_t s = 0; s < hv::HV_COLOR_SCHEME_COUNT; ++s)
        {
            const hv::ColorSchemeId scheme = (hv::ColorSchemeId)s;
            const glm::vec3 region = hv::resolve_face_color(
                hv::ColoringMode::Region, hv::RegionLabel::Bridge, 0.0f, scheme, 0.0f, params);
            if (!approx_vec(region, hv::region_color(scheme, hv::RegionLabel::Bridge))) return false;
        }

        const glm::vec3 lit = hv::resolve_face_color(hv::ColoringMode::Angle, hv::RegionLabel::Saucer, 1.0f, hv::ColorSchemeId::Starfleet, 0.0f, params);
        const glm::vec3 dark = hv::resolve_face_color(hv::ColoringMode::Angle, hv::RegionLabel::Saucer, 0.0f, hv::ColorSchemeId::Starfleet, 0.0f, params);
        if (!approx_vec(lit, glm::vec3(1.0f)) || !approx_vec(dark, glm::vec3(0.2f))) return false;

        for (int i = 0; i < 50; ++i)
        {
            const float t = 0.37f * (float)i;
            for (size_t r = 0; r < hv::HV_REGION_COUNT; ++r)
            {
                const glm::vec3 c = hv::resolve_face_color(
                    hv::ColoringMode::Animated, (hv::RegionLabel)r, 0.5f, hv::ColorSchemeId::Exploration, t, params);
                if (glm::any(glm::lessThan(c, glm::vec3(0.0f))) || glm::any(glm::greaterThan(c, glm::vec3(1.0f)))) return false;
            }
        }

        if (!hv::coloring_uses_region_materials(hv::ColoringMode::Region)) return false;
        if (hv::coloring_uses_region_materials(hv::ColoringMode::Solid)) return false;

        const hv::ViewerConfig cfg{};
        const auto ship = make_test_ship(cfg);
        if (!ship) return false;
        std::vector<glm::vec3> colors{};
        hv::build_face_colors(ship->segmentation, hv::ColoringMode::Mixed, hv::ColorSchemeId::Starfleet, 0.0f, params, colors);
        return colors.size() == ship->segmentation.face_count();
    }

    bool test_animation_presets_lookup()
    {
        for (int n = 1; n <= 5; ++n)
        {
            const auto p = hv::find_animation_preset(n);
            if (!p || p->number != n || std::string(p->name).empty()) return false;
            if (p->global_speed < hv::HV_MIN_ANIMATION_SPEED || p->global_speed > hv::HV_MAX_ANIMATION_SPEED) return false;
        }
        return !hv::find_animation_preset(0) && !hv::find_animation_preset(6);
    }

    bool test_frame_plan_draw_order()
    {
        const hv::ViewerConfig cfg{};
        const hv::SceneAssets assets = hv::make_scene_assets(make_test_ship(cfg), cfg);
        if (!assets.model) return false;
        const hv::ViewerState state = hv::make_initial_viewer_state(cfg);

        const hv::FramePlan plan = hv::plan_frame(hv::FrameInputs{state, cfg, assets, 1.5f});
        if (!plan.transforms_valid || plan.draws.size() != 4) return false;
        if (plan.draws[0].kind != hv::DrawKind::Ground) return false;
        if (plan.draws[1].kind != hv::DrawKind::Shadow) return false;
        if (plan.draws[2].kind != hv::DrawKind::Mesh) return false;
        if (plan.draws[3].kind != hv::DrawKind::LightMarker) return false;
        if (plan.shadow_skipped) return false;
        if (plan.face_colors.size() != assets.model->segmentation.face_count()) return false;

        // Анхны гэрэл (5,5,5)-аас эх цэг рүү.
        if (!approx_vec(plan.light.direction, glm::normalize(glm::vec3(-1.0f)), 1e-3f)) return false;

        const hv::DrawCommand* shadow = plan.find(hv::DrawKind::Shadow);
        return
            shadow &&
            shadow->program == hv::DrawProgram::Flat &&
            !shadow->depth_write &&
            shadow->blend &&
            shadow->single_coverage &&
            shadow->depth_bias < 0.0f &&
            approx_eq(shadow->uniforms.alpha, cfg.shadow.alpha);
    }

    bool test_wireframe_changes_only_topology()
    {
        const hv::ViewerConfig cfg{};
        const hv::SceneAssets assets = hv::make_scene_assets(make_test_ship(cfg), cfg);
        if (!assets.model) return false;

        hv::ViewerState filled = hv::make_initial_viewer_state(cfg);
        filled.clock.advance(1.3f);
        hv::ViewerState wire = filled;
        wire.toggles.render_mode = hv::RenderMode::Wireframe;

        const hv::FramePlan a = hv::plan_frame(hv::FrameInputs{filled, cfg, assets, 1.5f});
        const hv::FramePlan b = hv::plan_frame(hv::FrameInputs{wire, cfg, assets, 1.5f});
        const hv::DrawCommand* ma = a.find(hv::DrawKind::Mesh);
        const hv::DrawCommand* mb = b.find(hv::DrawKind::Mesh);
        if (!ma || !mb) return false;
        if (ma->topology != hv::PrimitiveTopology::Triangles) return false;
        if (mb->topology != hv::PrimitiveTopology::Lines) return false;

        const hv::ShaderUniforms& ua = ma->uniforms;
        const hv::ShaderUniforms& ub = mb->uniforms;
        if (ua.model != ub.model || ua.viewproj != ub.viewproj || ua.normal_matrix != ub.normal_matrix) return false;
        if (ua.material.diffuse != ub.material.diffuse || ua.material.shininess != ub.material.shininess) return false;
        if (ua.light.direction != ub.light.direction || ua.lighting_enabled != ub.lighting_enabled) return false;
        if (ua.use_region_materials != ub.use_region_materials) return false;
        if (a.face_colors != b.face_colors) return false;
        if (a.draws.size() != b.draws.size()) return false;

        hv::ViewerState points = filled;
        points.toggles.render_mode = hv::RenderMode::Points;
        const hv::FramePlan c = hv::plan_frame(hv::FrameInputs{points, cfg, assets, 1.5f});
        const hv::DrawCommand* mc = c.find(hv::DrawKind::Mesh);
        return mc && mc->topology == hv::PrimitiveTopology::Points && mc->uniforms.model == ua.model;
    }

    bool test_shadow_skip_reasons()
    {
        const hv::ViewerConfig cfg{};
        const hv::SceneAssets assets = hv::make_scene_assets(make_test_ship(cfg), cfg);
        if (!assets.model) return false;
        const hv::ViewerState base = hv::make_initial_viewer_state(cfg);

        // Гэрэл target-тай ижил өндөрт: цацраг газартай параллель.
        hv::ViewerState level = base;
        level.manual_light_position = glm::vec3(5.0f, 0.0f, 0.0f);
        const hv::FramePlan p1 = hv::plan_frame(hv::FrameInputs{level, cfg, assets, 1.5f});
        if (p1.find(hv::DrawKind::Shadow)) return false;
        if (!p1.shadow_skipped || p1.shadow_skip_reason != hv::ShadowSkipReason::LightParallel) return false;
        // Сүүдэр алгассан ч mesh зурагдана.
        if (!p1.find(hv::DrawKind::Mesh) || !p1.find(hv::DrawKind::Ground)) return false;

        hv::ViewerState below = base;
        below.manual_light_position = glm::vec3(0.0f, -10.0f, 1.0f);
        const hv::FramePlan p2 = hv::plan_frame(hv::FrameInputs{below, cfg, assets, 1.5f});
        if (p2.find(hv::DrawKind::Shadow) || p2.shadow_skip_reason != hv::ShadowSkipReason::LightBelowPlane) return false;

        hv::ViewerState disabled = base;
        disabled.toggles.shadow_enabled = false;
        const hv::FramePlan p3 = hv::plan_frame(hv::FrameInputs{disabled, cfg, assets, 1.5f});
        if (p3.find(hv::DrawKind::Shadow) || p3.shadow_skipped) return false;
        if (p3.shadow_skip_reason != hv::ShadowSkipReason::Disabled) return false;

        hv::ViewerState unlit = base;
        unlit.toggles.lighting_enabled = false;
        unlit.toggles.ground_enabled = false;
        const hv::FramePlan p4 = hv::plan_frame(hv::FrameInputs{unlit, cfg, assets, 1.5f});
        if (p4.find(hv::DrawKind::LightMarker) || p4.find(hv::DrawKind::Ground)) return false;
        const hv::DrawCommand* mesh = p4.find(hv::DrawKind::Mesh);
        return mesh && !mesh->uniforms.lighting_enabled && p4.find(hv::DrawKind::Shadow);
    }

    bool test_invalid_transforms_draw_clear_only()
    {
        const hv::ViewerConfig cfg{};
        const hv::SceneAssets assets = hv::make_scene_assets(make_test_ship(cfg), cfg);
        const hv::ViewerState state = hv::make_initial_viewer_state(cfg);

        const hv::FramePlan zero = hv::plan_frame(hv::FrameInputs{state, cfg, assets, 0.0f});
        if (zero.transforms_valid || !zero.draws.empty()) return false;
        if (zero.shadow_skip_reason != hv::ShadowSkipReason::TransformsInvalid) return false;

        hv::ViewerState nan_cam = state;
        nan_cam.camera.pos.x = std::nanf("");
        const hv::FramePlan nan_plan = hv::plan_frame(hv::FrameInputs{nan_cam, cfg, assets, 1.5f});
        if (nan_plan.transforms_valid || !nan_plan.draws.empty()) return false;

        // Гүйцэтгэгч зөвхөн clear өнгө үлдээнэ.
        hv::SoftwareFrameExecutor exec(16, 12);
        const hv::FrameExecStats st = exec.execute(nan_plan);
        if (st.draws_executed != 0 || st.raster.fragments_written != 0) return false;
        const hv::ColorF c = exec.targets().color.color.at(8, 6);
        return approx_eq(c.r, cfg.clear_color.r) && approx_eq(c.g, cfg.clear_color.g) && approx_eq(c.b, cfg.clear_color.b);
    }

    bool test_scene_meshes_face_outward()
    {
        hv::GroundMeshDesc gd{};
        gd.size = 8.0f;
        gd.height = -2.5f;
        gd.subdivisions = 4;
        const hv::MeshData ground = hv::make_ground_mesh(gd);
        if (ground.positions.size() != 25 || ground.triangle_count() != 32) return false;
        for (const glm::vec3& p : ground.positions)
        {
            if (!approx_eq(p.y, gd.height) || std::abs(p.x) > 4.0f + 1e-4f || std::abs(p.z) > 4.0f + 1e-4f) return false;
        }

        hv::MarkerMeshDesc md{};
        md.radius = 0.5f;
        md.rings = 6;
        md.slices = 10;
        const hv::MeshData marker = hv::make_marker_sphere(md);
        if (marker.positions.size() != (size_t)(2 + 5 * 10)) return false;
        if (marker.triangle_count() != (size_t)(2 * 10 + 2 * 4 * 10)) return false;
        if (!hv::validate_mesh(marker).ok) return false;

        // Гурвалжин бүрийн normal нь гадагш (ground-д +Y, бөмбөлөгт төвөөс холдох).
        const auto faces_away = [](const hv::MeshData& m, const auto& outward)
        {
            for (size_t t = 0; t < m.triangle_count(); ++t)
            {
                const glm::vec3 a = m.positions[m.indices[t * 3 + 0]];
                const glm::vec3 b = m.positions[m.indices[t * 3 + 1]];
                const glm::vec3 c = m.positions[m.indices[t * 3 + 2]];
                const glm::vec3 fn = glm::cross(b - a, c - a);
                if (!(glm::dot(fn, outward((a + b + c) / 3.0f)) > 0.0f)) return false;
            }
            return true;
        };
        if (!faces_away(ground, [](const glm::vec3&) { return glm::vec3(0.0f, 1.0f, 0.0f); })) return false;
        return faces_away(marker, [](const glm::vec3& centroid) { return centroid; });
    }

    bool test_builtin_programs_split_lit_and_unlit()
    {
        if (hv::ShaderProgramSet{}.complete()) return false;
        const hv::ShaderProgramSet programs = hv::make_builtin_programs();
        if (!programs.complete()) return false;

        hv::ShaderUniforms u{};
        u.material.diffuse = glm::vec3(0.2f, 0.4f, 0.6f);
        u.lighting_enabled = true;

        // Гэрэл руу харсан ба эсрэг харсан хоёр fragment.
        hv::FragmentIn lit{};
        lit.world_pos = glm::vec3(0.0f, 0.0f, 5.0f);
        lit.normal_ws = -glm::normalize(u.light.direction);
        hv::FragmentIn unlit = lit;
        unlit.normal_ws = -lit.normal_ws;

        const hv::ShaderProgram& flat = programs.get(hv::DrawProgram::Flat);
        const hv::ColorF f0 = flat.fs(lit, u).color;
        const hv::ColorF f1 = flat.fs(unlit, u).color;
        if (!approx_eq(f0.r, 0.2f) || !approx_eq(f0.g, 0.4f) || !approx_eq(f0.b, 0.6f)) return false;
        if (!approx_eq(f0.r, f1.r) || !approx_eq(f0.g, f1.g) || !approx_eq(f0.b, f1.b)) return false;

        const hv::ShaderProgram& phong = programs.get(hv::DrawProgram::Phong);
        const hv::ColorF p0 = phong.fs(lit, u).color;
        const hv::ColorF p1 = phong.fs(unlit, u).color;
        return p0.r + p0.g + p0.b > p1.r + p1.g + p1.b + 0.1f;
    }

    bool test_rasterizer_topologies()
    {
        const int W = 32;
        const int H = 32;
        const hv::MeshData quad = make_quad(0.5f, 0.5f);
        const hv::ShaderProgram flat = hv::make_flat_program();
        const hv::ShaderUniforms u = flat_uniforms(glm::vec3(1.0f, 0.0f, 0.0f));

        hv::FrameTargets filled_rt(W, H, 0.1f, 100.0f);
        const hv::RasterizerStats filled = hv::rasterize_mesh(
            quad, flat, u, hv::RasterizerTarget{&filled_rt.color, &filled_rt.depth, &filled_rt.coverage}, no_cull());
        if (filled.tri_input != 2 || filled.tri_raster != 2) return false;
        if (filled.fragments_written < 150 || filled.fragments_written > 320) return false;
        const hv::ColorF center = filled_rt.color.color.at(W / 2, H / 2);
        const hv::ColorF corner = filled_rt.color.color.at(0, 0);
        if (!approx_eq(center.r, 1.0f) || !approx_eq(center.g, 0.0f)) return false;
        if (!approx_eq(corner.r, 0.0f)) return false;

        hv::FrameTargets lines_rt(W, H, 0.1f, 100.0f);
        const hv::RasterizerStats lines = hv::rasterize_mesh(
            quad, flat, u, hv::RasterizerTarget{&lines_rt.color, &lines_rt.depth, nullptr}, no_cull(hv::PrimitiveTopology::Lines));
        if (lines.lines_raster != 6) return false;
        if (lines.fragments_written == 0 || lines.fragments_written >= filled.fragments_written) return false;

        hv::FrameTargets points_rt(W, H, 0.1f, 100.0f);
        const hv::RasterizerStats points = hv::rasterize_mesh(
            quad, flat, u, hv::RasterizerTarget{&points_rt.color, &points_rt.depth, nullptr}, no_cull(hv::PrimitiveTopology::Points));
        // Хуваалцсан оройнууд нэг л удаа.
        if (points.points_raster != 4) return false;
        return points.fragments_written > 0 && points.fragments_written <= 16;
    }

    bool test_rasterizer_depth_test_keeps_nearest()
    {
        const int W = 33;
        const int H = 33;
        const glm::mat4 viewproj = hv::perspective_lh_no(glm::radians(90.0f), 1.0f, 0.1f, 100.0f);
        const hv::MeshData near_quad = make_quad(5.0f, 1.0f);
        const hv::MeshData far_quad = make_quad(10.0f, 1.0f);
        const hv::ShaderProgram flat = hv::make_flat_program();
        const hv::ShaderUniforms red = flat_uniforms(glm::vec3(1.0f, 0.0f, 0.0f), viewproj);
        const hv::ShaderUniforms green = flat_uniforms(glm::vec3(0.0f, 1.0f, 0.0f), viewproj);

        for (int order = 0; order < 2; ++order)
        {
            hv::FrameTargets rt(W, H, 0.1f, 100.0f);
            const hv::RasterizerTarget target{&rt.color, &rt.depth, nullptr};
            if (order == 0)
            {
                hv::rasterize_mesh(near_quad, flat, red, target, no_cull());
                hv::rasterize_mesh(far_quad, flat, green, target, no_cull());
            }
            else
            {
                hv::rasterize_mesh(far_quad, flat, green, target, no_cull());
                hv::rasterize_mesh(near_quad, flat, red, target, no_cull());
            }
            const hv::ColorF c = rt.color.color.at(W / 2, H / 2);
            if (!approx_eq(c.r, 1.0f) || !approx_eq(c.g, 0.0f)) return false;
            // Шугаман depth: view z = 5 -> (5 - 0.1) / 99.9
            if (!approx_eq(rt.depth.depth.at(W / 2, H / 2), (5.0f - 0.1f) / 99.9f, 1e-3f)) return false;
        }
        return true;
    }

    bool test_single_coverage_blends_once()
    {
        const int W = 32;
        const int H = 32;
        const hv::MeshData quad = make_quad(0.5f, 0.5f);
        const hv::ShaderProgram flat = hv::make_flat_program();
        hv::ShaderUniforms u = flat_uniforms(glm::vec3(1.0f, 0.0f, 0.0f));
        u.alpha = 0.5f;

        hv::RasterizerConfig rc = no_cull();
        rc.blend = true;
        rc.depth_write = false;
        rc.single_coverage = true;

        hv::FrameTargets rt(W, H, 0.1f, 100.0f);
        hv::rasterize_mesh(quad, flat, u, hv::RasterizerTarget{&rt.color, &rt.depth, &rt.coverage}, rc);

        // Диагональ дээрх пиксел хоёр гурвалжинд хамаарах ч нэг л удаа холигдоно.
        for (int i = 10; i < 22; ++i)
        {
            const hv::ColorF c = rt.color.color.at(i, i);
            if (!approx_eq(c.r, 0.5f)) return false;
        }
        return approx_eq(rt.depth.depth.at(W / 2, H / 2), 1.0f);
    }

    bool test_frame_runner_tick()
    {
        hv::ViewerConfig cfg{};
        cfg.window.surface_width = 64;
        cfg.window.surface_height = 48;
        hv::FrameRunner runner(cfg, make_test_ship(cfg));
        if (!approx_eq(runner.aspect(), 64.0f / 48.0f)) return false;

        hv::RuntimeInputLatch idle{};
        runner.tick(idle, 0.1f);
        if (!approx_eq((float)runner.state().clock.time, 0.1f)) return false;
        const hv::FrameExecStats& st = runner.executor().last_stats();
        if (st.draws_executed != runner.last_plan().draws.size()) return false;
        if (st.raster.fragments_written == 0) return false;

        hv::RuntimeInputLatch pause{};
        pause.key_presses.push_back(hv::KeyPress{hv::KeyCommand::TogglePause, 0});
        runner.tick(pause, 0.1f);
        runner.tick(idle, 0.1f);
        if (!runner.state().toggles.paused) return false;
        if (!approx_eq((float)runner.state().clock.time, 0.1f)) return false;
        if (runner.status_line().find("[paused]") == std::string::npos) return false;

        hv::RuntimeInputLatch unlit{};
        unlit.key_presses.push_back(hv::KeyPress{hv::KeyCommand::ToggleLighting, 0});
        const hv::FramePlan& plan = runner.tick(unlit, 0.1f);
        if (runner.state().toggles.lighting_enabled) return false;
        if (plan.find(hv::DrawKind::LightMarker)) return false;

        hv::RuntimeInputLatch quit{};
        quit.quit_requested = true;
        runner.tick(quit, 0.1f);
        return runner.quit_requested();
    }
}

int main()
{
    const bool ok_segment = test_every_face_gets_exactly_one_region();
    const bool ok_prep = test_mesh_validation_and_preparation();
    const bool ok_color = test_face_coloring_modes();
    const bool ok_presets = test_animation_presets_lookup();
    const bool ok_order = test_frame_plan_draw_order();
    const bool ok_wire = test_wireframe_changes_only_topology();
    const bool ok_shadow = test_shadow_skip_reasons();
    const bool ok_invalid = test_invalid_transforms_draw_clear_only();
    const bool ok_raster = test_rasterizer_topologies();
    const bool ok_depth = test_rasterizer_depth_test_keeps_nearest();
    const bool ok_cover = test_single_coverage_blends_once();
    const bool ok_runner = test_frame_runner_tick();
    const bool ok_meshes = test_scene_meshes_face_outward();
    const bool ok_programs = test_builtin_programs_split_lit_and_unlit();

    if (!ok_segment) std::fprintf(stderr, "[hv-tests] segmentation labelling failed\n");
    if (!ok_prep) std::fprintf(stderr, "[hv-tests] mesh validation/preparation failed\n");
    if (!ok_color) std::fprintf(stderr, "[hv-tests] face coloring modes failed\n");
    if (!ok_presets) std::fprintf(stderr, "[hv-tests] animation preset lookup failed\n");
    if (!ok_order) std::fprintf(stderr, "[hv-tests] frame plan draw order failed\n");
    if (!ok_wire) std::fprintf(stderr, "[hv-tests] wireframe topology-only change failed\n");
    if (!ok_shadow) std::fprintf(stderr, "[hv-tests] shadow skip reasons failed\n");
    if (!ok_invalid) std::fprintf(stderr, "[hv-tests] invalid transform clear-only frame failed\n");
    if (!ok_raster) std::fprintf(stderr, "[hv-tests] rasterizer topologies failed\n");
    if (!ok_depth) std::fprintf(stderr, "[hv-tests] rasterizer depth test failed\n");
    if (!ok_cover) std::fprintf(stderr, "[hv-tests] single coverage blending failed\n");
    if (!ok_runner) std::fprintf(stderr, "[hv-tests] frame runner tick failed\n");
    if (!ok_meshes) std::fprintf(stderr, "[hv-tests] scene mesh orientation failed\n");
    if (!ok_programs) std::fprintf(stderr, "[hv-tests] builtin program split failed\n");

    if (!(ok_segment && ok_prep && ok_color && ok_presets && ok_order && ok_wire &&
          ok_shadow && ok_invalid && ok_raster && ok_depth && ok_cover && ok_runner &&
          ok_meshes && ok_programs)) return 1;
    std::fprintf(stderr, "[hv-tests] render: all tests passed\n");
    return 0;
}
