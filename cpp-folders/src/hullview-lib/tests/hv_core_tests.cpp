#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "hv/animation/light_motion.hpp"
#include "hv/animation/motion_controller.hpp"
#include "hv/camera/camera_rig.hpp"
#include "hv/camera/convention.hpp"
#include "hv/camera/free_camera.hpp"
#include "hv/core/time.hpp"
#include "hv/lighting/phong.hpp"
#include "hv/lighting/planar_shadow.hpp"
#include "hv/scene/pose.hpp"
#include "hv/scene/transform_stack.hpp"

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

    bool approx_identity(const glm::mat4& m, float eps = 1e-4f)
    {
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (!approx_eq(m[c][r], (c == r) ? 1.0f : 0.0f, eps)) return false;
            }
        }
        return true;
    }

    bool test_back_facing_surfaces_get_no_diffuse()
    {
        const hv::PhongMaterial mat{};
        const hv::DirectionalLight light{};
        const glm::vec3 v{0.0f, 0.0f, 1.0f};
        const glm::vec3 normals[] = {
            {0.0f, 1.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            glm::normalize(glm::vec3(1.0f, 2.0f, -3.0f)),
            glm::normalize(glm::vec3(-0.3f, 0.2f, 0.9f)),
        };
        for (const glm::vec3& n : normals)
        {
            const glm::vec3 tangent = glm::normalize(glm::cross(n, std::abs(n.y) < 0.9f ? glm::vec3(0, 1, 0) : glm::vec3(1, 0, 0)));
            const glm::vec3 ls[] = {-n, glm::normalize(-n + tangent * 0.5f), glm::normalize(-n * 0.1f + tangent)};
            for (const glm::vec3& l : ls)
            {
                if (!(glm::dot(n, l) < 0.0f)) return false;
                const hv::PhongTerms t = hv::evaluate_phong(n, l, v, mat, light);
                if (t.diffuse != glm::vec3(0.0f)) return false;
                if (t.specular != glm::vec3(0.0f)) return false;
            }
        }

        // N.L = 0 яг перпендикуляр.
        const glm::vec3 grazing[][2] = {
            {{0.0f, 1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}},
            {{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}},
        };
        for (const auto& pair : grazing)
        {
            const hv::PhongTerms t = hv::evaluate_phong(pair[0], pair[1], v, mat, light);
            if (t.diffuse != glm::vec3(0.0f) || t.specular != glm::vec3(0.0f)) return false;
        }
        return true;
    }

    bool test_phong_terms_for_head_on_light()
    {
        hv::PhongMaterial mat{};
        mat.ambient = glm::vec3(0.1f);
        mat.diffuse = glm::vec3(0.5f);
        mat.specular = glm::vec3(1.0f);
        mat.shininess = 16.0f;
        hv::DirectionalLight light{};
        light.ambient = glm::vec3(1.0f);
        light.diffuse = glm::vec3(1.0f);
        light.specular = glm::vec3(1.0f);

        const glm::vec3 n{0.0f, 1.0f, 0.0f};
        const hv::PhongTerms t = hv::evaluate_phong(n, n, n, mat, light);
        if (!approx_vec(t.ambient, glm::vec3(0.1f))) return false;
        if (!approx_vec(t.diffuse, glm::vec3(0.5f))) return false;
        if (!approx_vec(t.specular, glm::vec3(1.0f))) return false;

        // Light direction is the direction of travel: straight down lights an up-facing surface.
        light.direction = glm::vec3(0.0f, -1.0f, 0.0f);
        if (!approx_vec(hv::light_vector_to_surface(light), n)) return false;
        return true;
    }

    bool test_disabled_lighting_is_a_hard_branch()
    {
        hv::SurfaceSample s{};
        s.normal_ws = glm::vec3(0.0f, 1.0f, 0.0f);
        s.camera_pos = glm::vec3(0.0f, 5.0f, 5.0f);
        s.material.diffuse = glm::vec3(0.2f, 0.4f, 0.6f);

        hv::DirectionalLight dark{};
        dark.intensity = 0.0f;
        dark.ambient = glm::vec3(0.0f);

        const glm::vec3 off = hv::shade_surface(s, dark, false);
        if (!approx_vec(off, s.material.diffuse)) return false;
        const glm::vec3 dark_on = hv::shade_surface(s, dark, true);
        if (!approx_vec(dark_on, glm::vec3(0.0f))) return false;
        return !approx_vec(off, dark_on);
    }

    bool test_normal_matrix_keeps_normals_perpendicular_under_nonuniform_scale()
    {
        hv::Pose p{};
        p.scale = glm::vec3(3.0f, 0.5f, 1.0f);
        p.yaw = 0.7f;
        p.pitch = -0.2f;

        const glm::mat4 model = hv::pose_to_matrix(p);
        const glm::mat3 nm = hv::normal_matrix(model);

        // 45 градусын хавтгай: normal (1,1,0)/sqrt2, tangent (1,-1,0)/sqrt2.
        const glm::vec3 n = glm::normalize(glm::vec3(1.0f, 1.0f, 0.0f));
        const glm::vec3 tangent = glm::normalize(glm::vec3(1.0f, -1.0f, 0.0f));
        const glm::vec3 n_ws = glm::normalize(nm * n);
        const glm::vec3 t_ws = glm::normalize(glm::vec3(model * glm::vec4(tangent, 0.0f)));
        if (!approx_eq(glm::dot(n_ws, t_ws), 0.0f)) return false;

        // Энгийн model 3x3 ашиглавал перпендикуляр биш болно.
        const glm::vec3 naive = glm::normalize(glm::mat3(model) * n);
        return std::abs(glm::dot(naive, t_ws)) > 1e-2f;
    }

    bool test_view_is_inverse_of_camera_world()
    {
        const hv::CameraRig rigs[] = {
            hv::CameraRig{},
            hv::CameraRig{glm::vec3(3.0f, -2.0f, 7.0f), 0.3f, 0.4f},
            hv::CameraRig{glm::vec3(-10.0f, 4.0f, 0.5f), 2.5f, -1.2f},
        };
        for (const hv::CameraRig& cam : rigs)
        {
            const glm::mat4 view = hv::view_from_camera(cam);
            if (!approx_identity(view * hv::camera_world_matrix(cam))) return false;
            if (!approx_identity(view * glm::inverse(view))) return false;

            // Камерын байрлал view space-ийн эх цэг, forward нь +Z.
            const glm::vec4 origin = view * glm::vec4(cam.pos, 1.0f);
            if (!approx_vec(glm::vec3(origin), glm::vec3(0.0f))) return false;
            const glm::vec4 ahead = view * glm::vec4(cam.pos + cam.forward() * 2.0f, 1.0f);
            if (!approx_vec(glm::vec3(ahead), glm::vec3(0.0f, 0.0f, 2.0f))) return false;

            const glm::mat4 ref = hv::look_at_lh(cam.pos, cam.pos + cam.forward(), hv::world_up());
            for (int c = 0; c < 4; ++c)
            {
                for (int r = 0; r < 4; ++r)
                {
                    if (!approx_eq(view[c][r], ref[c][r])) return false;
                }
            }
        }
        return true;
    }

    bool test_frame_transforms_flag_degenerate_input()
    {
        const hv::Pose pose{};
        const hv::CameraRig cam{};
        const hv::ProjectionParams proj{};

        const hv::FrameTransforms ok = hv::build_frame_transforms(pose, cam, proj, 1.5f);
        if (!ok.valid) return false;

        if (hv::build_frame_transforms(pose, cam, proj, 0.0f).valid) return false;

        hv::Pose bad = pose;
        bad.position.x = std::numeric_limits<float>::quiet_NaN();
        if (hv::build_frame_transforms(bad, cam, proj, 1.5f).valid) return false;

        hv::CameraRig bad_cam = cam;
        bad_cam.pos.z = std::numeric_limits<float>::infinity();
        return !hv::build_frame_transforms(pose, bad_cam, proj, 1.5f).valid;
    }

    bool test_shadow_projection_straight_down()
    {
        const hv::GroundPlane plane = hv::make_ground_plane(glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::vec3 light_dir{0.0f, -1.0f, 0.0f};

        const std::optional<glm::vec3> p = hv::project_point_to_plane(glm::vec3(2.0f, 3.0f, 0.0f), light_dir, plane);
        if (!p || !approx_vec(*p, glm::vec3(2.0f, 0.0f, 0.0f))) return false;

        const std::optional<glm::mat4> m = hv::make_planar_shadow_matrix(light_dir, plane);
        if (!m) return false;
        const glm::vec4 q = (*m) * glm::vec4(2.0f, 3.0f, 0.0f, 1.0f);
        return approx_vec(glm::vec3(q) / q.w, glm::vec3(2.0f, 0.0f, 0.0f));
    }

    bool test_shadow_projection_is_idempotent()
    {
        const hv::GroundPlane plane = hv::make_ground_plane(glm::vec3(0.0f, -3.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::vec3 light_dir = glm::normalize(glm::vec3(-1.0f, -1.0f, -0.5f));
        const std::optional<glm::mat4> m = hv::make_planar_shadow_matrix(light_dir, plane);
        if (!m) return false;

        const glm::vec3 points[] = {{1.0f, 2.0f, 3.0f}, {-4.0f, 0.5f, 2.0f}, {0.0f, -3.0f, 0.0f}, {7.0f, 10.0f, -2.0f}};
        for (const glm::vec3& p : points)
        {
            const std::optional<glm::vec3> once = hv::project_point_to_plane(p, light_dir, plane);
            if (!once) return false;
            if (!approx_eq(hv::signed_distance_to_plane(*once, plane), 0.0f)) return false;
            const std::optional<glm::vec3> twice = hv::project_point_to_plane(*once, light_dir, plane);
            if (!twice || !approx_vec(*once, *twice)) return false;

            // Матриц хэлбэр ч мөн адил.
            const glm::vec4 a = (*m) * glm::vec4(p, 1.0f);
            const glm::vec4 b = (*m) * a;
            if (!approx_vec(glm::vec3(a), *once)) return false;
            if (!approx_vec(glm::vec3(b), glm::vec3(a))) return false;
        }
        return true;
    }

    bool test_shadow_skipped_when_light_grazes_plane()
    {
        const hv::GroundPlane plane{};
        const glm::vec3 grazing{1.0f, 0.0f, 0.0f};
        if (!hv::light_parallel_to_plane(grazing, plane)) return false;
        if (hv::make_planar_shadow_matrix(grazing, plane).has_value()) return false;
        if (hv::project_point_to_plane(glm::vec3(1.0f), grazing, plane).has_value()) return false;
        // Epsilon-оос бага хазайлт ч мөн алгасагдана.
        if (hv::make_planar_shadow_matrix(glm::vec3(1.0f, -1e-4f, 0.0f), plane).has_value()) return false;
        return hv::make_planar_shadow_matrix(glm::vec3(1.0f, -0.1f, 0.0f), plane).has_value();
    }

    bool test_point_light_shadow_matrix()
    {
        const hv::GroundPlane plane = hv::make_ground_plane(glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const std::optional<glm::mat4> m = hv::make_point_light_shadow_matrix(glm::vec4(0.0f, 10.0f, 0.0f, 1.0f), plane);
        if (!m) return false;
        const glm::vec4 q = (*m) * glm::vec4(1.0f, 5.0f, 0.0f, 1.0f);
        if (!approx_vec(glm::vec3(q) / q.w, glm::vec3(2.0f, 0.0f, 0.0f))) return false;

        // Гэрэл хавтгай дээр байвал тодорхойгүй.
        return !hv::make_point_light_shadow_matrix(glm::vec4(3.0f, 0.0f, 1.0f, 1.0f), plane).has_value();
    }

    bool test_orbital_motion_is_periodic()
    {
        hv::MotionParams p{};
        p.orbit_radius = 3.0f;
        p.orbit_speed = 0.75f;
        p.base_height = 1.0f;
        const float period = glm::two_pi<float>() / p.orbit_speed;
        const float times[] = {0.0f, 0.4f, 1.3f, 5.0f};
        for (float t : times)
        {
            const hv::Pose a = hv::evaluate_object_pose(hv::MotionMode::Orbital, t, p, hv::Pose{});
            const hv::Pose b = hv::evaluate_object_pose(hv::MotionMode::Orbital, t + period, p, hv::Pose{});
            if (!approx_vec(a.position, b.position, 1e-3f)) return false;
            if (!approx_eq(glm::length(glm::vec2(a.position.x, a.position.z)), p.orbit_radius, 1e-3f)) return false;
            if (!approx_eq(a.position.y, p.base_height)) return false;
        }
        // t = 0: (R, y0, 0), tangent +Z тул yaw = 0.
        const hv::Pose start = hv::orbital_pose(0.0f, p, hv::Pose{});
        return approx_vec(start.position, glm::vec3(3.0f, 1.0f, 0.0f)) && approx_eq(start.yaw, 0.0f);
    }

    bool test_bobbing_height_scenario()
    {
        hv::MotionParams p{};
        p.bob_amplitude = 1.0f;
        p.bob_speed = glm::pi<float>();
        p.base_height = 5.0f;

        hv::Pose manual{};
        manual.position = glm::vec3(1.5f, 0.0f, -2.0f);
        const hv::Pose out = hv::evaluate_object_pose(hv::MotionMode::Bobbing, 0.5f, p, manual);
        if (!approx_eq(out.position.y, 6.0f)) return false;
        return approx_eq(out.position.x, 1.5f) && approx_eq(out.position.z, -2.0f);
    }

    bool test_figure_eight_and_none_modes()
    {
        hv::MotionParams p{};
        p.figure8_radius = 2.0f;
        p.figure8_speed = 1.0f;
        const hv::Pose origin = hv::evaluate_object_pose(hv::MotionMode::FigureEight, 0.0f, p, hv::Pose{});
        if (!approx_vec(origin.position, glm::vec3(0.0f))) return false;
        const hv::Pose lobe = hv::evaluate_object_pose(hv::MotionMode::FigureEight, glm::half_pi<float>(), p, hv::Pose{});
        if (!approx_vec(lobe.position, glm::vec3(2.0f, 0.0f, 0.0f))) return false;
        // Хоёр дахь гогцоо эсрэг талд.
        const hv::Pose other = hv::evaluate_object_pose(hv::MotionMode::FigureEight, 1.5f * glm::pi<float>(), p, hv::Pose{});
        if (!approx_vec(other.position, glm::vec3(-2.0f, 0.0f, 0.0f))) return false;

        hv::Pose manual{};
        manual.position = glm::vec3(4.0f, 2.0f, 1.0f);
        manual.yaw = 0.3f;
        const hv::Pose held = hv::evaluate_object_pose(hv::MotionMode::None, 12.0f, p, manual);
        if (!approx_vec(held.position, manual.position) || !approx_eq(held.yaw, manual.yaw)) return false;

        return hv::next_motion_mode(hv::MotionMode::None) == hv::MotionMode::Orbital &&
               hv::motion_mode_valid(3) && !hv::motion_mode_valid(4);
    }

    bool test_light_motion()
    {
        const hv::LightMotionParams p{};
        const glm::vec3 manual{5.0f, 5.0f, 5.0f};
        if (!approx_vec(hv::evaluate_light_position(hv::LightMotionFlags{}, 3.0f, p, manual), manual)) return false;

        hv::LightMotionFlags orbit{};
        orbit.orbit = true;
        const glm::vec3 o = hv::evaluate_light_position(orbit, 0.0f, p, manual);
        if (!approx_vec(o, glm::vec3(p.orbit_radius, p.orbit_center.y, 0.0f))) return false;

        // Савлалт өндрийг доод хязгаараас доош буулгахгүй.
        hv::LightMotionFlags bob{};
        bob.bob = true;
        const glm::vec3 low{0.0f, 0.2f, 0.0f};
        const float quarter = 0.75f / p.bob_frequency;
        const glm::vec3 b = hv::evaluate_light_position(bob, quarter, p, low);
        if (!approx_eq(b.y, p.min_height)) return false;

        glm::vec3 n = hv::nudge_light_position(glm::vec3(0.0f, 0.5f, 0.0f), hv::LightNudge::Down, p);
        if (!approx_eq(n.y, p.nudge_min_height)) return false;
        n = hv::nudge_light_position(n, hv::LightNudge::Forward, p);
        if (!approx_eq(n.z, -p.nudge_step)) return false;

        const hv::LightRig rig = hv::make_light_rig(glm::vec3(-1.0f, -1.0f, -1.0f), 8.660254f);
        if (!approx_vec(rig.position, glm::vec3(5.0f), 1e-3f)) return false;
        return approx_vec(rig.direction(), glm::normalize(glm::vec3(-1.0f)));
    }

    bool test_frame_clock_clamps_and_starts_at_zero()
    {
        hv::FrameClock c{};
        c.tick_hz = 1000.0;
        if (c.begin_frame(1000) != 0.0f) return false;
        if (!approx_eq(c.begin_frame(1016), 0.016f)) return false;
        // Урт завсарлага max_dt-ээр хязгаарлагдана.
        if (!approx_eq(c.begin_frame(6016), hv::HV_MAX_FRAME_DT)) return false;
        if (c.begin_frame(10) != 0.0f) return false;

        hv::AnimationClock a{};
        a.advance(0.5f);
        a.set_speed(2.0f);
        a.advance(0.25f);
        if (!approx_eq(a.seconds(), 1.0f)) return false;
        a.adjust_speed(100.0f);
        if (!approx_eq(a.speed, hv::HV_MAX_ANIMATION_SPEED)) return false;
        a.set_speed(0.0f);
        if (!approx_eq(a.speed, hv::HV_MIN_ANIMATION_SPEED)) return false;
        a.advance(-1.0f);
        a.reset();
        return a.time == 0.0 && approx_eq(a.speed, 1.0f);
    }

    bool test_camera_pitch_is_clamped_and_motion_scales_with_dt()
    {
        hv::CameraControlParams params{};
        hv::CameraRig cam{};
        for (int i = 0; i < 200; ++i) cam = hv::apply_camera_look(cam, 0.0f, -60.0f, params);
        if (cam.pitch > glm::radians(params.pitch_limit_deg) + 1e-5f) return false;
        if (!std::isfinite(glm::length(cam.right()))) return false;

        // Spike-ийг хаяна.
        const hv::CameraRig before = cam;
        cam = hv::apply_camera_look(cam, 500.0f, 0.0f, params);
        if (!approx_eq(cam.yaw, before.yaw)) return false;

        hv::RuntimeInputLatch in{};
        in.forward = true;
        const hv::CameraRig start{};
        const hv::CameraRig a = hv::apply_camera_input(start, in, params, 0.5f);
        hv::CameraRig b = start;
        for (int i = 0; i < 5; ++i) b = hv::apply_camera_input(b, in, params, 0.1f);
        if (!approx_vec(a.pos, b.pos)) return false;
        if (!approx_eq(glm::length(a.pos - start.pos), params.move_speed * 0.5f)) return false;

        // Товч дараагүй үед хулганы хөдөлгөөн эргүүлэхгүй.
        hv::RuntimeInputLatch look{};
        look.mouse_dx_accum = 20.0f;
        const hv::CameraRig c = hv::apply_camera_input(start, look, params, 0.016f);
        return approx_eq(c.yaw, start.yaw);
    }
}

int main()
{
    const bool ok_back = test_back_facing_surfaces_get_no_diffuse();
    const bool ok_phong = test_phong_terms_for_head_on_light();
    const bool ok_unlit = test_disabled_lighting_is_a_hard_branch();
    const bool ok_normal = test_normal_matrix_keeps_normals_perpendicular_under_nonuniform_scale();
    const bool ok_view = test_view_is_inverse_of_camera_world();
    const bool ok_degenerate = test_frame_transforms_flag_degenerate_input();
    const bool ok_shadow_down = test_shadow_projection_straight_down();
    const bool ok_shadow_idem = test_shadow_projection_is_idempotent();
    const bool ok_shadow_skip = test_shadow_skipped_when_light_grazes_plane();
    const bool ok_point_shadow = test_point_light_shadow_matrix();
    const bool ok_orbit = test_orbital_motion_is_periodic();
    const bool ok_bob = test_bobbing_height_scenario();
    const bool ok_fig8 = test_figure_eight_and_none_modes();
    const bool ok_light = test_light_motion();
    const bool ok_clock = test_frame_clock_clamps_and_starts_at_zero();
    const bool ok_camera = test_camera_pitch_is_clamped_and_motion_scales_with_dt();

    if (!ok_back) std::fprintf(stderr, "[hv-tests] back-facing diffuse check failed\n");
    if (!ok_phong) std::fprintf(stderr, "[hv-tests] phong head-on terms failed\n");
    if (!ok_unlit) std::fprintf(stderr, "[hv-tests] lighting-disabled branch failed\n");
    if (!ok_normal) std::fprintf(stderr, "[hv-tests] normal matrix under non-uniform scale failed\n");
    if (!ok_view) std::fprintf(stderr, "[hv-tests] view/camera-world inverse failed\n");
    if (!ok_degenerate) std::fprintf(stderr, "[hv-tests] degenerate transform detection failed\n");
    if (!ok_shadow_down) std::fprintf(stderr, "[hv-tests] straight-down shadow projection failed\n");
    if (!ok_shadow_idem) std::fprintf(stderr, "[hv-tests] shadow projection idempotence failed\n");
    if (!ok_shadow_skip) std::fprintf(stderr, "[hv-tests] grazing light shadow skip failed\n");
    if (!ok_point_shadow) std::fprintf(stderr, "[hv-tests] point light shadow matrix failed\n");
    if (!ok_orbit) std::fprintf(stderr, "[hv-tests] orbital periodicity failed\n");
    if (!ok_bob) std::fprintf(stderr, "[hv-tests] bobbing height scenario failed\n");
    if (!ok_fig8) std::fprintf(stderr, "[hv-tests] figure-eight / none modes failed\n");
    if (!ok_light) std::fprintf(stderr, "[hv-tests] light motion failed\n");
    if (!ok_clock) std::fprintf(stderr, "[hv-tests] frame/animation clock failed\n");
    if (!ok_camera) std::fprintf(stderr, "[hv-tests] free camera controls failed\n");

    if (!(ok_back && ok_phong && ok_unlit && ok_normal && ok_view && ok_degenerate &&
          ok_shadow_down && ok_shadow_idem && ok_shadow_skip && ok_point_shadow &&
          ok_orbit && ok_bob && ok_fig8 && ok_light && ok_clock && ok_camera)) return 1;
    std::fprintf(stderr, "[hv-tests] core: all tests passed\n");
    return 0;
}
