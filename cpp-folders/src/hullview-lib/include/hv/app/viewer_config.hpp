#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: viewer_config.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Эхлэх үеийн бүх тохируулах утгууд нэг дор. Алгоритмын код literal тогтмол
            агуулахгүй, эндээс авна. Эхлэхдээ validate_viewer_config-оор шалгана.
*/


#include <cmath>
#include <string>

#include <glm/glm.hpp>

#include "hv/animation/light_motion.hpp"
#include "hv/animation/motion_controller.hpp"
#include "hv/app/toggle_state.hpp"
#include "hv/camera/camera_rig.hpp"
#include "hv/camera/free_camera.hpp"
#include "hv/core/result.hpp"
#include "hv/lighting/phong.hpp"
#include "hv/lighting/planar_shadow.hpp"
#include "hv/resources/mesh_prep.hpp"
#include "hv/scene/transform_stack.hpp"
#include "hv/segmentation/region_classifier.hpp"
#include "hv/segmentation/region_colors.hpp"

namespace hv
{
    struct LightParams
    {
        // Гэрлийн цацрагийн чиглэл (5,5,5) байрлалаас эх цэг рүү.
        glm::vec3 light_dir{-1.0f, -1.0f, -1.0f};
        glm::vec3 light_color{0.8f, 0.9f, 1.0f};
        glm::vec3 ambient{0.2f, 0.2f, 0.3f};
        glm::vec3 specular{1.0f, 1.0f, 1.0f};
        float intensity = 1.0f;
        // Гэрлийн байрлал = target - normalize(light_dir) * distance
        float distance = 8.660254f;
        glm::vec3 target{0.0f};
    };

    struct ShadowParams
    {
        glm::vec3 color{0.1f, 0.1f, 0.1f};
        float alpha = 0.8f;
        float lift = 0.01f;
        float depth_bias = 0.0005f;
        float parallel_eps = HV_SHADOW_PARALLEL_EPS;
    };

    struct GroundParams
    {
        float height = -3.0f;
        float size = 30.0f;
        int subdivisions = 6;
        glm::vec3 color{0.3f, 0.4f, 0.3f};
        PhongMaterial material{{0.3f, 0.4f, 0.3f}, {0.3f, 0.4f, 0.3f}, {0.1f, 0.1f, 0.1f}, 8.0f};
    };

    struct LightMarkerParams
    {
        float radius = 0.15f;
        glm::vec3 color{1.0f, 1.0f, 0.0f};
    };

    struct WindowParams
    {
        int width = 960;
        int height = 640;
        // Software rasterizer-ийн зураг цонхноос жижиг байж болно.
        int surface_width = 640;
        int surface_height = 427;
    };

    struct ViewerConfig
    {
        ProjectionParams projection{};
        CameraRig start_camera{glm::vec3(0.0f, 1.5f, 11.0f), -glm::half_pi<float>(), -0.12f};
        CameraControlParams camera_control{};
        LightParams light{};
        MotionParams motion{};
        LightMotionParams light_motion{};
        SegmentationThresholds segmentation{};
        ShadowParams shadow{};
        GroundParams ground{};
        LightMarkerParams light_marker{};
        PhongMaterial material{};
        ColoringParams coloring{};
        MeshPrepOptions mesh_prep{};
        ToggleState initial_toggles{};
        WindowParams window{};
        glm::vec3 clear_color{0.05f, 0.05f, 0.08f};
        float shininess_step = 8.0f;
        float speed_step = 0.5f;
        float speed_step_fine = 0.1f;
    };

    inline bool vec_is_finite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    inline DirectionalLight make_directional_light(const LightParams& p, const glm::vec3& direction)
    {
        DirectionalLight l{};
        l.direction = direction;
        l.ambient = p.ambient;
        l.diffuse = p.light_color;
        l.specular = p.specular;
        l.intensity = p.intensity;
        return l;
    }

    inline LightRig make_initial_light_rig(const ViewerConfig& cfg)
    {
        return make_light_rig(cfg.light.light_dir, cfg.light.distance, cfg.light.target);
    }

    inline GroundPlane make_config_ground_plane(const GroundParams& g)
    {
        return make_ground_plane(glm::vec3(0.0f, g.height, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    }

    inline Status validate_viewer_config(const ViewerConfig& c)
    {
        const ProjectionParams& p = c.projection;
        if (!std::isfinite(p.fov_y_deg) || !(p.fov_y_deg > 0.0f) || !(p.fov_y_deg < 180.0f))
        {
            return Status::failure("fov must be in (0, 180) degrees, got " + std::to_string(p.fov_y_deg));
        }
        if (!std::isfinite(p.z_near) || !(p.z_near > 0.0f)) return Status::failure("near must be positive");
        if (!std::isfinite(p.z_far) || !(p.z_far > p.z_near)) return Status::failure("far must be greater than near");

        if (!vec_is_finite(c.light.light_dir) || glm::length(c.light.light_dir) < 1e-6f)
        {
            return Status::failure("light_dir must be a finite non-zero vector");
        }
        if (!vec_is_finite(c.light.light_color) || glm::any(glm::lessThan(c.light.light_color, glm::vec3(0.0f))))
        {
            return Status::failure("light_color must be finite and non-negative");
        }
        if (!std::isfinite(c.light.intensity) || c.light.intensity < 0.0f) return Status::failure("light intensity must be non-negative");
        if (!(c.light.distance > 0.0f)) return Status::failure("light distance must be positive");

        const MotionParams& m = c.motion;
        if (!std::isfinite(m.orbit_radius) || m.orbit_radius < 0.0f) return Status::failure("orbit_radius must be non-negative");
        if (!std::isfinite(m.orbit_speed)) return Status::failure("orbit_speed must be finite");
        if (!std::isfinite(m.bob_amplitude) || m.bob_amplitude < 0.0f) return Status::failure("bob_amplitude must be non-negative");
        if (!std::isfinite(m.bob_speed)) return Status::failure("bob_speed must be finite");
        if (!std::isfinite(m.figure8_radius) || m.figure8_radius < 0.0f) return Status::failure("figure8_radius must be non-negative");
        if (!std::isfinite(m.figure8_speed)) return Status::failure("figure8_speed must be finite");
        if (!motion_mode_valid((uint8_t)c.initial_toggles.motion_mode)) return Status::failure("unsupported motion_mode");

        const Status seg = validate_segmentation_thresholds(c.segmentation);
        if (!seg.ok) return seg;

        if (!(c.shadow.parallel_eps > 0.0f)) return Status::failure("shadow parallel epsilon must be positive");
        if (c.shadow.alpha < 0.0f || c.shadow.alpha > 1.0f) return Status::failure("shadow alpha must be in [0, 1]");
        if (!(c.ground.size > 0.0f)) return Status::failure("ground size must be positive");
        if (!(c.camera_control.pitch_limit_deg > 0.0f) || c.camera_control.pitch_limit_deg >= 90.0f)
        {
            return Status::failure("pitch limit must be in (0, 90) degrees");
        }
        if (c.window.width <= 0 || c.window.height <= 0 || c.window.surface_width <= 0 || c.window.surface_height <= 0)
        {
            return Status::failure("window and surface sizes must be positive");
        }
        if (!(c.mesh_prep.target_extent > 0.0f)) return Status::failure("mesh target extent must be positive");
        return Status::success();
    }
}
