#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: config_overrides.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: ViewerConfig-ийн анхны утгууд дээр key=value командын мөрийн override.
            Үл мэдэгдэх түлхүүр, уншигдахгүй утга нь тохиргооны алдаа.
*/


#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "hv/app/viewer_config.hpp"
#include "hv/core/log.hpp"
#include "hv/core/result.hpp"

namespace hv
{
    struct ViewerArgs
    {
        std::string mesh_path{};
        ViewerConfig config{};
        LogLevel log_level = LogLevel::Info;
    };

    namespace detail
    {
        inline bool parse_float(std::string_view s, float& out)
        {
            if (s.empty()) return false;
            const std::string tmp(s);
            char* end = nullptr;
            errno = 0;
            const float v = std::strtof(tmp.c_str(), &end);
            if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
            out = v;
            return true;
        }

        inline bool parse_int(std::string_view s, int& out)
        {
            if (s.empty()) return false;
            const std::string tmp(s);
            char* end = nullptr;
            errno = 0;
            const long v = std::strtol(tmp.c_str(), &end, 10);
            if (errno != 0 || end != tmp.c_str() + tmp.size()) return false;
            // int-ийн мужаас гарсан утгыг таслахгүй, татгалзана.
            if (v < (long)std::numeric_limits<int>::min() || v > (long)std::numeric_limits<int>::max()) return false;
            out = (int)v;
            return true;
        }

        inline bool parse_float_list(std::string_view s, std::vector<float>& out)
        {
            out.clear();
            size_t start = 0;
            while (start <= s.size())
            {
                const size_t comma = s.find(',', start);
                const std::string_view item = s.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
                float v = 0.0f;
                if (!parse_float(item, v)) return false;
                out.push_back(v);
                if (comma == std::string_view::npos) break;
                start = comma + 1;
            }
            return true;
        }

        inline bool parse_vec3(std::string_view s, glm::vec3& out)
        {
            std::vector<float> v{};
            if (!parse_float_list(s, v) || v.size() != 3) return false;
            out = glm::vec3(v[0], v[1], v[2]);
            return true;
        }

        inline bool parse_bool(std::string_view s, bool& out)
        {
            if (s == "on" || s == "true" || s == "1") { out = true; return true; }
            if (s == "off" || s == "false" || s == "0") { out = false; return true; }
            return false;
        }

        inline Status bad_value(std::string_view key, std::string_view value)
        {
            return Status::failure("invalid value for '" + std::string(key) + "': '" + std::string(value) + "'");
        }
    }

    inline Status apply_config_override(ViewerArgs& args, std::string_view key, std::string_view value)
    {
        ViewerConfig& c = args.config;
        const auto f = [&](float& dst) { return detail::parse_float(value, dst) ? Status::success() : detail::bad_value(key, value); };
        const auto v3 = [&](glm::vec3& dst) { return detail::parse_vec3(value, dst) ? Status::success() : detail::bad_value(key, value); };
        const auto b = [&](bool& dst) { return detail::parse_bool(value, dst) ? Status::success() : detail::bad_value(key, value); };
        const auto i = [&](int& dst) { return detail::parse_int(value, dst) ? Status::success() : detail::bad_value(key, value); };

        if (key == "fov") return f(c.projection.fov_y_deg);
        if (key == "near") return f(c.projection.z_near);
        if (key == "far") return f(c.projection.z_far);
        if (key == "light_dir") return v3(c.light.light_dir);
        if (key == "light_color") return v3(c.light.light_color);
        if (key == "light_intensity") return f(c.light.intensity);
        if (key == "orbit_radius") return f(c.motion.orbit_radius);
        if (key == "orbit_speed") return f(c.motion.orbit_speed);
        if (key == "bob_amplitude") return f(c.motion.bob_amplitude);
        if (key == "bob_speed") return f(c.motion.bob_speed);
        if (key == "base_height") return f(c.motion.base_height);
        if (key == "figure8_radius") return f(c.motion.figure8_radius);
        if (key == "figure8_speed") return f(c.motion.figure8_speed);
        if (key == "ground_height") return f(c.ground.height);
        if (key == "width") return i(c.window.width);
        if (key == "height") return i(c.window.height);
        if (key == "lighting") return b(c.initial_toggles.lighting_enabled);
        if (key == "shadow") return b(c.initial_toggles.shadow_enabled);
        if (key == "ground") return b(c.initial_toggles.ground_enabled);
        if (key == "segmentation_thresholds")
        {
            std::vector<float> vals{};
            if (!detail::parse_float_list(value, vals)) return detail::bad_value(key, value);
            const Result<SegmentationThresholds> t = segmentation_thresholds_from_array(vals);
            if (!t.ok) return Status::failure(t.error);
            c.segmentation = t.value;
            return Status::success();
        }
        if (key == "motion")
        {
            const auto m = motion_mode_from_name(value);
            if (!m) return Status::failure("unsupported motion_mode '" + std::string(value) + "'");
            c.initial_toggles.motion_mode = *m;
            return Status::success();
        }
        if (key == "render")
        {
            const auto m = render_mode_from_name(value);
            if (!m) return Status::failure("unsupported render_mode '" + std::string(value) + "'");
            c.initial_toggles.render_mode = *m;
            return Status::success();
        }
        if (key == "coloring")
        {
            const auto m = coloring_mode_from_name(value);
            if (!m) return Status::failure("unsupported coloring mode '" + std::string(value) + "'");
            c.initial_toggles.coloring_mode = *m;
            return Status::success();
        }
        if (key == "scheme")
        {
            const auto m = color_scheme_from_name(value);
            if (!m) return Status::failure("unsupported color scheme '" + std::string(value) + "'");
            c.initial_toggles.color_scheme = *m;
            return Status::success();
        }
        if (key == "log")
        {
            if (value == "debug") args.log_level = LogLevel::Debug;
            else if (value == "info") args.log_level = LogLevel::Info;
            else if (value == "warn") args.log_level = LogLevel::Warn;
            else if (value == "error") args.log_level = LogLevel::Error;
            else return detail::bad_value(key, value);
            return Status::success();
        }
        return Status::failure("unknown option '" + std::string(key) + "'");
    }

    /*
        hullview_viewer <mesh.obj> [key=value ...]
        Эхний '=' агуулаагүй аргумент нь mesh-ийн зам. "--key=value" хэлбэрийг ч хүлээн авна.
    */
    inline Result<ViewerArgs> parse_viewer_args(int argc, const char* const* argv)
    {
        ViewerArgs out{};
        for (int a = 1; a < argc; ++a)
        {
            std::string_view arg(argv[a] ? argv[a] : "");
            if (arg.substr(0, 2) == "--") arg.remove_prefix(2);
            const size_t eq = arg.find('=');
            if (eq == std::string_view::npos)
            {
                if (!out.mesh_path.empty())
                {
                    return Result<ViewerArgs>::failure("unexpected extra argument '" + std::string(arg) + "'");
                }
                out.mesh_path = std::string(arg);
                continue;
            }
            const Status s = apply_config_override(out, arg.substr(0, eq), arg.substr(eq + 1));
            if (!s.ok) return Result<ViewerArgs>::failure(s.error);
        }
        if (out.mesh_path.empty()) return Result<ViewerArgs>::failure("missing mesh path (usage: hullview_viewer <mesh> [key=value ...])");

        const Status valid = validate_viewer_config(out.config);
        if (!valid.ok) return Result<ViewerArgs>::failure("invalid configuration: " + valid.error);
        return Result<ViewerArgs>::success(std::move(out));
    }
}
