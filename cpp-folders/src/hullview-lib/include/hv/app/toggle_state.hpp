#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: toggle_state.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Асаах/унтраах төлөвүүд ба тэдгээрийн value-oriented reducer.
            Буруу шилжилтийг татгалзаж өмнөх утгыг хэвээр үлдээнэ.
*/


#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hv/animation/light_motion.hpp"
#include "hv/animation/motion_controller.hpp"
#include "hv/segmentation/region_colors.hpp"

namespace hv
{
    enum class RenderMode : uint8_t
    {
        Filled = 0,
        Wireframe = 1,
        Points = 2
    };

    constexpr uint8_t HV_RENDER_MODE_COUNT = 3;

    inline const char* render_mode_name(RenderMode m)
    {
        switch (m)
        {
            case RenderMode::Filled: return "filled";
            case RenderMode::Wireframe: return "wireframe";
            case RenderMode::Points: return "points";
        }
        return "unknown";
    }

    inline std::optional<RenderMode> render_mode_from_name(std::string_view s)
    {
        for (uint8_t i = 0; i < HV_RENDER_MODE_COUNT; ++i)
        {
            if (s == render_mode_name((RenderMode)i)) return (RenderMode)i;
        }
        return std::nullopt;
    }

    /*
        Эхлэх утгууд (тодорхой зарлагдсан, zero-value-д найдахгүй):
            lighting  : on
            shadow    : on
            ground    : on
            paused    : off
            render    : filled
            motion    : orbital
            coloring  : region
            scheme    : starfleet
            light orbit/bob/path : off
    */
    struct ToggleState
    {
        bool lighting_enabled = true;
        bool shadow_enabled = true;
        bool ground_enabled = true;
        bool paused = false;
        RenderMode render_mode = RenderMode::Filled;
        MotionMode motion_mode = MotionMode::Orbital;
        ColoringMode coloring_mode = ColoringMode::Region;
        ColorSchemeId color_scheme = ColorSchemeId::Starfleet;
        LightMotionFlags light_motion{};
        // Render toggle-оор гарсан горим. Түүх тул == харьцуулалтад орохгүй.
        RenderMode previous_render_mode = RenderMode::Filled;

        bool operator==(const ToggleState& o) const
        {
            return
                lighting_enabled == o.lighting_enabled &&
                shadow_enabled == o.shadow_enabled &&
                ground_enabled == o.ground_enabled &&
                paused == o.paused &&
                render_mode == o.render_mode &&
                motion_mode == o.motion_mode &&
                coloring_mode == o.coloring_mode &&
                color_scheme == o.color_scheme &&
                light_motion.orbit == o.light_motion.orbit &&
                light_motion.bob == o.light_motion.bob &&
                light_motion.path == o.light_motion.path;
        }

        bool operator!=(const ToggleState& o) const { return !(*this == o); }
    };

    enum class ToggleEventType : uint8_t
    {
        ToggleLighting = 0,
        ToggleShadow,
        ToggleGround,
        TogglePause,
        // Wireframe руу орно. Wireframe дээр дахин дарвал өмнөх горим руу буцна.
        ToggleWireframe,
        // Points руу орно. Points дээр дахин дарвал өмнөх горим руу буцна.
        TogglePoints,
        ToggleLightOrbit,
        ToggleLightBob,
        ToggleLightPath,
        CycleMotionMode,
        CycleColoringMode,
        SetRenderMode,
        SetMotionMode,
        SetColoringMode,
        SetColorScheme
    };

    // value нь зөвхөн Set* төрөлд хэрэглэгдэх raw enum утга.
    struct ToggleEvent
    {
        ToggleEventType type = ToggleEventType::ToggleLighting;
        uint8_t value = 0;
    };

    inline ToggleEvent make_toggle_event(ToggleEventType type, uint8_t value = 0)
    {
        ToggleEvent e{};
        e.type = type;
        e.value = value;
        return e;
    }

    struct ToggleReduceReport
    {
        uint32_t applied = 0;
        uint32_t rejected = 0;
        std::vector<std::string> messages{};
    };

    /*
        Ижил товчийг хоёр дарахад харагдах render горим эхний утгандаа буцна.
        previous_render_mode нь target-тай ижил бол (SetRenderMode-оор орсон) filled руу гарна.
    */
    inline void toggle_render_mode(ToggleState& s, RenderMode target)
    {
        if (s.render_mode == target)
        {
            s.render_mode = (s.previous_render_mode == target) ? RenderMode::Filled : s.previous_render_mode;
            s.previous_render_mode = target;
            return;
        }
        s.previous_render_mode = s.render_mode;
        s.render_mode = target;
    }

    inline ToggleState reduce_toggle_state(
        ToggleState state,
        std::span<const ToggleEvent> events,
        ToggleReduceReport* report = nullptr)
    {
        const auto applied = [&](const std::string& msg)
        {
            if (!report) return;
            report->applied++;
            report->messages.push_back(msg);
        };
        const auto rejected = [&](const std::string& msg)
        {
            if (!report) return;
            report->rejected++;
            report->messages.push_back("rejected: " + msg);
        };
        const auto on_off = [](bool v) { return std::string(v ? "on" : "off"); };

        for (const ToggleEvent& e : events)
        {
            switch (e.type)
            {
                case ToggleEventType::ToggleLighting:
                    state.lighting_enabled = !state.lighting_enabled;
                    applied("lighting " + on_off(state.lighting_enabled));
                    break;
                case ToggleEventType::ToggleShadow:
                    state.shadow_enabled = !state.shadow_enabled;
                    applied("shadow " + on_off(state.shadow_enabled));
                    break;
                case ToggleEventType::ToggleGround:
                    state.ground_enabled = !state.ground_enabled;
                    applied("ground " + on_off(state.ground_enabled));
                    break;
                case ToggleEventType::TogglePause:
                    state.paused = !state.paused;
                    applied(std::string("animation ") + (state.paused ? "paused" : "playing"));
                    break;
                case ToggleEventType::ToggleWireframe:
                    toggle_render_mode(state, RenderMode::Wireframe);
                    applied(std::string("render_mode ") + render_mode_name(state.render_mode));
                    break;
                case ToggleEventType::TogglePoints:
                    toggle_render_mode(state, RenderMode::Points);
                    applied(std::string("render_mode ") + render_mode_name(state.render_mode));
                    break;
                case ToggleEventType::ToggleLightOrbit:
                    state.light_motion.orbit = !state.light_motion.orbit;
                    applied("light orbit " + on_off(state.light_motion.orbit));
                    break;
                case ToggleEventType::ToggleLightBob:
                    state.light_motion.bob = !state.light_motion.bob;
                    applied("light bobbing " + on_off(state.light_motion.bob));
                    break;
                case ToggleEventType::ToggleLightPath:
                    state.light_motion.path = !state.light_motion.path;
                    applied("light path " + on_off(state.light_motion.path));
                    break;
                case ToggleEventType::CycleMotionMode:
                    state.motion_mode = next_motion_mode(state.motion_mode);
                    applied(std::string("motion_mode ") + motion_mode_name(state.motion_mode));
                    break;
                case ToggleEventType::CycleColoringMode:
                    state.coloring_mode = next_coloring_mode(state.coloring_mode);
                    applied(std::string("coloring_mode ") + coloring_mode_name(state.coloring_mode));
                    break;
                case ToggleEventType::SetRenderMode:
                    if (e.value >= HV_RENDER_MODE_COUNT)
                    {
                        rejected("render_mode value " + std::to_string((int)e.value));
                        break;
                    }
                    state.render_mode = (RenderMode)e.value;
                    applied(std::string("render_mode ") + render_mode_name(state.render_mode));
                    break;
                case ToggleEventType::SetMotionMode:
                    if (!motion_mode_valid(e.value))
                    {
                        rejected("motion_mode value " + std::to_string((int)e.value));
                        break;
                    }
                    state.motion_mode = (MotionMode)e.value;
                    applied(std::string("motion_mode ") + motion_mode_name(state.motion_mode));
                    break;
                case ToggleEventType::SetColoringMode:
                    if (e.value >= HV_COLORING_MODE_COUNT)
                    {
                        rejected("coloring_mode value " + std::to_string((int)e.value));
                        break;
                    }
                    state.coloring_mode = (ColoringMode)e.value;
                    applied(std::string("coloring_mode ") + coloring_mode_name(state.coloring_mode));
                    break;
                case ToggleEventType::SetColorScheme:
                    if (e.value >= HV_COLOR_SCHEME_COUNT)
                    {
                        rejected("color_scheme value " + std::to_string((int)e.value));
                        break;
                    }
                    state.color_scheme = (ColorSchemeId)e.value;
                    applied(std::string("color_scheme ") + color_scheme_name(state.color_scheme));
                    break;
                default:
                    rejected("unknown toggle event " + std::to_string((int)e.type));
                    break;
            }
        }
        return state;
    }

    inline ToggleState reduce_toggle_state(ToggleState state, const ToggleEvent& e, ToggleReduceReport* report = nullptr)
    {
        return reduce_toggle_state(state, std::span<const ToggleEvent>(&e, 1), report);
    }

    inline std::string toggle_state_summary(const ToggleState& s)
    {
        std::string out{};
        out += "light:" + std::string(s.lighting_enabled ? "on" : "off");
        out += " shadow:" + std::string(s.shadow_enabled ? "on" : "off");
        out += " ground:" + std::string(s.ground_enabled ? "on" : "off");
        out += " render:" + std::string(render_mode_name(s.render_mode));
        out += " motion:" + std::string(motion_mode_name(s.motion_mode));
        out += " color:" + std::string(coloring_mode_name(s.coloring_mode));
        out += "/" + std::string(color_scheme_name(s.color_scheme));
        if (s.paused) out += " [paused]";
        return out;
    }
}
