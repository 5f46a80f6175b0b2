#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: viewer_state.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Viewer-ийн бүх ажиллах төлөв ба түүнийг кадр бүр нэг удаа шинэчлэх
            value-oriented action reducer. Frame runner эзэмшинэ, global биш.
*/


#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "hv/animation/animation_presets.hpp"
#include "hv/animation/light_motion.hpp"
#include "hv/app/toggle_state.hpp"
#include "hv/app/viewer_config.hpp"
#include "hv/camera/camera_rig.hpp"
#include "hv/core/time.hpp"
#include "hv/input/value_input_latch.hpp"
#include "hv/lighting/phong.hpp"
#include "hv/scene/pose.hpp"

namespace hv
{
    struct ViewerState
    {
        ToggleState toggles{};
        CameraRig camera{};
        Pose manual_pose{};
        AnimationClock clock{};
        glm::vec3 manual_light_position{5.0f, 5.0f, 5.0f};
        float material_shininess = 32.0f;

        // Preset-ээр солигдох анимацийн хурднууд.
        float spin_speed_deg = 30.0f;
        float light_orbit_speed_deg = 45.0f;
        float light_bob_frequency = 2.0f;
        int active_preset = 0;

        bool segmentation_report_requested = false;
        bool quit_requested = false;
    };

    inline ViewerState make_initial_viewer_state(const ViewerConfig& cfg)
    {
        ViewerState s{};
        s.toggles = cfg.initial_toggles;
        s.camera = cfg.start_camera;
        s.manual_pose = Pose{};
        s.clock = AnimationClock{};
        s.manual_light_position = make_initial_light_rig(cfg).position;
        s.material_shininess = clamp_shininess(cfg.material.shininess);
        s.spin_speed_deg = cfg.motion.spin_speed_deg;
        s.light_orbit_speed_deg = cfg.light_motion.orbit_speed_deg;
        s.light_bob_frequency = cfg.light_motion.bob_frequency;
        return s;
    }

    struct ToggleAction
    {
        ToggleEvent event{};
    };

    struct ScalarAction
    {
        float value = 0.0f;
    };

    struct PresetAction
    {
        int number = 1;
    };

    struct NudgeLightAction
    {
        uint8_t direction = 0;
    };

    enum class ViewerActionType : uint8_t
    {
        Toggle = 0,
        AdjustSpeed = 1,
        ApplyPreset = 2,
        NudgeLight = 3,
        AdjustShininess = 4,
        ResetAnimations = 5,
        ResetAll = 6,
        ReportSegmentation = 7,
        Quit = 8
    };

    using ViewerActionPayload = std::variant<std::monostate, ToggleAction, ScalarAction, PresetAction, NudgeLightAction>;

    struct ViewerAction
    {
        ViewerActionType type = ViewerActionType::Toggle;
        ViewerActionPayload payload{};
    };

    inline ViewerAction make_toggle_action(ToggleEventType type, uint8_t value = 0)
    {
        ViewerAction out{};
        out.type = ViewerActionType::Toggle;
        out.payload = ToggleAction{make_toggle_event(type, value)};
        return out;
    }

    inline ViewerAction make_adjust_speed_action(float delta)
    {
        ViewerAction out{};
        out.type = ViewerActionType::AdjustSpeed;
        out.payload = ScalarAction{delta};
        return out;
    }

    inline ViewerAction make_apply_preset_action(int number)
    {
        ViewerAction out{};
        out.type = ViewerActionType::ApplyPreset;
        out.payload = PresetAction{number};
        return out;
    }

    inline ViewerAction make_nudge_light_action(uint8_t direction)
    {
        ViewerAction out{};
        out.type = ViewerActionType::NudgeLight;
        out.payload = NudgeLightAction{direction};
        return out;
    }

    inline ViewerAction make_adjust_shininess_action(float delta)
    {
        ViewerAction out{};
        out.type = ViewerActionType::AdjustShininess;
        out.payload = ScalarAction{delta};
        return out;
    }

    inline ViewerAction make_simple_viewer_action(ViewerActionType type)
    {
        ViewerAction out{};
        out.type = type;
        return out;
    }

    inline ViewerState reset_animations(ViewerState state, const ViewerConfig& cfg)
    {
        state.clock.reset();
        state.toggles.paused = false;
        state.toggles.light_motion = LightMotionFlags{};
        state.spin_speed_deg = cfg.motion.spin_speed_deg;
        state.light_orbit_speed_deg = cfg.light_motion.orbit_speed_deg;
        state.light_bob_frequency = cfg.light_motion.bob_frequency;
        state.manual_light_position = make_initial_light_rig(cfg).position;
        state.active_preset = 0;
        return state;
    }

    inline ViewerState apply_animation_preset(ViewerState state, const AnimationPreset& p)
    {
        state.toggles.motion_mode = p.motion_mode;
        state.toggles.light_motion = p.light;
        state.toggles.paused = false;
        state.spin_speed_deg = p.spin_speed_deg;
        state.light_orbit_speed_deg = p.light_orbit_speed_deg;
        state.light_bob_frequency = p.light_bob_frequency;
        state.clock.set_speed(p.global_speed);
        state.active_preset = p.number;
        return state;
    }

    /*
        Toggle action-ууд reduce_toggle_state-ээр дамжина (шалгалт нэг газар).
        report != nullptr бол toggle-ийн мессеж болон бусад үйлдлийн тайлбар нэмэгдэнэ.
    */
    inline ViewerState reduce_viewer_state(
        ViewerState state,
        std::span<const ViewerAction> actions,
        const ViewerConfig& cfg,
        ToggleReduceReport* report = nullptr)
    {
        const auto note = [&](const std::string& msg)
        {
            if (report) report->messages.push_back(msg);
        };

        for (const ViewerAction& action : actions)
        {
            switch (action.type)
            {
                case ViewerActionType::Toggle:
                {
                    const ToggleAction* t = std::get_if<ToggleAction>(&action.payload);
                    if (!t) break;
                    state.toggles = reduce_toggle_state(state.toggles, t->event, report);
                    break;
                }
                case ViewerActionType::AdjustSpeed:
                {
                    const ScalarAction* s = std::get_if<ScalarAction>(&action.payload);
                    if (!s) break;
                    state.clock.adjust_speed(s->value);
                    note("animation speed " + std::to_string(state.clock.speed) + "x");
                    break;
                }
                case ViewerActionType::ApplyPreset:
                {
                    const PresetAction* p = std::get_if<PresetAction>(&action.payload);
                    if (!p) break;
                    const auto preset = find_animation_preset(p->number);
                    if (!preset)
                    {
                        if (report) report->rejected++;
                        note("rejected: preset " + std::to_string(p->number));
                        break;
                    }
                    state = apply_animation_preset(state, *preset);
                    note("preset " + std::to_string(preset->number) + " '" + preset->name + "'");
                    break;
                }
                case ViewerActionType::NudgeLight:
                {
                    const NudgeLightAction* n = std::get_if<NudgeLightAction>(&action.payload);
                    if (!n) break;
                    if (n->direction >= HV_LIGHT_NUDGE_COUNT)
                    {
                        if (report) report->rejected++;
                        note("rejected: light nudge " + std::to_string((int)n->direction));
                        break;
                    }
                    state.manual_light_position = nudge_light_position(state.manual_light_position, (LightNudge)n->direction, cfg.light_motion);
                    const glm::vec3& lp = state.manual_light_position;
                    note("light (" + std::to_string(lp.x) + ", " + std::to_string(lp.y) + ", " + std::to_string(lp.z) + ")");
                    break;
                }
                case ViewerActionType::AdjustShininess:
                {
                    const ScalarAction* s = std::get_if<ScalarAction>(&action.payload);
                    if (!s) break;
                    state.material_shininess = clamp_shininess(state.material_shininess + s->value);
                    note("shininess " + std::to_string((int)state.material_shininess));
                    break;
                }
                case ViewerActionType::ResetAnimations:
                {
                    state = reset_animations(state, cfg);
                    note("animations reset");
                    break;
                }
                case ViewerActionType::ResetAll:
                {
                    const bool quit = state.quit_requested;
                    state = make_initial_viewer_state(cfg);
                    state.quit_requested = quit;
                    note("all settings reset");
                    break;
                }
                case ViewerActionType::ReportSegmentation:
                {
                    state.segmentation_report_requested = true;
                    break;
                }
                case ViewerActionType::Quit:
                {
                    state.quit_requested = true;
                    break;
                }
            }
        }
        return state;
    }

    // Edge-triggered key командыг action болгон хөрвүүлнэ.
    inline void emit_key_actions(
        std::span<const KeyPress> presses,
        const ViewerConfig& cfg,
        std::vector<ViewerAction>& out)
    {
        for (const KeyPress& k : presses)
        {
            switch (k.command)
            {
                case KeyCommand::ToggleLighting: out.push_back(make_toggle_action(ToggleEventType::ToggleLighting)); break;
                case KeyCommand::ToggleShadow: out.push_back(make_toggle_action(ToggleEventType::ToggleShadow)); break;
                case KeyCommand::ToggleGround: out.push_back(make_toggle_action(ToggleEventType::ToggleGround)); break;
                case KeyCommand::ToggleWireframe: out.push_back(make_toggle_action(ToggleEventType::ToggleWireframe)); break;
                case KeyCommand::TogglePoints: out.push_back(make_toggle_action(ToggleEventType::TogglePoints)); break;
                case KeyCommand::TogglePause: out.push_back(make_toggle_action(ToggleEventType::TogglePause)); break;
                case KeyCommand::ToggleLightOrbit: out.push_back(make_toggle_action(ToggleEventType::ToggleLightOrbit)); break;
                case KeyCommand::ToggleLightBob: out.push_back(make_toggle_action(ToggleEventType::ToggleLightBob)); break;
                case KeyCommand::ToggleLightPath: out.push_back(make_toggle_action(ToggleEventType::ToggleLightPath)); break;
                case KeyCommand::CycleMotionMode: out.push_back(make_toggle_action(ToggleEventType::CycleMotionMode)); break;
                case KeyCommand::CycleColoringMode: out.push_back(make_toggle_action(ToggleEventType::CycleColoringMode)); break;
                case KeyCommand::SelectColorScheme: out.push_back(make_toggle_action(ToggleEventType::SetColorScheme, k.value)); break;
                case KeyCommand::ApplyPreset: out.push_back(make_apply_preset_action((int)k.value)); break;
                case KeyCommand::SpeedUp: out.push_back(make_adjust_speed_action(cfg.speed_step)); break;
                case KeyCommand::SpeedDown: out.push_back(make_adjust_speed_action(-cfg.speed_step)); break;
                case KeyCommand::SpeedUpFine: out.push_back(make_adjust_speed_action(cfg.speed_step_fine)); break;
                case KeyCommand::SpeedDownFine: out.push_back(make_adjust_speed_action(-cfg.speed_step_fine)); break;
                case KeyCommand::NudgeLight: out.push_back(make_nudge_light_action(k.value)); break;
                case KeyCommand::ShininessUp: out.push_back(make_adjust_shininess_action(cfg.shininess_step)); break;
                case KeyCommand::ShininessDown: out.push_back(make_adjust_shininess_action(-cfg.shininess_step)); break;
                case KeyCommand::ResetAnimations: out.push_back(make_simple_viewer_action(ViewerActionType::ResetAnimations)); break;
                case KeyCommand::ResetAll: out.push_back(make_simple_viewer_action(ViewerActionType::ResetAll)); break;
                case KeyCommand::LogSegmentation: out.push_back(make_simple_viewer_action(ViewerActionType::ReportSegmentation)); break;
            }
        }
    }
}
