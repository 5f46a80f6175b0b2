#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: frame_runner.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Нэг кадрын дараалал: input -> toggle/камер -> анимацийн цаг -> plan -> гүйцэтгэл.
            ViewerState-ийг ганцаараа эзэмшинэ. Цонх шаардахгүй тул тестэд шууд ажиллана.
*/


#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "hv/app/toggle_state.hpp"
#include "hv/app/viewer_config.hpp"
#include "hv/app/viewer_state.hpp"
#include "hv/camera/free_camera.hpp"
#include "hv/core/log.hpp"
#include "hv/frame/frame_executor.hpp"
#include "hv/frame/frame_plan.hpp"
#include "hv/input/value_input_latch.hpp"
#include "hv/segmentation/region_classifier.hpp"

namespace hv
{
    class FrameRunner
    {
    public:
        FrameRunner(ViewerConfig cfg, std::shared_ptr<const PreparedMesh> mesh)
            : cfg_(std::move(cfg))
            , state_(make_initial_viewer_state(cfg_))
            , executor_(cfg_.window.surface_width, cfg_.window.surface_height)
        {
            assets_ = make_scene_assets(std::move(mesh), cfg_);
        }

        const ViewerConfig& config() const { return cfg_; }
        const ViewerState& state() const { return state_; }
        const FramePlan& last_plan() const { return plan_; }
        const SoftwareFrameExecutor& executor() const { return executor_; }
        bool quit_requested() const { return state_.quit_requested; }

        float aspect() const
        {
            const FrameTargets& t = executor_.targets();
            if (t.height() <= 0) return 0.0f;
            return (float)t.width() / (float)t.height();
        }

        const FramePlan& tick(const RuntimeInputLatch& input, float dt)
        {
            actions_.clear();
            emit_key_actions(input.key_presses, cfg_, actions_);
            if (input.quit_requested) actions_.push_back(make_simple_viewer_action(ViewerActionType::Quit));

            if (!actions_.empty())
            {
                const ToggleState before = state_.toggles;
                ToggleReduceReport report{};
                state_ = reduce_viewer_state(state_, actions_, cfg_, &report);
                for (const std::string& msg : report.messages) log_info(msg);
                if (report.rejected > 0) log_warn(std::to_string(report.rejected) + " input action(s) rejected, state kept");
                if (state_.toggles != before) log_debug(toggle_state_summary(state_.toggles));
            }

            if (state_.segmentation_report_requested)
            {
                state_.segmentation_report_requested = false;
                if (assets_.model) log_info(segmentation_summary(assets_.model->segmentation));
            }

            state_.camera = apply_camera_input(state_.camera, input, cfg_.camera_control, dt);
            if (!state_.toggles.paused) state_.clock.advance(dt);

            plan_ = plan_frame(FrameInputs{state_, cfg_, assets_, aspect()});
            log_plan_transitions();
            executor_.execute(plan_);
            return plan_;
        }

        // Цонхны гарчигт харуулах богино төлөв.
        std::string status_line() const
        {
            char speed[32];
            std::snprintf(speed, sizeof(speed), "%.1fx", state_.clock.speed);
            std::string out = "hullview | " + toggle_state_summary(state_.toggles) + " | speed " + speed;
            if (state_.active_preset > 0) out += " | preset " + std::to_string(state_.active_preset);
            if (state_.toggles.lighting_enabled) out += " | shininess " + std::to_string((int)state_.material_shininess);
            return out;
        }

    private:
        // Үргэлжилсэн нөхцөлийг кадар бүр биш, зөвхөн эхлэх үед нь бичнэ.
        void log_plan_transitions()
        {
            if (!plan_.transforms_valid && transforms_were_valid_)
            {
                log_warn("non-finite frame transforms, drawing clear only");
            }
            transforms_were_valid_ = plan_.transforms_valid;

            const ShadowSkipReason reason = plan_.shadow_skipped ? plan_.shadow_skip_reason : ShadowSkipReason::None;
            if (reason != last_shadow_skip_ && reason != ShadowSkipReason::None)
            {
                log_debug(std::string("shadow skipped: ") + shadow_skip_reason_name(reason));
            }
            last_shadow_skip_ = reason;
        }

        ViewerConfig cfg_{};
        ViewerState state_{};
        SceneAssets assets_{};
        SoftwareFrameExecutor executor_;
        FramePlan plan_{};
        std::vector<ViewerAction> actions_{};
        bool transforms_were_valid_ = true;
        ShadowSkipReason last_shadow_skip_ = ShadowSkipReason::None;
    };
}
