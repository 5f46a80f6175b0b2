#define SDL_MAIN_HANDLED

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: hullview_viewer.cpp
    МОДУЛЬ: hullview-viewer
    ЗОРИЛГО: Интерактив viewer: assimp-аар mesh ачаалж, нэг удаа бэлтгэн сегментчилнэ,
            дараа нь FrameRunner-аар кадр бүрийг гүйцэтгэж SDL2-оор дэлгэцэнд гаргана.
*/

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hv/app/config_overrides.hpp>
#include <hv/core/log.hpp>
#include <hv/core/time.hpp>
#include <hv/frame/frame_runner.hpp>
#include <hv/input/value_input_latch.hpp>
#include <hv/platform/platform_runtime.hpp>
#include <hv/platform/sdl/sdl_runtime.hpp>
#include <hv/resources/loaders/mesh_loader_assimp.hpp>
#include <hv/resources/mesh_prep.hpp>
#include <hv/segmentation/region_classifier.hpp>

namespace
{
constexpr double kTitleRefreshSeconds = 0.25;

class HullviewViewerApp
{
public:
    explicit HullviewViewerApp(hv::ViewerArgs args)
        : args_(std::move(args))
    {}

    void run()
    {
        hv::set_log_level(args_.log_level);
        init_mesh();
        init_runtime();
        main_loop();
    }

private:
    void init_mesh()
    {
        hv::Result<hv::MeshData> loaded = hv::load_mesh_assimp(args_.mesh_path);
        if (!loaded.ok) throw std::runtime_error(loaded.error);

        const hv::ViewerConfig& cfg = args_.config;
        hv::Result<std::shared_ptr<const hv::PreparedMesh>> prepared =
            hv::prepare_mesh(std::move(loaded.value), cfg.segmentation, cfg.mesh_prep);
        if (!prepared.ok) throw std::runtime_error(prepared.error);

        const hv::PreparedMesh& pm = *prepared.value;
        hv::log_info(
            "loaded '" + args_.mesh_path + "': " +
            std::to_string(pm.mesh.positions.size()) + " vertices, " +
            std::to_string(pm.mesh.triangle_count()) + " faces" +
            (pm.normals_generated ? " (normals generated)" : ""));
        hv::log_info(hv::segmentation_summary(pm.segmentation));
        for (size_t i = 0; i < hv::HV_REGION_COUNT; ++i)
        {
            const hv::RegionLabel r = (hv::RegionLabel)i;
            hv::log_debug(std::string("  ") + hv::region_display_name(r) + ": " + std::to_string(pm.segmentation.count(r)));
        }

        runner_ = std::make_unique<hv::FrameRunner>(cfg, std::move(prepared.value));
    }

    void init_runtime()
    {
        const hv::WindowParams& w = args_.config.window;
        hv::WindowDesc win{};
        win.title = "hullview";
        win.width = w.width;
        win.height = w.height;

        hv::SurfaceDesc surface{};
        surface.width = w.surface_width;
        surface.height = w.surface_height;

        runtime_ = std::make_unique<hv::SdlRuntime>(win, surface);
        if (!runtime_->valid())
        {
            throw std::runtime_error("SdlRuntime init failed: " + runtime_->last_error());
        }
        clock_.tick_hz = (double)runtime_->tick_frequency();
        hv::log_info(hv::toggle_state_summary(runner_->state().toggles));
    }

    void main_loop()
    {
        bool running = true;
        while (running)
        {
            events_.clear();
            running = runtime_->pump_input(events_);
            latch_ = hv::reduce_runtime_input_latch(latch_, events_);

            const float dt = clock_.begin_frame(runtime_->ticks());
            runner_->tick(latch_, dt);
            latch_ = hv::clear_runtime_input_frame_deltas(latch_);
            if (!running || runner_->quit_requested()) break;

            present_frame();
            refresh_title();
        }
        hv::log_info("exiting");
    }

    void present_frame()
    {
        const hv::FrameTargets& t = runner_->executor().targets();
        runner_->executor().resolve_rgba8(rgba_staging_);
        runtime_->upload_rgba8(rgba_staging_.data(), t.width(), t.height(), t.width() * 4);
        runtime_->present();
    }

    void refresh_title()
    {
        if (clock_.elapsed - last_title_time_ < kTitleRefreshSeconds) return;
        last_title_time_ = clock_.elapsed;
        const std::string title = runner_->status_line();
        if (title == last_title_) return;
        runtime_->set_title(title);
        last_title_ = title;
    }

private:
    hv::ViewerArgs args_{};
    std::unique_ptr<hv::FrameRunner> runner_{};
    std::unique_ptr<hv::SdlRuntime> runtime_{};

    hv::FrameClock clock_{};
    hv::RuntimeInputLatch latch_{};
    std::vector<hv::RuntimeInputEvent> events_{};
    std::vector<uint8_t> rgba_staging_{};
    double last_title_time_ = -1.0;
    std::string last_title_{};
};
}

int main(int argc, char** argv)
{
    try
    {
        hv::Result<hv::ViewerArgs> args = hv::parse_viewer_args(argc, argv);
        if (!args.ok) throw std::runtime_error(args.error);

        HullviewViewerApp app{std::move(args.value)};
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        hv::log_error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
