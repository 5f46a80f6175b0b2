#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 цонх, streaming texture, гар/хулганы input.
            Toggle товчнууд зөвхөн repeat биш KEYDOWN дээр нэг KeyPress гаргана.
*/


#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <SDL2/SDL.h>

#include "hv/animation/light_motion.hpp"
#include "hv/input/value_input_latch.hpp"
#include "hv/platform/platform_runtime.hpp"

namespace hv
{
    /*
        Товчлуурын зураглал:
            Esc гарах, T гэрэл, R сүүдэр (Alt+R анимаци reset), G газар,
            F wireframe, V цэг, P pause (Alt+P гэрлийн зам), L гэрлийн тойрог (Shift+L савлалт),
            N хөдөлгөөний горим, M будалтын горим, F1-F3 эсвэл Ctrl+1..3 өнгөний схем,
            1-5 preset, +/- хурд (Shift нарийн), J ; I K U O гэрэл шилжүүлэх,
            , . гялалзалт, F4 сегментчлэлийн тайлан, C бүгдийг reset.
    */
    inline std::optional<KeyPress> map_sdl_key(SDL_Keycode key, uint16_t mod)
    {
        const bool alt = (mod & KMOD_ALT) != 0;
        const bool shift = (mod & KMOD_SHIFT) != 0;
        const bool ctrl = (mod & KMOD_CTRL) != 0;
        const auto nudge = [](LightNudge n) { return KeyPress{KeyCommand::NudgeLight, (uint8_t)n}; };

        switch (key)
        {
            case SDLK_t: return KeyPress{KeyCommand::ToggleLighting, 0};
            case SDLK_r: return KeyPress{alt ? KeyCommand::ResetAnimations : KeyCommand::ToggleShadow, 0};
            case SDLK_g: return KeyPress{KeyCommand::ToggleGround, 0};
            case SDLK_f: return KeyPress{KeyCommand::ToggleWireframe, 0};
            case SDLK_v: return KeyPress{KeyCommand::TogglePoints, 0};
            case SDLK_p: return KeyPress{alt ? KeyCommand::ToggleLightPath : KeyCommand::TogglePause, 0};
            case SDLK_l: return KeyPress{shift ? KeyCommand::ToggleLightBob : KeyCommand::ToggleLightOrbit, 0};
            case SDLK_n: return KeyPress{KeyCommand::CycleMotionMode, 0};
            case SDLK_m: return KeyPress{KeyCommand::CycleColoringMode, 0};
            case SDLK_F1: return KeyPress{KeyCommand::SelectColorScheme, 0};
            case SDLK_F2: return KeyPress{KeyCommand::SelectColorScheme, 1};
            case SDLK_F3: return KeyPress{KeyCommand::SelectColorScheme, 2};
            case SDLK_F4: return KeyPress{KeyCommand::LogSegmentation, 0};
            case SDLK_c: return KeyPress{KeyCommand::ResetAll, 0};
            case SDLK_1:
            case SDLK_2:
            case SDLK_3:
            case SDLK_4:
            case SDLK_5:
            {
                const uint8_t n = (uint8_t)(key - SDLK_1 + 1);
                if (ctrl)
                {
                    if (n > 3) return std::nullopt;
                    return KeyPress{KeyCommand::SelectColorScheme, (uint8_t)(n - 1)};
                }
                return KeyPress{KeyCommand::ApplyPreset, n};
            }
            case SDLK_EQUALS:
            case SDLK_PLUS:
            case SDLK_KP_PLUS:
                return KeyPress{shift ? KeyCommand::SpeedUpFine : KeyCommand::SpeedUp, 0};
            case SDLK_MINUS:
            case SDLK_KP_MINUS:
                return KeyPress{shift ? KeyCommand::SpeedDownFine : KeyCommand::SpeedDown, 0};
            case SDLK_j: return nudge(LightNudge::Left);
            case SDLK_SEMICOLON: return nudge(LightNudge::Right);
            case SDLK_i: return nudge(LightNudge::Forward);
            case SDLK_k: return nudge(LightNudge::Back);
            case SDLK_u: return nudge(LightNudge::Up);
            case SDLK_o: return nudge(LightNudge::Down);
            case SDLK_COMMA: return KeyPress{KeyCommand::ShininessDown, 0};
            case SDLK_PERIOD: return KeyPress{KeyCommand::ShininessUp, 0};
            default: break;
        }
        return std::nullopt;
    }

    struct HeldKeyBinding
    {
        HeldInput held;
        SDL_Scancode primary;
        SDL_Scancode secondary;
    };

    // WASD хөдөлгөөн, Q/E доош дээш, Shift эсвэл Tab хурдасгана.
    inline const std::array<HeldKeyBinding, 7>& held_key_bindings()
    {
        static const std::array<HeldKeyBinding, 7> bindings{{
            {HeldInput::Forward, SDL_SCANCODE_W, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Backward, SDL_SCANCODE_S, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Left, SDL_SCANCODE_A, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Right, SDL_SCANCODE_D, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Descend, SDL_SCANCODE_Q, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Ascend, SDL_SCANCODE_E, SDL_SCANCODE_UNKNOWN},
            {HeldInput::Boost, SDL_SCANCODE_LSHIFT, SDL_SCANCODE_TAB},
        }};
        return bindings;
    }

    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        SdlRuntime(const WindowDesc& win, const SurfaceDesc& surface)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                error_ = std::string("SDL_Init failed: ") + SDL_GetError();
                return;
            }
            sdl_initialized_ = true;

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN
            );
            if (!window_)
            {
                error_ = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                error_ = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
                return;
            }

            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                surface.width,
                surface.height
            );
            if (!texture_)
            {
                error_ = std::string("SDL_CreateTexture failed: ") + SDL_GetError();
                return;
            }

            valid_ = true;
        }

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_initialized_) SDL_Quit();
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        bool valid() const override { return valid_; }
        std::string last_error() const override { return error_; }

        bool pump_input(std::vector<RuntimeInputEvent>& out) override
        {
            bool quit = false;
            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) quit = true;
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0)
                {
                    if (e.key.keysym.sym == SDLK_ESCAPE)
                    {
                        quit = true;
                    }
                    else if (const auto kp = map_sdl_key(e.key.keysym.sym, e.key.keysym.mod))
                    {
                        out.push_back(make_key_press_input_event(kp->command, kp->value));
                    }
                }

                if (e.type == SDL_MOUSEMOTION)
                {
                    out.push_back(make_mouse_delta_input_event((float)e.motion.xrel, (float)e.motion.yrel));
                }
                if (e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP)
                {
                    const bool down = e.type == SDL_MOUSEBUTTONDOWN;
                    if (e.button.button == SDL_BUTTON_LEFT) out.push_back(make_held_input_event(HeldInput::LookLeft, down));
                    if (e.button.button == SDL_BUTTON_RIGHT) out.push_back(make_held_input_event(HeldInput::LookRight, down));
                }
                // Focus алдахад товч суллагдсан event ирэхгүй.
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
                {
                    out.push_back(make_held_input_event(HeldInput::LookLeft, false));
                    out.push_back(make_held_input_event(HeldInput::LookRight, false));
                }
            }

            const uint8_t* ks = SDL_GetKeyboardState(nullptr);
            for (const HeldKeyBinding& b : held_key_bindings())
            {
                const bool down = ks[b.primary] != 0 || (b.secondary != SDL_SCANCODE_UNKNOWN && ks[b.secondary] != 0);
                out.push_back(make_held_input_event(b.held, down));
            }

            if (quit) out.push_back(make_quit_input_event());
            return !quit;
        }

        uint64_t ticks() const override { return (uint64_t)SDL_GetPerformanceCounter(); }
        uint64_t tick_frequency() const override { return (uint64_t)SDL_GetPerformanceFrequency(); }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) override
        {
            if (!texture_ || !src) return;
            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return;

            const int copy_bytes = width * 4;
            auto* d = static_cast<uint8_t*>(dst);
            for (int y = 0; y < height; ++y)
            {
                std::memcpy(d + y * dst_pitch, src + y * src_pitch_bytes, (size_t)copy_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present() override
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 10, 10, 14, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        bool valid_ = false;
        bool sdl_initialized_ = false;
        std::string error_{};
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
    };
}
