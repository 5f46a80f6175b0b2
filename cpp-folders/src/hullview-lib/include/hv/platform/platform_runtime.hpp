#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Цонх, input, дэлгэцэнд гаргах үйлдлийн интерфэйс. Input нь
            RuntimeInputEvent жагсаалт хэлбэрээр гарна.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "hv/input/value_input_latch.hpp"

namespace hv
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
    };

    struct SurfaceDesc
    {
        int width = 800;
        int height = 600;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual std::string last_error() const = 0;
        // Хуримтлагдсан event-үүдийг out-д нэмнэ. Quit ирвэл false.
        virtual bool pump_input(std::vector<RuntimeInputEvent>& out) = 0;
        virtual uint64_t ticks() const = 0;
        virtual uint64_t tick_frequency() const = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes) = 0;
        virtual void present() = 0;
    };
}
