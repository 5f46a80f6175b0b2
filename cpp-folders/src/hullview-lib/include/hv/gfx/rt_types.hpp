#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Software render target-ууд (HDR өнгө, шугаман depth, coverage mask)
            болон RGBA8 руу хөрвүүлэх.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace hv
{
    struct ColorF
    {
        float r, g, b, a;
    };

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = W;
            h = H;
            data.assign((size_t)w * (size_t)h, clear);
        }

        void clear(const TPixel& clear_value)
        {
            std::fill(data.begin(), data.end(), clear_value);
        }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }
    };

    struct RT_ColorHDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 1.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(ColorF c = {0.0f, 0.0f, 0.0f, 1.0f}) { color.clear(c); }
    };

    // Depth нь [zn, zf] хооронд шугаман, 0..1 болгож хадгална.
    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        float zn = 0.1f;
        float zf = 100.0f;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int W, int H, float ZN = 0.1f, float ZF = 100.0f)
            : w(W), h(H), zn(ZN), zf(ZF), depth(W, H, 1.0f)
        {}

        void clear(float d = 1.0f) { depth.clear(d); }
    };

    // Нэг draw дотор пиксел бүрийг нэг л удаа blend хийхэд хэрэглэнэ (stencil-ийн орлуулга).
    using RT_CoverageMask = PixelBuffer2D<uint8_t>;

    struct FrameTargets
    {
        RT_ColorHDR color{};
        RT_DepthBuffer depth{};
        RT_CoverageMask coverage{};

        FrameTargets() = default;
        FrameTargets(int W, int H, float zn, float zf)
            : color(W, H), depth(W, H, zn, zf), coverage(W, H, 0)
        {}

        int width() const { return color.w; }
        int height() const { return color.h; }
    };

    inline uint8_t to_unorm8(float v)
    {
        return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
    }

    // Raster y тэнхлэг дээшээ, дэлгэцийнх доошоо тул мөрүүдийг эргүүлнэ.
    inline void resolve_hdr_to_rgba8(const RT_ColorHDR& src, std::vector<uint8_t>& rgba)
    {
        rgba.resize((size_t)src.w * (size_t)src.h * 4u);
        for (int y = 0; y < src.h; ++y)
        {
            const int sy = src.h - 1 - y;
            for (int x = 0; x < src.w; ++x)
            {
                const ColorF c = src.color.at(x, sy);
                const size_t o = ((size_t)y * (size_t)src.w + (size_t)x) * 4u;
                rgba[o + 0] = to_unorm8(c.r);
                rgba[o + 1] = to_unorm8(c.g);
                rgba[o + 2] = to_unorm8(c.b);
                rgba[o + 3] = 255;
            }
        }
    }
}
