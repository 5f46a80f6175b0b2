#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Draw бүрийн shader сонголт (гэрэлтэй Phong эсвэл гэрэлгүй Flat)
            ба DrawProgram-аар индекслэгдсэн програмын багц.
*/


#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include "hv/shader/types.hpp"

namespace hv
{
    // Mesh нь Phong, сүүдэр болон гэрлийн тэмдэглэгээ Flat.
    enum class DrawProgram : uint8_t
    {
        Phong = 0,
        Flat = 1
    };

    constexpr size_t HV_DRAW_PROGRAM_COUNT = 2;

    struct ShaderProgram
    {
        std::function<VertexOut(const ShaderVertex&, const ShaderUniforms&)> vs{};
        std::function<FragmentOut(const FragmentIn&, const ShaderUniforms&)> fs{};

        bool valid() const
        {
            return vs && fs;
        }
    };

    struct ShaderProgramSet
    {
        std::array<ShaderProgram, HV_DRAW_PROGRAM_COUNT> programs{};

        const ShaderProgram& get(DrawProgram p) const
        {
            return programs[(size_t)p];
        }

        void set(DrawProgram p, ShaderProgram program)
        {
            programs[(size_t)p] = std::move(program);
        }

        bool complete() const
        {
            for (const ShaderProgram& p : programs)
            {
                if (!p.valid()) return false;
            }
            return true;
        }
    };
}
