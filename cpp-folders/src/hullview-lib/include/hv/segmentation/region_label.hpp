#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: region_label.hpp
    МОДУЛЬ: segmentation
    ЗОРИЛГО: Хөлгийн хэсгүүдийн хаалттай жагсаалт (face бүрт яг нэг шошго).
*/


#include <cstddef>
#include <cstdint>

namespace hv
{
    enum class RegionLabel : uint8_t
    {
        Saucer = 0,
        Bridge = 1,
        EngineeringHull = 2,
        Nacelle = 3,
        Pylon = 4
    };

    constexpr size_t HV_REGION_COUNT = 5;

    inline size_t region_index(RegionLabel r)
    {
        return (size_t)r;
    }

    inline const char* region_label_name(RegionLabel r)
    {
        switch (r)
        {
            case RegionLabel::Saucer: return "saucer";
            case RegionLabel::Bridge: return "bridge";
            case RegionLabel::EngineeringHull: return "engineering_hull";
            case RegionLabel::Nacelle: return "nacelle";
            case RegionLabel::Pylon: return "pylon";
        }
        return "unknown";
    }

    inline const char* region_display_name(RegionLabel r)
    {
        switch (r)
        {
            case RegionLabel::Saucer: return "Primary Hull (Saucer)";
            case RegionLabel::Bridge: return "Bridge/Command Section";
            case RegionLabel::EngineeringHull: return "Secondary Hull (Engineering)";
            case RegionLabel::Nacelle: return "Warp Nacelles";
            case RegionLabel::Pylon: return "Nacelle Pylons";
        }
        return "Unknown";
    }
}
