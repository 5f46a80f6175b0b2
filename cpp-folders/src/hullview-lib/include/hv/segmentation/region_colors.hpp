#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: region_colors.hpp
    МОДУЛЬ: segmentation
    ЗОРИЛГО: RegionLabel -> өнгө (color scheme), RegionLabel -> Phong материал,
            мөн будах горимуудаар face бүрийн суурь өнгийг гаргах.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "hv/lighting/phong.hpp"
#include "hv/segmentation/region_classifier.hpp"

namespace hv
{
    enum class ColoringMode : uint8_t
    {
        Solid = 0,
        Region = 1,
        Angle = 2,
        Mixed = 3,
        Animated = 4
    };

    constexpr uint8_t HV_COLORING_MODE_COUNT = 5;

    enum class ColorSchemeId : uint8_t
    {
        Starfleet = 0,
        Battle = 1,
        Exploration = 2
    };

    constexpr uint8_t HV_COLOR_SCHEME_COUNT = 3;

    using ColorScheme = std::array<glm::vec3, HV_REGION_COUNT>;
    using RegionMaterials = std::array<PhongMaterial, HV_REGION_COUNT>;

    inline const char* coloring_mode_name(ColoringMode m)
    {
        switch (m)
        {
            case ColoringMode::Solid: return "solid";
            case ColoringMode::Region: return "region";
            case ColoringMode::Angle: return "angle";
            case ColoringMode::Mixed: return "mixed";
            case ColoringMode::Animated: return "animated";
        }
        return "unknown";
    }

    inline std::optional<ColoringMode> coloring_mode_from_name(std::string_view s)
    {
        for (uint8_t i = 0; i < HV_COLORING_MODE_COUNT; ++i)
        {
            if (s == coloring_mode_name((ColoringMode)i)) return (ColoringMode)i;
        }
        return std::nullopt;
    }

    inline const char* color_scheme_name(ColorSchemeId id)
    {
        switch (id)
        {
            case ColorSchemeId::Starfleet: return "starfleet";
            case ColorSchemeId::Battle: return "battle";
            case ColorSchemeId::Exploration: return "exploration";
        }
        return "unknown";
    }

    inline std::optional<ColorSchemeId> color_scheme_from_name(std::string_view s)
    {
        for (uint8_t i = 0; i < HV_COLOR_SCHEME_COUNT; ++i)
        {
            if (s == color_scheme_name((ColorSchemeId)i)) return (ColorSchemeId)i;
        }
        return std::nullopt;
    }

    // Индекс нь RegionLabel: saucer, bridge, engineering hull, nacelle, pylon.
    inline const ColorScheme& color_scheme(ColorSchemeId id)
    {
        static const ColorScheme starfleet{{
            {0.7f, 0.8f, 0.9f},
            {0.9f, 0.9f, 0.95f},
            {0.6f, 0.7f, 0.8f},
            {0.5f, 0.6f, 0.9f},
            {0.6f, 0.75f, 0.8f},
        }};
        static const ColorScheme battle{{
            {0.8f, 0.3f, 0.3f},
            {1.0f, 0.8f, 0.0f},
            {0.4f, 0.4f, 0.4f},
            {0.9f, 0.1f, 0.1f},
            {0.3f, 0.3f, 0.3f},
        }};
        static const ColorScheme exploration{{
            {0.2f, 0.8f, 0.3f},
            {0.9f, 0.9f, 0.1f},
            {0.1f, 0.6f, 0.7f},
            {0.8f, 0.2f, 0.9f},
            {0.1f, 0.5f, 0.2f},
        }};
        switch (id)
        {
            case ColorSchemeId::Starfleet: return starfleet;
            case ColorSchemeId::Battle: return battle;
            case ColorSchemeId::Exploration: return exploration;
        }
        return starfleet;
    }

    inline glm::vec3 region_color(ColorSchemeId id, RegionLabel r)
    {
        return color_scheme(id)[region_index(r)];
    }

    inline const RegionMaterials& region_materials()
    {
        static const RegionMaterials mats{{
            {{0.3f, 0.35f, 0.4f}, {0.7f, 0.75f, 0.85f}, {0.9f, 0.9f, 0.95f}, 64.0f},
            {{0.4f, 0.4f, 0.45f}, {0.8f, 0.8f, 0.9f}, {1.0f, 1.0f, 1.0f}, 128.0f},
            {{0.25f, 0.3f, 0.35f}, {0.6f, 0.7f, 0.8f}, {0.8f, 0.85f, 0.9f}, 48.0f},
            {{0.2f, 0.25f, 0.4f}, {0.5f, 0.6f, 0.85f}, {0.95f, 0.95f, 1.0f}, 96.0f},
            {{0.2f, 0.25f, 0.3f}, {0.55f, 0.65f, 0.75f}, {0.7f, 0.75f, 0.8f}, 32.0f},
        }};
        return mats;
    }

    inline const PhongMaterial& region_material(RegionLabel r)
    {
        return region_materials()[region_index(r)];
    }

    // Region өнгө ашигладаг горимд хэсэг бүр өөрийн specular/shininess-тэй.
    inline bool coloring_uses_region_materials(ColoringMode m)
    {
        return m == ColoringMode::Region || m == ColoringMode::Mixed || m == ColoringMode::Animated;
    }

    struct ColoringParams
    {
        glm::vec3 solid_color{0.7f, 0.8f, 0.9f};
        // Angle/Mixed горимд гэрэлтэлтийг хэмжих model-space чиглэл.
        glm::vec3 reference_dir{0.0f, 0.0f, 1.0f};
        float mix_factor = 0.6f;
    };

    inline float facing_factor(const glm::vec3& face_normal, const glm::vec3& reference_dir)
    {
        const float nl = glm::length(face_normal);
        const float rl = glm::length(reference_dir);
        if (!(nl > 1e-8f) || !(rl > 1e-8f)) return 0.0f;
        return std::max(0.0f, glm::dot(face_normal / nl, reference_dir / rl));
    }

    inline glm::vec3 animated_region_color(const glm::vec3& base, RegionLabel r, float t)
    {
        float pulse = 1.0f;
        glm::vec3 shift{0.0f};
        switch (r)
        {
            case RegionLabel::Nacelle:
                pulse = 1.0f + 0.2f * std::sin(t * 4.0f);
                shift = glm::vec3(0.1f, 0.0f, 0.2f) * std::sin(t * 2.0f);
                break;
            case RegionLabel::Bridge:
                pulse = 1.0f + 0.1f * std::sin(t * 1.5f);
                shift = glm::vec3(0.05f, 0.05f, 0.0f) * std::sin(t * 0.8f);
                break;
            case RegionLabel::EngineeringHull:
                pulse = 1.0f + 0.15f * std::sin(t * 2.5f);
                shift = glm::vec3(0.0f, 0.08f, 0.08f) * std::sin(t * 1.2f);
                break;
            default:
                pulse = 1.0f + 0.05f * std::sin(t);
                break;
        }
        return glm::clamp((base + shift) * pulse, glm::vec3(0.0f), glm::vec3(1.0f));
    }

    inline glm::vec3 resolve_face_color(
        ColoringMode mode,
        RegionLabel label,
        float facing,
        ColorSchemeId scheme,
        float anim_time,
        const ColoringParams& params = {})
    {
        switch (mode)
        {
            case ColoringMode::Solid:
                return params.solid_color;
            case ColoringMode::Region:
                return region_color(scheme, label);
            case ColoringMode::Angle:
            {
                const float b = 0.2f + 0.8f * facing;
                return glm::vec3(b);
            }
            case ColoringMode::Mixed:
            {
                const float b = 0.3f + 0.7f * facing;
                const glm::vec3 c = region_color(scheme, label) * (params.mix_factor + (1.0f - params.mix_factor) * b);
                return glm::clamp(c, glm::vec3(0.0f), glm::vec3(1.0f));
            }
            case ColoringMode::Animated:
                return animated_region_color(region_color(scheme, label), label, anim_time);
        }
        return params.solid_color;
    }

    // Кадар бүр face-ийн суурь өнгийг бөөнөөр гаргана. Шошго өөрөө дахин тооцогдохгүй.
    inline void build_face_colors(
        const SegmentationResult& seg,
        ColoringMode mode,
        ColorSchemeId scheme,
        float anim_time,
        const ColoringParams& params,
        std::vector<glm::vec3>& out)
    {
        out.resize(seg.face_count());
        for (size_t i = 0; i < seg.face_count(); ++i)
        {
            const float facing = (i < seg.faces.size()) ? facing_factor(seg.faces[i].normal, params.reference_dir) : 0.0f;
            out[i] = resolve_face_color(mode, seg.labels[i], facing, scheme, anim_time, params);
        }
    }

    inline ColoringMode next_coloring_mode(ColoringMode m)
    {
        return (ColoringMode)(((uint8_t)m + 1u) % HV_COLORING_MODE_COUNT);
    }
}
