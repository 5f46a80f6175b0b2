#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: region_classifier.hpp
    МОДУЛЬ: segmentation
    ЗОРИЛГО: Mesh-ийн face бүрийг төвийн байрлалаар нь нэг RegionLabel-д хуваарилна.
            Mesh ачаалсны дараа нэг удаа тооцогдож mesh-тэй хамт хадгалагдана.
*/


#include <array>
#include <cmath>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "hv/core/result.hpp"
#include "hv/resources/mesh.hpp"
#include "hv/segmentation/region_label.hpp"

namespace hv
{
    // Завсар бүр (min, max) нээлттэй. Радиус нь Y тэнхлэгээс хэвтээ зай.
    struct RangeBand
    {
        float min = 0.0f;
        float max = 0.0f;

        bool contains(float v) const { return v > min && v < max; }
    };

    /*
        Model space-д (төвлөрүүлж, урт тал нь 4 болсон) өгөгдсөн хил хязгаарууд.
        Шалгах дараалал: bridge, nacelle, pylon, engineering hull, saucer.
        Аль нь ч таарахгүй face saucer болно.
    */
    struct SegmentationThresholds
    {
        float bridge_min_y = 1.0f;
        float bridge_max_radius = 0.8f;

        RangeBand nacelle_y{-1.0f, 1.5f};
        float nacelle_min_abs_x = 2.0f;

        RangeBand pylon_abs_x{0.8f, 2.0f};
        RangeBand pylon_y{-0.5f, 0.5f};

        RangeBand engineering_y{-2.0f, 0.5f};
        RangeBand engineering_z{-1.0f, 2.0f};
        float engineering_max_abs_x = 1.5f;

        // saucer: min_y < y <= max_y
        RangeBand saucer_y{-0.5f, 2.0f};
        float saucer_max_radius = 2.5f;
    };

    constexpr size_t HV_SEGMENTATION_THRESHOLD_COUNT = 17;

    // segmentation_thresholds[] тохиргооны хавтгай дараалал.
    inline std::array<float, HV_SEGMENTATION_THRESHOLD_COUNT> segmentation_thresholds_to_array(const SegmentationThresholds& t)
    {
        return {
            t.bridge_min_y, t.bridge_max_radius,
            t.nacelle_y.min, t.nacelle_y.max, t.nacelle_min_abs_x,
            t.pylon_abs_x.min, t.pylon_abs_x.max, t.pylon_y.min, t.pylon_y.max,
            t.engineering_y.min, t.engineering_y.max, t.engineering_z.min, t.engineering_z.max, t.engineering_max_abs_x,
            t.saucer_y.min, t.saucer_y.max, t.saucer_max_radius
        };
    }

    inline Result<SegmentationThresholds> segmentation_thresholds_from_array(std::span<const float> v)
    {
        if (v.size() != HV_SEGMENTATION_THRESHOLD_COUNT)
        {
            return Result<SegmentationThresholds>::failure(
                "segmentation_thresholds expects " + std::to_string(HV_SEGMENTATION_THRESHOLD_COUNT) +
                " values, got " + std::to_string(v.size()));
        }
        SegmentationThresholds t{};
        size_t i = 0;
        t.bridge_min_y = v[i++];
        t.bridge_max_radius = v[i++];
        t.nacelle_y = RangeBand{v[i], v[i + 1]}; i += 2;
        t.nacelle_min_abs_x = v[i++];
        t.pylon_abs_x = RangeBand{v[i], v[i + 1]}; i += 2;
        t.pylon_y = RangeBand{v[i], v[i + 1]}; i += 2;
        t.engineering_y = RangeBand{v[i], v[i + 1]}; i += 2;
        t.engineering_z = RangeBand{v[i], v[i + 1]}; i += 2;
        t.engineering_max_abs_x = v[i++];
        t.saucer_y = RangeBand{v[i], v[i + 1]}; i += 2;
        t.saucer_max_radius = v[i++];
        return Result<SegmentationThresholds>::success(t);
    }

    inline Status validate_segmentation_thresholds(const SegmentationThresholds& t)
    {
        for (float v : segmentation_thresholds_to_array(t))
        {
            if (!std::isfinite(v)) return Status::failure("segmentation threshold is not finite");
        }
        const auto band_ok = [](const RangeBand& b) { return b.min < b.max; };
        if (!band_ok(t.nacelle_y)) return Status::failure("segmentation: nacelle_y min must be below max");
        if (!band_ok(t.pylon_abs_x)) return Status::failure("segmentation: pylon_abs_x min must be below max");
        if (!band_ok(t.pylon_y)) return Status::failure("segmentation: pylon_y min must be below max");
        if (!band_ok(t.engineering_y)) return Status::failure("segmentation: engineering_y min must be below max");
        if (!band_ok(t.engineering_z)) return Status::failure("segmentation: engineering_z min must be below max");
        if (!band_ok(t.saucer_y)) return Status::failure("segmentation: saucer_y min must be below max");
        if (!(t.bridge_max_radius > 0.0f)) return Status::failure("segmentation: bridge_max_radius must be positive");
        if (!(t.saucer_max_radius > 0.0f)) return Status::failure("segmentation: saucer_max_radius must be positive");
        if (t.pylon_abs_x.min < 0.0f) return Status::failure("segmentation: pylon_abs_x must be non-negative");
        if (!(t.nacelle_min_abs_x >= 0.0f)) return Status::failure("segmentation: nacelle_min_abs_x must be non-negative");
        if (!(t.engineering_max_abs_x > 0.0f)) return Status::failure("segmentation: engineering_max_abs_x must be positive");
        return Status::success();
    }

    enum class DominantAxis : uint8_t
    {
        X = 0,
        Y = 1,
        Z = 2
    };

    struct FaceRecord
    {
        glm::vec3 centroid{0.0f};
        // Талбайгаар жинлэгдсэн (нормчлоогүй) cross product. |n| = 2 * area.
        glm::vec3 weighted_normal{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        float area = 0.0f;
        DominantAxis dominant_axis = DominantAxis::Y;
    };

    struct SegmentationResult
    {
        std::vector<FaceRecord> faces{};
        std::vector<RegionLabel> labels{};
        std::array<uint32_t, HV_REGION_COUNT> counts{};
        // Ямар ч band-д ороогүй тул saucer болсон face-ийн тоо.
        uint32_t fallback_count = 0;

        size_t face_count() const { return labels.size(); }

        uint32_t count(RegionLabel r) const { return counts[region_index(r)]; }
    };

    inline DominantAxis dominant_axis_of(const glm::vec3& n)
    {
        const glm::vec3 a = glm::abs(n);
        if (a.x >= a.y && a.x >= a.z) return DominantAxis::X;
        if (a.y >= a.z) return DominantAxis::Y;
        return DominantAxis::Z;
    }

    inline FaceRecord make_face_record(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c)
    {
        FaceRecord f{};
        f.centroid = (a + b + c) / 3.0f;
        f.weighted_normal = glm::cross(b - a, c - a);
        const float len = glm::length(f.weighted_normal);
        f.area = 0.5f * len;
        if (len > 1e-12f) f.normal = f.weighted_normal / len;
        f.dominant_axis = dominant_axis_of(f.normal);
        return f;
    }

    inline RegionLabel classify_position(const glm::vec3& p, const SegmentationThresholds& t)
    {
        const float r2 = p.x * p.x + p.z * p.z;
        const float ax = std::abs(p.x);

        if (p.y > t.bridge_min_y && r2 < t.bridge_max_radius * t.bridge_max_radius) return RegionLabel::Bridge;
        if (ax > t.nacelle_min_abs_x && t.nacelle_y.contains(p.y)) return RegionLabel::Nacelle;
        if (t.pylon_abs_x.contains(ax) && t.pylon_y.contains(p.y)) return RegionLabel::Pylon;
        if (t.engineering_y.contains(p.y) && t.engineering_z.contains(p.z) && ax < t.engineering_max_abs_x)
        {
            return RegionLabel::EngineeringHull;
        }
        // Saucer шалгалт ба fallback ижил шошго өгнө, тиймээс face бүр заавал шошготой.
        return RegionLabel::Saucer;
    }

    // saucer-ийн band-д орсон эсэх (статистикт fallback-аас ялгах зорилготой).
    inline bool inside_saucer_band(const glm::vec3& p, const SegmentationThresholds& t)
    {
        const float r2 = p.x * p.x + p.z * p.z;
        return p.y > t.saucer_y.min && p.y <= t.saucer_y.max && r2 < t.saucer_max_radius * t.saucer_max_radius;
    }

    inline SegmentationResult classify_faces(const MeshData& mesh, const SegmentationThresholds& t)
    {
        SegmentationResult out{};
        const size_t tri_count = mesh.triangle_count();
        out.faces.reserve(tri_count);
        out.labels.reserve(tri_count);
        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            const uint32_t i0 = mesh.indices[ti * 3 + 0];
            const uint32_t i1 = mesh.indices[ti * 3 + 1];
            const uint32_t i2 = mesh.indices[ti * 3 + 2];
            FaceRecord f{};
            if (i0 < mesh.positions.size() && i1 < mesh.positions.size() && i2 < mesh.positions.size())
            {
                f = make_face_record(mesh.positions[i0], mesh.positions[i1], mesh.positions[i2]);
            }
            const RegionLabel label = classify_position(f.centroid, t);
            out.faces.push_back(f);
            out.labels.push_back(label);
            out.counts[region_index(label)]++;
            if (label == RegionLabel::Saucer && !inside_saucer_band(f.centroid, t)) out.fallback_count++;
        }
        return out;
    }

    inline std::string segmentation_summary(const SegmentationResult& s)
    {
        std::string out = "segmentation: " + std::to_string(s.face_count()) + " faces";
        for (size_t i = 0; i < HV_REGION_COUNT; ++i)
        {
            out += ", ";
            out += region_label_name((RegionLabel)i);
            out += "=" + std::to_string(s.counts[i]);
        }
        out += " (fallback " + std::to_string(s.fallback_count) + ")";
        return out;
    }
}
