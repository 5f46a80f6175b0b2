#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: phong.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Phong гэрэлтүүлгийн загвар (ambient + diffuse + specular).
            Lighting унтраалттай үед гэрэлтүүлгийг бүхэлд нь алгасна.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace hv
{
    struct PhongMaterial
    {
        glm::vec3 ambient{0.3f, 0.3f, 0.4f};
        glm::vec3 diffuse{0.6f, 0.7f, 0.8f};
        glm::vec3 specular{0.9f, 0.9f, 0.9f};
        float shininess = 32.0f;
    };

    /*
        Чиглэлт гэрэл. direction нь гэрлийн цацраг явах чиглэл (гэрлээс объект руу).
        Shading-д гадаргуугаас гэрэл рүү чиглэсэн L = -direction хэрэглэнэ.
    */
    struct DirectionalLight
    {
        glm::vec3 direction{-0.57735f, -0.57735f, -0.57735f};
        glm::vec3 ambient{0.2f, 0.2f, 0.3f};
        glm::vec3 diffuse{0.8f, 0.9f, 1.0f};
        glm::vec3 specular{1.0f, 1.0f, 1.0f};
        float intensity = 1.0f;
    };

    struct PhongTerms
    {
        glm::vec3 ambient{0.0f};
        glm::vec3 diffuse{0.0f};
        glm::vec3 specular{0.0f};

        glm::vec3 total() const
        {
            return ambient + diffuse + specular;
        }
    };

    inline glm::vec3 light_vector_to_surface(const DirectionalLight& light)
    {
        const float len = glm::length(light.direction);
        if (!(len > 1e-8f)) return glm::vec3(0.0f, 1.0f, 0.0f);
        return -light.direction / len;
    }

    inline float lambert_factor(const glm::vec3& n, const glm::vec3& l)
    {
        return std::max(0.0f, glm::dot(n, l));
    }

    // R = reflect(-L, N). Ар талаас тусах гэрэлд (N.L <= 0) specular үгүй.
    inline float phong_specular_factor(const glm::vec3& n, const glm::vec3& l, const glm::vec3& v, float shininess)
    {
        if (glm::dot(n, l) <= 0.0f) return 0.0f;
        const glm::vec3 r = glm::reflect(-l, n);
        const float rv = std::max(0.0f, glm::dot(r, v));
        if (rv <= 0.0f) return 0.0f;
        return std::pow(rv, std::max(shininess, 1.0f));
    }

    // n, l, v нь нэгж урттай гэж үзнэ.
    inline PhongTerms evaluate_phong(
        const glm::vec3& n,
        const glm::vec3& l,
        const glm::vec3& v,
        const PhongMaterial& material,
        const DirectionalLight& light)
    {
        PhongTerms t{};
        t.ambient = material.ambient * light.ambient;
        t.diffuse = material.diffuse * light.diffuse * (lambert_factor(n, l) * light.intensity);
        t.specular = material.specular * light.specular * (phong_specular_factor(n, l, v, material.shininess) * light.intensity);
        return t;
    }

    struct SurfaceSample
    {
        glm::vec3 position_ws{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec3 camera_pos{0.0f};
        PhongMaterial material{};
    };

    /*
        lighting_enabled == false үед material diffuse өнгийг шууд буцаана.
        Энэ нь харанхуй гэрлээс ялгагдах ёстой тул intensity 0 гэж тооцохгүй.
    */
    inline glm::vec3 shade_surface(const SurfaceSample& s, const DirectionalLight& light, bool lighting_enabled)
    {
        if (!lighting_enabled) return s.material.diffuse;

        const float nlen = glm::length(s.normal_ws);
        const glm::vec3 n = (nlen > 1e-8f) ? (s.normal_ws / nlen) : glm::vec3(0.0f, 1.0f, 0.0f);
        const glm::vec3 to_cam = s.camera_pos - s.position_ws;
        const float vlen = glm::length(to_cam);
        const glm::vec3 v = (vlen > 1e-8f) ? (to_cam / vlen) : n;
        const glm::vec3 l = light_vector_to_surface(light);
        return evaluate_phong(n, l, v, s.material, light).total();
    }

    // Color-material: гадаргуугийн суурь өнгө ambient ба diffuse-ийг орлоно.
    inline PhongMaterial with_base_color(PhongMaterial m, const glm::vec3& base_color)
    {
        m.ambient = base_color;
        m.diffuse = base_color;
        return m;
    }

    inline float clamp_shininess(float s)
    {
        return std::clamp(s, 1.0f, 128.0f);
    }
}
