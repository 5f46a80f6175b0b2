#pragma once

/*
    HULLVIEW РЕНДЕРЕР САН

    ФАЙЛ: convention.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Зүүн гарын (LH, +Z forward) координатын дүрэм болон проекцийн wrapper-ууд.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace hv
{
    // Зүүн гарын дүрэмтэй (LH) харах матриц. NDC Z-тэнхлэг нь [-1, 1] хооронд байна.
    inline glm::mat4 look_at_lh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, target, up);
    }

    // Зүүн гарын дүрэмтэй (LH) хэтийн төлөвийн проекц. NDC Z-тэнхлэг нь [-1, 1] байна.
    inline glm::mat4 perspective_lh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_NO(fovy_radians, aspect, znear, zfar);
    }
}
