#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: convention.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн camera модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace shp
{
    // Зүүн гарын дүрэмтэй (LH) харах матриц. Камер +Z тэнхлэг рүү харна.
    inline glm::mat4 look_at_lh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, target, up);
    }

    // LH хэтийн төлөвийн проекц. NDC Z нь [0, 1] мужид (clip.w = view z).
    inline glm::mat4 perspective_lh_zo(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_ZO(fovy_radians, aspect, znear, zfar);
    }

    // LH ортограф проекц. NDC Z нь [0, 1] мужид.
    inline glm::mat4 ortho_lh_zo(float left, float right, float bottom, float top, float znear, float zfar)
    {
        return glm::orthoLH_ZO(left, right, bottom, top, znear, zfar);
    }
}
