#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: linalg.hpp
    МОДУЛЬ: math
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн math модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cmath>
#include <stdexcept>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace shp
{
    // Урт нь үүнээс бага вектор normalize хийгдэхгүй (caller-ийн precondition зөрчил).
    constexpr float SHP_DEGENERATE_EPS = 1e-8f;
    // Perspective divide хийх үеийн |w| доод хязгаар.
    constexpr float SHP_W_EPS = 1e-8f;
    // Урвуу матриц авахын өмнө determinant-ийг шалгах хязгаар.
    constexpr float SHP_SINGULAR_EPS = 1e-12f;

    // Багана бүрийг (column-major) дарааллаар нь тавина: M * (x,y,z,1) = x*c0 + y*c1 + z*c2 + c3.
    inline glm::mat4 make_mat4_from_columns(const glm::vec4& c0, const glm::vec4& c1, const glm::vec4& c2, const glm::vec4& c3)
    {
        return glm::mat4(c0, c1, c2, c3);
    }

    inline glm::mat3 make_mat3_from_columns(const glm::vec3& c0, const glm::vec3& c1, const glm::vec3& c2)
    {
        return glm::mat3(c0, c1, c2);
    }

    inline bool is_degenerate(const glm::vec3& v)
    {
        return !(glm::length(v) >= SHP_DEGENERATE_EPS);
    }

    // Тэг урттай вектор NaN болж чимээгүй цааш дамжихгүй, алдаа шиднэ.
    inline glm::vec3 normalize_checked(const glm::vec3& v, const char* what = "vector")
    {
        const float len = glm::length(v);
        if (!(len >= SHP_DEGENERATE_EPS))
        {
            throw std::domain_error(std::string("normalize_checked: degenerate ") + what);
        }
        return v / len;
    }

    inline glm::vec4 transform_point(const glm::mat4& m, const glm::vec3& p)
    {
        return m * glm::vec4(p, 1.0f);
    }

    inline glm::vec3 transform_direction(const glm::mat4& m, const glm::vec3& d)
    {
        return glm::vec3(m * glm::vec4(d, 0.0f));
    }

    // Homogeneous үр дүнг w-д хуваана. w ~ 0 бол precondition зөрчил.
    inline glm::vec3 perspective_divide(const glm::vec4& h)
    {
        if (!(std::abs(h.w) >= SHP_W_EPS))
        {
            throw std::domain_error("perspective_divide: w is zero");
        }
        return glm::vec3(h) / h.w;
    }

    inline glm::vec3 project_point(const glm::mat4& m, const glm::vec3& p)
    {
        return perspective_divide(transform_point(m, p));
    }

    inline bool is_invertible(const glm::mat4& m)
    {
        const float det = glm::determinant(m);
        return std::isfinite(det) && std::abs(det) > SHP_SINGULAR_EPS;
    }

    inline glm::mat4 make_translation(const glm::vec3& t)
    {
        return glm::translate(glm::mat4(1.0f), t);
    }

    // Translation * Rotation * Scale: эхлээд scale, дараа нь эргүүлэлт, эцэст нь байрлал.
    inline glm::mat4 make_trs(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale)
    {
        const glm::mat4 t = glm::translate(glm::mat4(1.0f), position);
        const glm::mat4 r = glm::mat4_cast(rotation);
        const glm::mat4 s = glm::scale(glm::mat4(1.0f), scale);
        return t * r * s;
    }
}
