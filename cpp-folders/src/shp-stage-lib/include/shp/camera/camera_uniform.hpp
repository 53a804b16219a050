#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: camera_uniform.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн camera модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>

#include "shp/core/log.hpp"
#include "shp/core/result.hpp"
#include "shp/math/linalg.hpp"

namespace shp
{
    // Кадр бүрт нэг удаа бэлтгэгдэж, draw-ийн турш зөвхөн уншигдах камерын блок.
    struct CameraUniform
    {
        glm::mat4 view_proj{1.0f};
        glm::mat4 inv_view_proj{1.0f};
        glm::vec4 world_pos{0.0f, 0.0f, 0.0f, 1.0f};

        glm::vec3 position() const { return glm::vec3(world_pos); }
    };

    inline Result<CameraUniform> make_camera_uniform_from_view_proj(const glm::mat4& view_proj, const glm::vec3& world_pos)
    {
        if (!is_invertible(view_proj))
        {
            log_error("camera uniform: view-projection matrix is singular");
            return Result<CameraUniform>::failure("view-projection matrix is singular");
        }
        CameraUniform cu{};
        cu.view_proj = view_proj;
        cu.inv_view_proj = glm::inverse(view_proj);
        cu.world_pos = glm::vec4(world_pos, 1.0f);
        return Result<CameraUniform>::success(cu);
    }

    inline Result<CameraUniform> make_camera_uniform(const glm::mat4& view, const glm::mat4& proj, const glm::vec3& world_pos)
    {
        return make_camera_uniform_from_view_proj(proj * view, world_pos);
    }
}
