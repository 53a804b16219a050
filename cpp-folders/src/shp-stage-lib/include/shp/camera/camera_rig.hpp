#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: camera_rig.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн camera модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shp/camera/camera_uniform.hpp"
#include "shp/camera/convention.hpp"
#include "shp/math/linalg.hpp"

namespace shp
{
    // Камерын тайлбар: проекцийн параметр + world transform (scale-гүй).
    struct CameraRig
    {
        float fov_y_degrees = 60.0f;
        float aspect = 1.0f;
        float znear = 0.1f;
        float zfar = 100.0f;
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    inline glm::mat4 camera_projection(const CameraRig& rig)
    {
        return perspective_lh_zo(glm::radians(rig.fov_y_degrees), rig.aspect, rig.znear, rig.zfar);
    }

    inline glm::mat4 camera_world_transform(const CameraRig& rig)
    {
        return make_trs(rig.position, rig.rotation, glm::vec3(1.0f));
    }

    // View нь камерын world transform-ийн урвуу. Rotation normalize хийгдээгүй бол
    // урвуу нь тогтворгүй болох тул эхлээд normalize хийнэ.
    inline glm::mat4 camera_view(const CameraRig& rig)
    {
        CameraRig r = rig;
        r.rotation = glm::normalize(r.rotation);
        return glm::inverse(camera_world_transform(r));
    }

    inline Result<CameraUniform> build_camera_uniform(const CameraRig& rig)
    {
        if (!(rig.zfar > rig.znear) || !(rig.znear > 0.0f) || !(rig.aspect > 0.0f))
        {
            log_error("camera rig: invalid projection parameters");
            return Result<CameraUniform>::failure("invalid projection parameters");
        }
        return make_camera_uniform(camera_view(rig), camera_projection(rig), rig.position);
    }
}
