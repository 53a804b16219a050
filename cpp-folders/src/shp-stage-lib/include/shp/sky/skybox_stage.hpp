#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: skybox_stage.hpp
    МОДУЛЬ: sky
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн sky модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <array>
#include <cstdint>
#include <stdexcept>

#include <glm/glm.hpp>

#include "shp/camera/camera_uniform.hpp"
#include "shp/math/linalg.hpp"
#include "shp/resources/cubemap.hpp"
#include "shp/shader/types.hpp"

namespace shp
{
    enum class ReflectionMode : uint8_t
    {
        Standard = 0,
        // Камерын байрлалыг хасч, skybox-ыг үргэлж хязгааргүй алсад байгаа мэт харуулна.
        CameraRecentered = 1
    };

    // Cube map-ийн тэнхлэгийн дүрэм view-ийнхээс Z-ээр эсрэг тул Z-г заавал урвуулна.
    // Үүнийг орхивол skybox урвуу харагдана.
    inline glm::vec3 skybox_axis_flip()
    {
        return glm::vec3(1.0f, 1.0f, -1.0f);
    }

    // Дэлгэц бүтэн бүрхэх нэг гурвалжин (геометргүй).
    inline std::array<glm::vec4, 3> fullscreen_triangle_clip_positions()
    {
        return {
            glm::vec4(-1.0f, 3.0f, 1.0f, 1.0f),
            glm::vec4(-1.0f, -1.0f, 1.0f, 1.0f),
            glm::vec4(3.0f, -1.0f, 1.0f, 1.0f)
        };
    }

    // Clip байрлалыг Custom0 varying-д хадгална, fragment шатанд interpolate хийгдэж ирнэ.
    inline Varyings skybox_vertex_stage(uint32_t vertex_index)
    {
        if (vertex_index >= 3u) throw std::out_of_range("skybox_vertex_stage: vertex index out of range");
        const glm::vec4 clip = fullscreen_triangle_clip_positions()[vertex_index];
        Varyings o{};
        o.clip = clip;
        o.set(VaryingSemantic::Custom0, clip);
        return o;
    }

    // Ray сэргээх матриц. Recentered горимд unproject хийсний дараа -camera_pos-оор шилжүүлнэ:
    // T(-c) * inv(P * R * T(-c)) = inv(P * R), тиймээс камерын translation нөлөөлөхгүй.
    inline glm::mat4 skybox_ray_matrix(const CameraUniform& camera, ReflectionMode mode)
    {
        if (mode == ReflectionMode::CameraRecentered)
        {
            return make_translation(-camera.position()) * camera.inv_view_proj;
        }
        return camera.inv_view_proj;
    }

    // t = M * clip, дараа нь w-д ил тод хуваана.
    inline glm::vec3 reconstruct_world_ray(const glm::mat4& ray_matrix, const glm::vec4& clip_pos)
    {
        const glm::vec4 t = ray_matrix * clip_pos;
        return normalize_checked(perspective_divide(t), "skybox ray");
    }

    inline glm::vec3 skybox_sample_direction(const CameraUniform& camera, const glm::vec4& clip_pos, ReflectionMode mode)
    {
        return reconstruct_world_ray(skybox_ray_matrix(camera, mode), clip_pos) * skybox_axis_flip();
    }

    inline FragmentOut skybox_fragment(
        const glm::vec4& clip_pos,
        const CameraUniform& camera,
        const CubemapData& environment,
        const SamplerDesc& sampler,
        ReflectionMode mode)
    {
        const glm::vec3 dir = skybox_sample_direction(camera, clip_pos, mode);
        const glm::vec4 c = sample_cubemap(environment, sampler, dir);
        FragmentOut o{};
        o.color = ColorF{c.r, c.g, c.b, 1.0f};
        return o;
    }
}
