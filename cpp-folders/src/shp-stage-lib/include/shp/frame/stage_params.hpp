#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: stage_params.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн frame модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>

#include <glm/glm.hpp>

#include "shp/shader/lighting_stage.hpp"
#include "shp/sky/skybox_stage.hpp"

namespace shp
{
    struct BoxBlurParams
    {
        // Texel зай = distance_texels / reference_resolution (uv нэгжээр).
        float reference_resolution = 600.0f;
        float distance_texels = 2.0f;

        float texel_distance() const
        {
            return reference_resolution > 0.0f ? distance_texels / reference_resolution : 0.0f;
        }
    };

    struct OverlayParams
    {
        float alpha = 0.25f;
        glm::vec4 color{0.1f, 0.1f, 0.3f, 1.0f};
    };

    struct TonemapParams
    {
        float exposure = 1.0f;
        float gamma = 2.2f;
    };

    struct ComputeDispatchDesc
    {
        uint32_t workgroup_count = 8;
        uint32_t workgroup_size = 1;
        // Нэг кадрт dispatch-ийг хэдэн удаа давтах.
        uint32_t iterate_count = 1;

        uint64_t invocation_count() const
        {
            return (uint64_t)workgroup_count * (uint64_t)workgroup_size;
        }
    };

    struct PassParamBlocks
    {
        BoxBlurParams blur{};
        OverlayParams overlay{};
        TonemapParams tonemap{};
    };

    // Stage-уудын тохиргооны нэгдсэн блок. Default утгууд нь анхны engine-ийнхтэй таарна.
    struct StageParams
    {
        int w = 600;
        int h = 600;

        LightingConfig lighting{};
        ReflectionMode reflection_mode = ReflectionMode::CameraRecentered;

        bool enable_skybox = true;
        bool enable_blur = true;
        bool enable_overlay = true;

        PassParamBlocks pass{};
        ComputeDispatchDesc compute{};
        float compute_scale = 2.0f;
    };
}
