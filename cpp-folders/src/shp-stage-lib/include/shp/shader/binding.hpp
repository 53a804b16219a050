#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: binding.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <span>
#include <string>

#include "shp/camera/camera_uniform.hpp"
#include "shp/core/log.hpp"
#include "shp/core/result.hpp"
#include "shp/gfx/rt_types.hpp"
#include "shp/resources/cubemap.hpp"
#include "shp/resources/texture.hpp"
#include "shp/shader/types.hpp"

namespace shp
{
    enum class ResourceSlot : uint32_t
    {
        CameraUniform = 0,
        InstanceTransform = 1,
        DiffuseTexture = 2,
        NormalTexture = 3,
        EnvironmentCube = 4,
        SceneColor = 5,
        DrawImmediates = 6,
        ComputeInput = 7,
        ComputeOutput = 8,
        Count = 9
    };

    inline constexpr uint32_t slot_bit(ResourceSlot s) { return (1u << (uint32_t)s); }

    inline const char* resource_slot_name(ResourceSlot s)
    {
        switch (s)
        {
            case ResourceSlot::CameraUniform: return "camera_uniform";
            case ResourceSlot::InstanceTransform: return "instance_transform";
            case ResourceSlot::DiffuseTexture: return "diffuse_texture";
            case ResourceSlot::NormalTexture: return "normal_texture";
            case ResourceSlot::EnvironmentCube: return "environment_cube";
            case ResourceSlot::SceneColor: return "scene_color";
            case ResourceSlot::DrawImmediates: return "draw_immediates";
            case ResourceSlot::ComputeInput: return "compute_input";
            case ResourceSlot::ComputeOutput: return "compute_output";
            case ResourceSlot::Count: break;
        }
        return "unknown";
    }

    enum class StageKind : uint8_t
    {
        VertexPositionOnly = 0,
        VertexFull = 1,
        Lighting = 2,
        Skybox = 3,
        BoxBlur = 4,
        Overlay = 5,
        Compute = 6
    };

    inline const char* stage_kind_name(StageKind k)
    {
        switch (k)
        {
            case StageKind::VertexPositionOnly: return "vertex_position_only";
            case StageKind::VertexFull: return "vertex_full";
            case StageKind::Lighting: return "lighting";
            case StageKind::Skybox: return "skybox";
            case StageKind::BoxBlur: return "box_blur";
            case StageKind::Overlay: return "overlay";
            case StageKind::Compute: return "compute";
        }
        return "unknown";
    }

    // Stage бүрийн зарласан (заавал шаардлагатай) slot-ууд.
    inline uint32_t stage_binding_layout(StageKind k)
    {
        switch (k)
        {
            case StageKind::VertexPositionOnly:
                return 0u;
            case StageKind::VertexFull:
                return slot_bit(ResourceSlot::CameraUniform) | slot_bit(ResourceSlot::InstanceTransform);
            case StageKind::Lighting:
                return slot_bit(ResourceSlot::CameraUniform) |
                    slot_bit(ResourceSlot::DiffuseTexture) |
                    slot_bit(ResourceSlot::NormalTexture) |
                    slot_bit(ResourceSlot::DrawImmediates);
            case StageKind::Skybox:
                return slot_bit(ResourceSlot::CameraUniform) | slot_bit(ResourceSlot::EnvironmentCube);
            case StageKind::BoxBlur:
                return slot_bit(ResourceSlot::SceneColor);
            case StageKind::Overlay:
                return slot_bit(ResourceSlot::SceneColor);
            case StageKind::Compute:
                return slot_bit(ResourceSlot::ComputeInput) | slot_bit(ResourceSlot::ComputeOutput);
        }
        return 0u;
    }

    struct TextureBinding
    {
        const Texture2DData* texture = nullptr;
        SamplerDesc sampler{};

        bool bound() const { return texture != nullptr && texture->valid(); }
    };

    struct CubemapBinding
    {
        const CubemapData* cubemap = nullptr;
        SamplerDesc sampler{};

        bool bound() const { return cubemap != nullptr && cubemap->valid(); }
    };

    struct ColorTargetBinding
    {
        const RT_ColorHDR* target = nullptr;
        SamplerDesc sampler{SamplerFilter::Linear, SamplerAddress::ClampToEdge};

        bool bound() const { return target != nullptr && target->valid(); }
    };

    // Caller-ийн бэлдсэн нөөцүүд. Эзэмшихгүй, зөвхөн заана.
    struct BindingSet
    {
        const CameraUniform* camera = nullptr;
        const InstanceTransform* instance = nullptr;
        TextureBinding diffuse{};
        TextureBinding normal{};
        CubemapBinding environment{};
        ColorTargetBinding scene_color{};
        const DrawImmediates* immediates = nullptr;
        std::span<const float> compute_input{};
        std::span<float> compute_output{};
        // Buffer-ийг зориуд хоосон (0 урт) холбох боломжтой байлгахын тулд тусад нь тэмдэглэнэ.
        bool compute_input_bound = false;
        bool compute_output_bound = false;

        uint32_t supplied_mask() const
        {
            uint32_t m = 0u;
            if (camera) m |= slot_bit(ResourceSlot::CameraUniform);
            if (instance) m |= slot_bit(ResourceSlot::InstanceTransform);
            if (diffuse.bound()) m |= slot_bit(ResourceSlot::DiffuseTexture);
            if (normal.bound()) m |= slot_bit(ResourceSlot::NormalTexture);
            if (environment.bound()) m |= slot_bit(ResourceSlot::EnvironmentCube);
            if (scene_color.bound()) m |= slot_bit(ResourceSlot::SceneColor);
            if (immediates) m |= slot_bit(ResourceSlot::DrawImmediates);
            if (compute_input_bound) m |= slot_bit(ResourceSlot::ComputeInput);
            if (compute_output_bound) m |= slot_bit(ResourceSlot::ComputeOutput);
            return m;
        }
    };

    struct LinkedStage
    {
        StageKind kind = StageKind::VertexPositionOnly;
        uint32_t layout_mask = 0u;
        BindingSet bindings{};
    };

    // Link шат: stage-ийн зарласан slot бүр холбогдсон эсэхийг dispatch-аас өмнө шалгана.
    // Дутуу slot-ыг default утгаар орлуулахгүй.
    inline Result<LinkedStage> link_stage(StageKind kind, const BindingSet& bindings)
    {
        const uint32_t required = stage_binding_layout(kind);
        const uint32_t missing = required & ~bindings.supplied_mask();
        if (missing != 0u)
        {
            std::string names{};
            for (uint32_t i = 0; i < (uint32_t)ResourceSlot::Count; ++i)
            {
                if ((missing & (1u << i)) == 0u) continue;
                if (!names.empty()) names += ", ";
                names += resource_slot_name((ResourceSlot)i);
            }
            const std::string msg = std::string("stage '") + stage_kind_name(kind) + "' missing bindings: " + names;
            log_error(msg);
            return Result<LinkedStage>::failure(msg);
        }

        LinkedStage linked{};
        linked.kind = kind;
        linked.layout_mask = required;
        linked.bindings = bindings;
        return Result<LinkedStage>::success(linked);
    }
}
