#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: lighting_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "shp/camera/camera_uniform.hpp"
#include "shp/math/linalg.hpp"
#include "shp/resources/texture.hpp"
#include "shp/shader/types.hpp"

namespace shp
{
    // Blinn-Phong-ийг аль орон зайд тооцохыг сонгоно. Хоёулаа ижил diffuse/specular өгнө.
    enum class LightingSpace : uint8_t
    {
        World = 0,
        Tangent = 1
    };

    enum class LightingOutput : uint8_t
    {
        Shaded = 0,
        // World normal-ийг өнгө болгон харуулна, alpha нь immediate scale.
        NormalDebug = 1
    };

    struct PointLight
    {
        glm::vec3 position{2.0f, 4.0f, -3.0f};
        glm::vec3 color{1.0f, 1.0f, 1.0f};
    };

    struct LightingMaterial
    {
        float shininess = 32.0f;
        float ambient = 0.1f;
        float specular_strength = 1.0f;
    };

    struct LightingConfig
    {
        LightingSpace space = LightingSpace::World;
        LightingOutput output = LightingOutput::Shaded;
        LightingMaterial material{};
        PointLight light{};
    };

    // World-space tangent frame. Varying-аар interpolate хийгдсэн тул урт нь 1 биш байж болно.
    struct TangentFrame
    {
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec3 bitangent{0.0f, 0.0f, 1.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
    };

    // Багана нь T, B, N. Tangent -> world хувиргалт.
    // Interpolate хийсэн frame ортогонал биш байдаг тул Gram-Schmidt хийнэ:
    // N-ийг хэвээр, T-г N-д перпендикуляр болгож, B = ±cross(N, T).
    // B-ийн тэмдэг оролтын bitangent-ийн handedness-ийг хадгална.
    inline glm::mat3 make_tbn(const TangentFrame& f)
    {
        const glm::vec3 N = normalize_checked(f.normal, "normal");
        const glm::vec3 T = normalize_checked(f.tangent - N * glm::dot(N, f.tangent), "tangent");
        const glm::vec3 NxT = glm::cross(N, T);
        const float handedness = glm::dot(NxT, f.bitangent) < 0.0f ? -1.0f : 1.0f;
        return make_mat3_from_columns(T, NxT * handedness, N);
    }

    struct LightingGeometry
    {
        glm::vec3 world_pos{0.0f};
        TangentFrame frame{};
        glm::vec3 normal_ts{0.0f, 0.0f, 1.0f};
        glm::vec3 camera_pos{0.0f};
        glm::vec3 light_pos{0.0f};
    };

    struct LightingTerms
    {
        float diffuse = 0.0f;
        float specular = 0.0f;
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
    };

    inline LightingTerms blinn_phong_terms(const glm::vec3& N, const glm::vec3& L, const glm::vec3& V, float shininess)
    {
        const glm::vec3 H = normalize_checked(L + V, "half vector");
        LightingTerms t{};
        t.diffuse = std::max(glm::dot(N, L), 0.0f);
        t.specular = std::pow(std::max(glm::dot(N, H), 0.0f), shininess);
        return t;
    }

    // Normal-ийг world руу гаргаж тооцно.
    inline LightingTerms eval_lighting_terms_world(const LightingGeometry& g, float shininess)
    {
        const glm::mat3 tbn = make_tbn(g.frame);
        const glm::vec3 N = normalize_checked(tbn * g.normal_ts, "world normal");
        const glm::vec3 L = normalize_checked(g.light_pos - g.world_pos, "light direction");
        const glm::vec3 V = normalize_checked(g.camera_pos - g.world_pos, "view direction");
        LightingTerms t = blinn_phong_terms(N, L, V, shininess);
        t.normal_ws = N;
        return t;
    }

    // Гэрэл, fragment, камерын байрлалыг tangent space руу шилжүүлж тооцно.
    // make_tbn ортонормал basis буцаах тул transpose нь урвуутай тэнцүү.
    inline LightingTerms eval_lighting_terms_tangent(const LightingGeometry& g, float shininess)
    {
        const glm::mat3 tbn = make_tbn(g.frame);
        const glm::mat3 to_ts = glm::transpose(tbn);
        const glm::vec3 light_ts = to_ts * g.light_pos;
        const glm::vec3 frag_ts = to_ts * g.world_pos;
        const glm::vec3 cam_ts = to_ts * g.camera_pos;

        const glm::vec3 N = normalize_checked(g.normal_ts, "tangent normal");
        const glm::vec3 L = normalize_checked(light_ts - frag_ts, "light direction");
        const glm::vec3 V = normalize_checked(cam_ts - frag_ts, "view direction");
        LightingTerms t = blinn_phong_terms(N, L, V, shininess);
        t.normal_ws = tbn * N;
        return t;
    }

    inline LightingTerms eval_lighting_terms(LightingSpace space, const LightingGeometry& g, float shininess)
    {
        return space == LightingSpace::Tangent ? eval_lighting_terms_tangent(g, shininess) : eval_lighting_terms_world(g, shininess);
    }

    // Fragment stage-ийн texture оролтууд. Reference гишүүдтэй тул аль нэгийг
    // дутуу өгвөл compile хийгдэхгүй.
    struct LightingResources
    {
        const Texture2DData& diffuse;
        SamplerDesc diffuse_sampler;
        const Texture2DData& normal_map;
        SamplerDesc normal_sampler;
    };

    inline MaterialSample fetch_material_sample(const LightingResources& res, const glm::vec2& uv)
    {
        MaterialSample s{};
        s.base_color = glm::vec3(sample_texture(res.diffuse, res.diffuse_sampler, uv));
        s.normal_ts = decode_normal_sample(glm::vec3(sample_texture(res.normal_map, res.normal_sampler, uv)));
        return s;
    }

    struct LightingFragmentIn
    {
        glm::vec3 world_pos{0.0f};
        glm::vec2 uv{0.0f};
        TangentFrame frame{};
    };

    inline LightingFragmentIn lighting_fragment_in(const Varyings& v)
    {
        LightingFragmentIn in{};
        in.world_pos = glm::vec3(v.get(VaryingSemantic::WorldPos));
        const glm::vec4 uv = v.get(VaryingSemantic::UV0);
        in.uv = glm::vec2(uv.x, uv.y);
        in.frame.tangent = glm::vec3(v.get(VaryingSemantic::TangentWS));
        in.frame.bitangent = glm::vec3(v.get(VaryingSemantic::BitangentWS));
        in.frame.normal = glm::vec3(v.get(VaryingSemantic::NormalWS));
        return in;
    }

    // Normal-mapped Blinn-Phong fragment. Alpha нь гэрэлтүүлгээс биш,
    // draw-ийн immediate scale-аас ирнэ.
    inline FragmentOut lighting_fragment(
        const LightingFragmentIn& in,
        const LightingResources& res,
        const CameraUniform& camera,
        const LightingConfig& cfg,
        const DrawImmediates& immediates)
    {
        const MaterialSample ms = fetch_material_sample(res, in.uv);

        LightingGeometry g{};
        g.world_pos = in.world_pos;
        g.frame = in.frame;
        g.normal_ts = ms.normal_ts;
        g.camera_pos = camera.position();
        g.light_pos = cfg.light.position;

        const LightingTerms t = eval_lighting_terms(cfg.space, g, cfg.material.shininess);

        FragmentOut o{};
        if (cfg.output == LightingOutput::NormalDebug)
        {
            const glm::vec3 n = t.normal_ws * 0.5f + glm::vec3(0.5f);
            o.color = ColorF{n.r, n.g, n.b, immediates.scale};
            return o;
        }

        const glm::vec3 diffuse = ms.base_color * (cfg.material.ambient + t.diffuse) * cfg.light.color;
        const glm::vec3 specular = cfg.light.color * (cfg.material.specular_strength * t.specular);
        const glm::vec3 c = diffuse + specular;
        o.color = ColorF{c.r, c.g, c.b, immediates.scale};
        return o;
    }
}
