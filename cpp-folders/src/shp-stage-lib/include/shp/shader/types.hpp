#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "shp/gfx/rt_types.hpp"
#include "shp/math/linalg.hpp"

namespace shp
{
    constexpr uint32_t SHP_MAX_VARYINGS = 8;

    enum class VaryingSemantic : uint32_t
    {
        WorldPos = 0,
        UV0 = 1,
        NormalWS = 2,
        TangentWS = 3,
        BitangentWS = 4,
        Custom0 = 5,
        Custom1 = 6,
        Custom2 = 7
    };

    inline constexpr uint32_t varying_bit(VaryingSemantic s) { return (1u << (uint32_t)s); }

    // Full-attribute горимын vertex stage-ийн гаргах багц.
    inline constexpr uint32_t SHP_TBN_VARYINGS_MASK =
        varying_bit(VaryingSemantic::WorldPos) |
        varying_bit(VaryingSemantic::UV0) |
        varying_bit(VaryingSemantic::NormalWS) |
        varying_bit(VaryingSemantic::TangentWS) |
        varying_bit(VaryingSemantic::BitangentWS);

    struct VertexAttributes
    {
        glm::vec3 position{0.0f};
        glm::vec2 uv{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec3 bitangent{0.0f, 0.0f, 1.0f};
    };

    // Instance бүрийн 4x4 матриц, attribute binding-д зориулж 4 багана болгон задалсан.
    struct InstanceTransform
    {
        glm::vec4 c0{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec4 c1{0.0f, 1.0f, 0.0f, 0.0f};
        glm::vec4 c2{0.0f, 0.0f, 1.0f, 0.0f};
        glm::vec4 c3{0.0f, 0.0f, 0.0f, 1.0f};

        glm::mat4 matrix() const { return make_mat4_from_columns(c0, c1, c2, c3); }

        static InstanceTransform from_matrix(const glm::mat4& m)
        {
            return InstanceTransform{m[0], m[1], m[2], m[3]};
        }

        static InstanceTransform identity() { return InstanceTransform{}; }
    };

    // Vertex -> fragment дамжих өгөгдөл. clip заавал, бусад нь mask-аар зарлагдана.
    struct Varyings
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        std::array<glm::vec4, SHP_MAX_VARYINGS> slots{};
        uint32_t mask = 0u;

        bool has(VaryingSemantic s) const { return (mask & varying_bit(s)) != 0u; }

        void set(VaryingSemantic s, const glm::vec4& v)
        {
            slots[(size_t)s] = v;
            mask |= varying_bit(s);
        }

        glm::vec4 get(VaryingSemantic s, const glm::vec4& fallback = glm::vec4(0.0f)) const
        {
            return has(s) ? slots[(size_t)s] : fallback;
        }
    };

    struct MaterialSample
    {
        glm::vec3 base_color{1.0f};
        glm::vec3 normal_ts{0.0f, 0.0f, 1.0f};
    };

    // [0,1] texture утгыг [-1,1] tangent-space normal болгоно.
    inline glm::vec3 decode_normal_sample(const glm::vec3& s)
    {
        return 2.0f * s - glm::vec3(1.0f);
    }

    // Draw бүрт тусдаа дамжих хөнгөн утга (push constant). Uniform блок дотор биш,
    // dispatch бүрийн параметр болж дамжина.
    struct DrawImmediates
    {
        float scale = 0.5f;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    struct FragmentCoord
    {
        int px = 0;
        int py = 0;
        float depth01 = 1.0f;
    };
}
