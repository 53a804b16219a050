#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: cubemap.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <array>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "shp/resources/texture.hpp"

namespace shp
{
    enum class CubeFace : uint8_t
    {
        PosX = 0,
        NegX = 1,
        PosY = 2,
        NegY = 3,
        PosZ = 4,
        NegZ = 5
    };

    struct CubemapData
    {
        // 0:+X, 1:-X, 2:+Y, 3:-Y, 4:+Z, 5:-Z
        std::array<Texture2DData, 6> face{};

        bool valid() const
        {
            for (const Texture2DData& f : face)
            {
                if (!f.valid()) return false;
            }
            return true;
        }

        const Texture2DData& get(CubeFace f) const { return face[(size_t)f]; }
        Texture2DData& get(CubeFace f) { return face[(size_t)f]; }
    };

    struct CubeCoord
    {
        CubeFace face = CubeFace::PosZ;
        glm::vec2 uv{0.5f};
    };

    // GPU cube map-ийн стандарт face/uv сонголт (v=0 нь face-ийн дээд мөр).
    // d нь тэг биш байх ёстой.
    inline CubeCoord cube_coord_from_direction(const glm::vec3& d)
    {
        const float ax = std::abs(d.x);
        const float ay = std::abs(d.y);
        const float az = std::abs(d.z);

        CubeCoord cc{};
        float sc = 0.0f;
        float tc = 0.0f;
        float ma = 1.0f;

        if (ax >= ay && ax >= az)
        {
            ma = ax;
            if (d.x > 0.0f) { cc.face = CubeFace::PosX; sc = -d.z; tc = -d.y; }
            else            { cc.face = CubeFace::NegX; sc =  d.z; tc = -d.y; }
        }
        else if (ay >= ax && ay >= az)
        {
            ma = ay;
            if (d.y > 0.0f) { cc.face = CubeFace::PosY; sc =  d.x; tc =  d.z; }
            else            { cc.face = CubeFace::NegY; sc =  d.x; tc = -d.z; }
        }
        else
        {
            ma = az;
            if (d.z > 0.0f) { cc.face = CubeFace::PosZ; sc =  d.x; tc = -d.y; }
            else            { cc.face = CubeFace::NegZ; sc = -d.x; tc = -d.y; }
        }

        cc.uv = glm::vec2(0.5f * (sc / ma + 1.0f), 0.5f * (tc / ma + 1.0f));
        return cc;
    }

    // Face хоорондын seam дээр filter хийхгүй; uv-г face дотор clamp хийнэ.
    inline glm::vec4 sample_cubemap(const CubemapData& cube, const SamplerDesc& sampler, const glm::vec3& direction)
    {
        if (!cube.valid()) return glm::vec4(0.0f);
        const CubeCoord cc = cube_coord_from_direction(direction);
        SamplerDesc face_sampler = sampler;
        face_sampler.address = SamplerAddress::ClampToEdge;
        return sample_texture(cube.get(cc.face), face_sampler, cc.uv);
    }

    // Face бүрийг нэг өнгөөр дүүргэсэн cube (тест, demo-д).
    inline CubemapData make_solid_cubemap(const std::array<Color, 6>& face_colors, int size = 4)
    {
        CubemapData cube{};
        for (size_t i = 0; i < 6; ++i)
        {
            cube.face[i] = Texture2DData(size, size, face_colors[i], false);
        }
        return cube;
    }
}
