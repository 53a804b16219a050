#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "shp/gfx/rt_types.hpp"

namespace shp
{
    enum class SamplerFilter : uint8_t
    {
        Nearest = 0,
        Linear = 1
    };

    enum class SamplerAddress : uint8_t
    {
        Repeat = 0,
        ClampToEdge = 1
    };

    struct SamplerDesc
    {
        SamplerFilter filter = SamplerFilter::Linear;
        SamplerAddress address = SamplerAddress::Repeat;
    };

    struct Texture2DData
    {
        std::string label{};
        int w = 0;
        int h = 0;
        // true үед texel-ийг sRGB гэж үзэж linear болгож уншина (base color).
        // Normal map-ийг үргэлж false байлгана.
        bool srgb = false;
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, Color clear = {0, 0, 0, 255}, bool is_srgb = false)
            : w(W), h(H), srgb(is_srgb), texels((size_t)W * (size_t)H, clear)
        {}

        bool valid() const
        {
            return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h;
        }

        Color& at(int x, int y)
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }

        const Color& at(int x, int y) const
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }
    };

    inline float srgb_to_linear(float c)
    {
        return c <= 0.04045f ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
    }

    inline glm::vec4 decode_texel(const Texture2DData& tex, const Color& c)
    {
        glm::vec4 v{(float)c.r / 255.0f, (float)c.g / 255.0f, (float)c.b / 255.0f, (float)c.a / 255.0f};
        if (tex.srgb)
        {
            v.r = srgb_to_linear(v.r);
            v.g = srgb_to_linear(v.g);
            v.b = srgb_to_linear(v.b);
        }
        return v;
    }

    namespace detail
    {
        inline int wrap_texel(int i, int n, SamplerAddress address)
        {
            if (address == SamplerAddress::ClampToEdge) return std::clamp(i, 0, n - 1);
            const int m = i % n;
            return m < 0 ? m + n : m;
        }
    }

    // Texel төвүүд (i + 0.5) / n дээр байрлана, GPU sampler-тэй ижил дүрэм.
    template<typename FetchFn>
    inline glm::vec4 sample_grid(int w, int h, const SamplerDesc& sampler, const glm::vec2& uv, FetchFn&& fetch)
    {
        if (sampler.filter == SamplerFilter::Nearest)
        {
            const int x = detail::wrap_texel((int)std::floor(uv.x * (float)w), w, sampler.address);
            const int y = detail::wrap_texel((int)std::floor(uv.y * (float)h), h, sampler.address);
            return fetch(x, y);
        }

        const float fx = uv.x * (float)w - 0.5f;
        const float fy = uv.y * (float)h - 0.5f;
        const int x0 = (int)std::floor(fx);
        const int y0 = (int)std::floor(fy);
        const float tx = fx - (float)x0;
        const float ty = fy - (float)y0;

        const int xa = detail::wrap_texel(x0, w, sampler.address);
        const int xb = detail::wrap_texel(x0 + 1, w, sampler.address);
        const int ya = detail::wrap_texel(y0, h, sampler.address);
        const int yb = detail::wrap_texel(y0 + 1, h, sampler.address);

        const glm::vec4 c00 = fetch(xa, ya);
        const glm::vec4 c10 = fetch(xb, ya);
        const glm::vec4 c01 = fetch(xa, yb);
        const glm::vec4 c11 = fetch(xb, yb);
        const glm::vec4 cx0 = glm::mix(c00, c10, tx);
        const glm::vec4 cx1 = glm::mix(c01, c11, tx);
        return glm::mix(cx0, cx1, ty);
    }

    // Texture-ийг [0,1] (linear) утгаар sample хийнэ.
    inline glm::vec4 sample_texture(const Texture2DData& tex, const SamplerDesc& sampler, const glm::vec2& uv)
    {
        if (!tex.valid()) return glm::vec4(0.0f);
        return sample_grid(tex.w, tex.h, sampler, uv, [&tex](int x, int y) {
            return decode_texel(tex, tex.at(x, y));
        });
    }

    inline glm::vec4 sample_color_target(const RT_ColorHDR& rt, const SamplerDesc& sampler, const glm::vec2& uv)
    {
        if (!rt.valid()) return glm::vec4(0.0f);
        return sample_grid(rt.w, rt.h, sampler, uv, [&rt](int x, int y) {
            return to_vec4(rt.color.at(x, y));
        });
    }

    inline Texture2DData make_solid_texture(const Color& c, bool is_srgb = false, int w = 1, int h = 1)
    {
        return Texture2DData(w, h, c, is_srgb);
    }

    inline Color encode_unorm8(const glm::vec4& v)
    {
        const auto q = [](float x) -> uint8_t {
            return (uint8_t)std::clamp((int)std::lround(x * 255.0f), 0, 255);
        };
        return Color{q(v.r), q(v.g), q(v.b), q(v.a)};
    }
}
