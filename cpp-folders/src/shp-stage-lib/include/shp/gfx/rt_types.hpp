#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн gfx модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace shp
{
    struct Color
    {
        uint8_t r, g, b, a;
    };

    struct ColorF
    {
        float r, g, b, a;
    };

    inline glm::vec4 to_vec4(const ColorF& c)
    {
        return glm::vec4(c.r, c.g, c.b, c.a);
    }

    inline ColorF to_colorf(const glm::vec4& v)
    {
        return ColorF{v.r, v.g, v.b, v.a};
    }

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = W;
            h = H;
            data.assign((size_t)w * (size_t)h, clear);
        }

        void clear(const TPixel& clear_value)
        {
            std::fill(data.begin(), data.end(), clear_value);
        }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }
    };

    struct RT_ColorLDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int W, int H, Color clear = {0, 0, 0, 255}) : w(W), h(H), color(W, H, clear) {}

        void clear(Color c = {0, 0, 0, 255}) { color.clear(c); }
    };

    // Scene pass-ийн гаралт, post-process pass-ийн оролт.
    struct RT_ColorHDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 1.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(ColorF c = {0.0f, 0.0f, 0.0f, 1.0f}) { color.clear(c); }
        bool valid() const { return w > 0 && h > 0 && color.data.size() == (size_t)w * (size_t)h; }
    };

    // [0,1] depth (LH, ZO проекц). 1.0 = far.
    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int W, int H) : w(W), h(H), depth(W, H, 1.0f) {}

        void clear(float d = 1.0f) { depth.clear(d); }
    };
}
