#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: pass_tonemap.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include "shp/core/context.hpp"
#include "shp/core/log.hpp"
#include "shp/core/result.hpp"
#include "shp/frame/stage_params.hpp"
#include "shp/gfx/rt_types.hpp"
#include "shp/job/parallel_for.hpp"
#include "shp/resources/texture.hpp"

namespace shp
{
    // Эцсийн HDR buffer-ийг харуулах/хадгалах LDR болгоно.
    class PassTonemap
    {
    public:
        struct Inputs
        {
            const TonemapParams* params = nullptr;
            const RT_ColorHDR* hdr = nullptr; // input
            RT_ColorLDR* ldr = nullptr;       // output
        };

        // Амжилттай бол бичсэн pixel-ийн тоог буцаана.
        Result<uint64_t> execute(StageContext& ctx, const Inputs& in) const
        {
            if (!in.hdr || !in.ldr)
            {
                log_error("tonemap: input or output target is not bound");
                return Result<uint64_t>::failure("tonemap: input or output target is not bound");
            }
            if (in.hdr->w <= 0 || in.hdr->h <= 0 || in.ldr->w <= 0 || in.ldr->h <= 0)
            {
                log_error("tonemap: empty target");
                return Result<uint64_t>::failure("tonemap: empty target");
            }

            const TonemapParams params = in.params ? *in.params : TonemapParams{};
            const RT_ColorHDR& hdr = *in.hdr;
            RT_ColorLDR& ldr = *in.ldr;
            const int w = std::min(hdr.w, ldr.w);
            const int h = std::min(hdr.h, ldr.h);
            const float exposure = std::max(0.0001f, params.exposure);
            const float inv_gamma = 1.0f / std::max(0.001f, params.gamma);

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        const ColorF s = hdr.color.at(x, y);

                        // Exposure
                        float r = std::max(0.0f, s.r * exposure);
                        float g = std::max(0.0f, s.g * exposure);
                        float b = std::max(0.0f, s.b * exposure);

                        // Reinhard tone map
                        r = r / (1.0f + r);
                        g = g / (1.0f + g);
                        b = b / (1.0f + b);

                        // Gamma
                        r = std::pow(r, inv_gamma);
                        g = std::pow(g, inv_gamma);
                        b = std::pow(b, inv_gamma);

                        ldr.color.at(x, y) = encode_unorm8(glm::vec4(r, g, b, std::clamp(s.a, 0.0f, 1.0f)));
                    }
                }
            });
            ctx.debug.dispatches++;
            return Result<uint64_t>::success((uint64_t)w * (uint64_t)h);
        }
    };
}
