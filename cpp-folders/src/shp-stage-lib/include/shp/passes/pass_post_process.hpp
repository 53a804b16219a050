#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: pass_post_process.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн passes модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <string>

#include <glm/glm.hpp>

#include "shp/core/context.hpp"
#include "shp/core/log.hpp"
#include "shp/core/result.hpp"
#include "shp/frame/stage_params.hpp"
#include "shp/gfx/rt_types.hpp"
#include "shp/job/parallel_for.hpp"
#include "shp/resources/texture.hpp"
#include "shp/shader/binding.hpp"

namespace shp
{
    // Дөрвөн чиглэлийн хөршийн дундаж. Төв texel орохгүй.
    inline ColorF box_blur_fragment(const RT_ColorHDR& scene, const SamplerDesc& sampler, const glm::vec2& uv, float texel_distance)
    {
        const glm::vec4 top = sample_color_target(scene, sampler, uv + glm::vec2(0.0f, texel_distance));
        const glm::vec4 bottom = sample_color_target(scene, sampler, uv - glm::vec2(0.0f, texel_distance));
        const glm::vec4 left = sample_color_target(scene, sampler, uv - glm::vec2(texel_distance, 0.0f));
        const glm::vec4 right = sample_color_target(scene, sampler, uv + glm::vec2(texel_distance, 0.0f));
        return to_colorf((top + bottom + left + right) * 0.25f);
    }

    // alpha*overlay + (1-alpha)*input. glm::mix биш шууд томьёо: alpha 0/1 үед яг оролтоо буцаана.
    inline ColorF overlay_fragment(const ColorF& in, const OverlayParams& params)
    {
        const float a = params.alpha;
        const float ia = 1.0f - a;
        return ColorF{
            a * params.color.r + ia * in.r,
            a * params.color.g + ia * in.g,
            a * params.color.b + ia * in.b,
            a * params.color.a + ia * in.a
        };
    }

    inline glm::vec2 pixel_center_uv(int x, int y, int w, int h)
    {
        return glm::vec2(((float)x + 0.5f) / (float)w, ((float)y + 0.5f) / (float)h);
    }

    namespace detail
    {
        inline Result<const RT_ColorHDR*> link_screen_pass(StageKind kind, const BindingSet& bindings, const RT_ColorHDR* out)
        {
            const Result<LinkedStage> linked = link_stage(kind, bindings);
            if (!linked.ok) return Result<const RT_ColorHDR*>::failure(linked.error);
            if (!out || out->w <= 0 || out->h <= 0)
            {
                log_error(std::string(stage_kind_name(kind)) + ": output target is not bound");
                return Result<const RT_ColorHDR*>::failure("output target is not bound");
            }
            // Screen pass бүр өмнөх pass-ийн buffer-ийг уншина; нэг buffer-т унших/бичихийг хориглоно.
            if (bindings.scene_color.target == out)
            {
                log_error(std::string(stage_kind_name(kind)) + ": scene color and output alias");
                return Result<const RT_ColorHDR*>::failure("scene color and output alias");
            }
            return Result<const RT_ColorHDR*>::success(bindings.scene_color.target);
        }
    }

    class PassBoxBlur
    {
    public:
        struct Inputs
        {
            const BoxBlurParams* params = nullptr;
            BindingSet bindings{};        // scene_color: input
            RT_ColorHDR* out = nullptr;   // output
        };

        Result<uint64_t> execute(StageContext& ctx, const Inputs& in) const
        {
            const Result<const RT_ColorHDR*> src = detail::link_screen_pass(StageKind::BoxBlur, in.bindings, in.out);
            if (!src.ok) return Result<uint64_t>::failure(src.error);

            const BoxBlurParams params = in.params ? *in.params : BoxBlurParams{};
            const float d = params.texel_distance();
            const RT_ColorHDR& scene = *src.value;
            const SamplerDesc sampler = in.bindings.scene_color.sampler;
            RT_ColorHDR& out = *in.out;
            const int w = out.w;
            const int h = out.h;

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        out.color.at(x, y) = box_blur_fragment(scene, sampler, pixel_center_uv(x, y, w, h), d);
                    }
                }
            });

            const uint64_t n = (uint64_t)w * (uint64_t)h;
            ctx.debug.fragment_invocations += n;
            ctx.debug.dispatches++;
            return Result<uint64_t>::success(n);
        }
    };

    class PassOverlay
    {
    public:
        struct Inputs
        {
            const OverlayParams* params = nullptr;
            BindingSet bindings{};        // scene_color: input
            RT_ColorHDR* out = nullptr;   // output
        };

        Result<uint64_t> execute(StageContext& ctx, const Inputs& in) const
        {
            const Result<const RT_ColorHDR*> src = detail::link_screen_pass(StageKind::Overlay, in.bindings, in.out);
            if (!src.ok) return Result<uint64_t>::failure(src.error);

            const OverlayParams params = in.params ? *in.params : OverlayParams{};
            const RT_ColorHDR& scene = *src.value;
            const SamplerDesc sampler = in.bindings.scene_color.sampler;
            RT_ColorHDR& out = *in.out;
            const int w = out.w;
            const int h = out.h;

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        const ColorF c = to_colorf(sample_color_target(scene, sampler, pixel_center_uv(x, y, w, h)));
                        out.color.at(x, y) = overlay_fragment(c, params);
                    }
                }
            });

            const uint64_t n = (uint64_t)w * (uint64_t)h;
            ctx.debug.fragment_invocations += n;
            ctx.debug.dispatches++;
            return Result<uint64_t>::success(n);
        }
    };
}
