#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: compute_stage.hpp
    МОДУЛЬ: compute
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн compute модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>

#include "shp/core/context.hpp"
#include "shp/core/result.hpp"
#include "shp/frame/stage_params.hpp"
#include "shp/job/parallel_for.hpp"
#include "shp/shader/binding.hpp"

namespace shp
{
    // out[i] = in[i] * factor
    struct ScaleKernel
    {
        float factor = 2.0f;

        float operator()(float v) const { return v * factor; }
    };

    inline ScaleKernel scale_kernel(float factor)
    {
        return ScaleKernel{factor};
    }

    namespace detail
    {
        inline bool spans_overlap(std::span<const float> a, std::span<float> b)
        {
            if (a.empty() || b.empty()) return false;
            const std::less<const float*> lt{};
            const float* a0 = a.data();
            const float* a1 = a.data() + a.size();
            const float* b0 = b.data();
            const float* b1 = b.data() + b.size();
            return lt(a0, b1) && lt(b0, a1);
        }

        inline void validate_compute_dispatch(const ComputeDispatchDesc& desc, std::span<const float> input, std::span<float> output)
        {
            const uint64_t n = desc.invocation_count();
            if (n > (uint64_t)std::numeric_limits<int>::max())
            {
                throw std::invalid_argument("dispatch_compute: invocation count " + std::to_string(n) + " exceeds INT_MAX");
            }
            if (n != (uint64_t)input.size() || n != (uint64_t)output.size())
            {
                throw std::invalid_argument(
                    "dispatch_compute: invocation count " + std::to_string(n) +
                    " does not match buffers (input " + std::to_string(input.size()) +
                    ", output " + std::to_string(output.size()) + ")");
            }
            if (spans_overlap(input, output))
            {
                throw std::invalid_argument("dispatch_compute: input and output buffers alias");
            }
        }
    }

    // Elementwise compute dispatch. Invocation i зөвхөн output[i]-г бичнэ.
    // iterate_count > 1 үед ижил dispatch-ийг давтана (оролт өөрчлөгдөхгүй тул үр дүн ижил).
    template<typename Kernel>
    inline uint64_t dispatch_compute(
        StageContext& ctx,
        const ComputeDispatchDesc& desc,
        std::span<const float> input,
        std::span<float> output,
        const Kernel& kernel)
    {
        detail::validate_compute_dispatch(desc, input, output);

        const uint64_t n = desc.invocation_count();
        const int grain = (int)std::max<uint32_t>(1u, desc.workgroup_size);
        for (uint32_t it = 0; it < desc.iterate_count; ++it)
        {
            parallel_for_index(ctx.job_system, (size_t)n, grain, [&](size_t i)
            {
                output[i] = kernel(input[i]);
            });
            ctx.debug.compute_invocations += n;
            ctx.debug.dispatches++;
        }
        return n * (uint64_t)desc.iterate_count;
    }

    // BindingSet-ээр холбогдсон хувилбар. Link амжилтгүй бол dispatch хийхгүй.
    template<typename Kernel>
    inline Result<uint64_t> dispatch_compute_linked(
        StageContext& ctx,
        const ComputeDispatchDesc& desc,
        const BindingSet& bindings,
        const Kernel& kernel)
    {
        const Result<LinkedStage> linked = link_stage(StageKind::Compute, bindings);
        if (!linked.ok) return Result<uint64_t>::failure(linked.error);
        return Result<uint64_t>::success(
            dispatch_compute(ctx, desc, linked.value.bindings.compute_input, linked.value.bindings.compute_output, kernel));
    }
}
