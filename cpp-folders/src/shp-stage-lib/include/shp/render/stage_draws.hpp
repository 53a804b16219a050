#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: stage_draws.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн render модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <span>
#include <string>

#include <glm/glm.hpp>

#include "shp/core/context.hpp"
#include "shp/core/log.hpp"
#include "shp/core/result.hpp"
#include "shp/render/rasterizer.hpp"
#include "shp/resources/mesh.hpp"
#include "shp/shader/binding.hpp"
#include "shp/shader/lighting_stage.hpp"
#include "shp/shader/vertex_stage.hpp"
#include "shp/sky/skybox_stage.hpp"

namespace shp
{
    namespace detail
    {
        inline void accumulate_draw_stats(StageContext& ctx, const RasterizerStats& s)
        {
            ctx.debug.vertex_invocations += s.vertex_invocations;
            ctx.debug.fragment_invocations += s.fragments;
            ctx.debug.tri_input += s.tri_input;
            ctx.debug.tri_raster += s.tri_raster;
            ctx.debug.draws++;
        }

        // Амжилттай бол хоосон мөр, эс бөгөөс алдааны тайлбар.
        inline std::string target_error(const char* who, const RasterizerTarget& target)
        {
            std::string err{};
            if (!target.hdr || !target.hdr->valid())
            {
                err = "color target is not bound";
            }
            else if (target.depth && (target.depth->w != target.hdr->w || target.depth->h != target.hdr->h))
            {
                err = "depth buffer " + std::to_string(target.depth->w) + "x" + std::to_string(target.depth->h) +
                    " does not match color target " + std::to_string(target.hdr->w) + "x" + std::to_string(target.hdr->h);
            }
            if (!err.empty()) log_error(std::string(who) + ": " + err);
            return err;
        }
    }

    // Камергүй debug draw: clip = model * position, fragment нь тогтмол өнгө.
    inline Result<RasterizerStats> draw_flat_mesh(
        StageContext& ctx,
        const MeshData& mesh,
        const glm::mat4& model,
        const ColorF& color,
        RasterizerTarget target,
        const RasterizerConfig& cfg = {})
    {
        const std::string target_err = detail::target_error("draw_flat_mesh", target);
        if (!target_err.empty()) return Result<RasterizerStats>::failure(target_err);
        if (mesh.empty()) return Result<RasterizerStats>::success(RasterizerStats{});

        const RasterizerStats stats = rasterize_indexed(
            ctx.job_system,
            (uint32_t)mesh.vertex_count(),
            std::span<const uint32_t>(mesh.indices),
            [&](uint32_t i) { return vertex_stage_position_only(mesh.positions[(size_t)i], model); },
            [&](const Varyings&, const FragmentCoord&)
            {
                FragmentOut o{};
                o.color = color;
                return o;
            },
            target,
            cfg);
        detail::accumulate_draw_stats(ctx, stats);
        return Result<RasterizerStats>::success(stats);
    }

    // Normal-mapped mesh draw. Vertex (full) болон lighting stage хоёулаа link хийгдсэний дараа л
    // rasterizer ажиллана.
    inline Result<RasterizerStats> draw_lit_mesh(
        StageContext& ctx,
        const MeshData& mesh,
        const BindingSet& bindings,
        const LightingConfig& lighting,
        RasterizerTarget target,
        const RasterizerConfig& cfg = {})
    {
        const Result<LinkedStage> vs = link_stage(StageKind::VertexFull, bindings);
        if (!vs.ok) return Result<RasterizerStats>::failure(vs.error);
        const Result<LinkedStage> fs = link_stage(StageKind::Lighting, bindings);
        if (!fs.ok) return Result<RasterizerStats>::failure(fs.error);
        const std::string target_err = detail::target_error("draw_lit_mesh", target);
        if (!target_err.empty()) return Result<RasterizerStats>::failure(target_err);
        if (!mesh.has_tangent_basis())
        {
            log_error("draw_lit_mesh: mesh '" + mesh.label + "' has no tangent basis");
            return Result<RasterizerStats>::failure("mesh has no tangent basis");
        }
        if (mesh.empty()) return Result<RasterizerStats>::success(RasterizerStats{});

        const CameraUniform& camera = *bindings.camera;
        const InstanceTransform& instance = *bindings.instance;
        const DrawImmediates& immediates = *bindings.immediates;
        const LightingResources res{
            *bindings.diffuse.texture,
            bindings.diffuse.sampler,
            *bindings.normal.texture,
            bindings.normal.sampler
        };

        const RasterizerStats stats = rasterize_indexed(
            ctx.job_system,
            (uint32_t)mesh.vertex_count(),
            std::span<const uint32_t>(mesh.indices),
            [&](uint32_t i) { return vertex_stage_full(read_vertex_attributes(mesh, i), instance, camera); },
            [&](const Varyings& v, const FragmentCoord&)
            {
                return lighting_fragment(lighting_fragment_in(v), res, camera, lighting, immediates);
            },
            target,
            cfg);
        detail::accumulate_draw_stats(ctx, stats);
        return Result<RasterizerStats>::success(stats);
    }

    // Full-screen гурвалжингаар skybox зурна. Far plane (z = 1) дээр байрлах тул
    // LessEqual test-ээр зөвхөн хоосон үлдсэн pixel-үүдийг бүрхэнэ, depth бичихгүй.
    inline Result<RasterizerStats> draw_skybox(
        StageContext& ctx,
        const BindingSet& bindings,
        ReflectionMode mode,
        RasterizerTarget target)
    {
        const Result<LinkedStage> linked = link_stage(StageKind::Skybox, bindings);
        if (!linked.ok) return Result<RasterizerStats>::failure(linked.error);
        const std::string target_err = detail::target_error("draw_skybox", target);
        if (!target_err.empty()) return Result<RasterizerStats>::failure(target_err);

        const CameraUniform& camera = *bindings.camera;
        const CubemapData& environment = *bindings.environment.cubemap;
        const SamplerDesc sampler = bindings.environment.sampler;

        RasterizerConfig cfg{};
        cfg.cull_mode = RasterizerCullMode::None;
        cfg.depth_mode = DepthMode::LessEqual;
        cfg.depth_write = false;

        const RasterizerStats stats = rasterize_indexed(
            ctx.job_system,
            3u,
            std::span<const uint32_t>{},
            [](uint32_t i) { return skybox_vertex_stage(i); },
            [&](const Varyings& v, const FragmentCoord&)
            {
                return skybox_fragment(v.get(VaryingSemantic::Custom0), camera, environment, sampler, mode);
            },
            target,
            cfg);
        detail::accumulate_draw_stats(ctx, stats);
        return Result<RasterizerStats>::success(stats);
    }
}
