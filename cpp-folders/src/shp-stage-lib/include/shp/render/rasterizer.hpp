#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн render модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include <glm/glm.hpp>

#include "shp/gfx/rt_types.hpp"
#include "shp/job/parallel_for.hpp"
#include "shp/shader/types.hpp"

namespace shp
{
    // Edge test-ийн зөвшөөрөл. Хоёр гурвалжны дундах диагональ дээрх pixel алдагдахгүй.
    constexpr float SHP_RASTER_EDGE_EPS = 1e-5f;

    enum class RasterizerCullMode
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class DepthMode
    {
        Disabled = 0,
        Less = 1,
        LessEqual = 2
    };

    struct RasterizerConfig
    {
        RasterizerCullMode cull_mode = RasterizerCullMode::None;
        bool front_face_ccw = true;
        DepthMode depth_mode = DepthMode::Less;
        bool depth_write = true;
        int parallel_min_rows = 8;
        int parallel_min_vertices = 64;
    };

    struct RasterizerTarget
    {
        RT_ColorHDR* hdr = nullptr;
        RT_DepthBuffer* depth = nullptr;
    };

    struct RasterizerStats
    {
        uint64_t vertex_invocations = 0;
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t fragments = 0;
    };

    namespace detail
    {
        inline Varyings lerp_varyings(const Varyings& a, const Varyings& b, float t)
        {
            Varyings o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.mask = a.mask | b.mask;
            for (uint32_t i = 0; i < SHP_MAX_VARYINGS; ++i) o.slots[i] = glm::mix(a.slots[i], b.slots[i], t);
            return o;
        }

        inline float plane_dist_left(const Varyings& v) { return v.clip.x + v.clip.w; }
        inline float plane_dist_right(const Varyings& v) { return v.clip.w - v.clip.x; }
        inline float plane_dist_bottom(const Varyings& v) { return v.clip.y + v.clip.w; }
        inline float plane_dist_top(const Varyings& v) { return v.clip.w - v.clip.y; }
        // ZO depth: 0 <= z <= w.
        inline float plane_dist_near(const Varyings& v) { return v.clip.z; }
        inline float plane_dist_far(const Varyings& v) { return v.clip.w - v.clip.z; }

        template <typename PlaneDistFn>
        inline std::vector<Varyings> clip_polygon_plane(const std::vector<Varyings>& in_poly, PlaneDistFn plane_dist_fn)
        {
            std::vector<Varyings> out{};
            if (in_poly.empty()) return out;

            out.reserve(in_poly.size() + 2);
            for (size_t i = 0; i < in_poly.size(); ++i)
            {
                const Varyings& cur = in_poly[i];
                const Varyings& nxt = in_poly[(i + 1) % in_poly.size()];
                const float da = plane_dist_fn(cur);
                const float db = plane_dist_fn(nxt);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_varyings(cur, nxt, da / denom));
                }
                if (nxt_in) out.push_back(nxt);
            }
            return out;
        }

        inline std::vector<Varyings> clip_polygon_frustum(const std::vector<Varyings>& in_poly)
        {
            std::vector<Varyings> poly = in_poly;
            poly = clip_polygon_plane(poly, plane_dist_left);
            poly = clip_polygon_plane(poly, plane_dist_right);
            poly = clip_polygon_plane(poly, plane_dist_bottom);
            poly = clip_polygon_plane(poly, plane_dist_top);
            poly = clip_polygon_plane(poly, plane_dist_near);
            poly = clip_polygon_plane(poly, plane_dist_far);
            return poly;
        }

        inline bool fully_inside_clip(const Varyings& v)
        {
            const glm::vec4 c = v.clip;
            if (!(c.w > 0.0f)) return false;
            return
                (c.x >= -c.w && c.x <= c.w) &&
                (c.y >= -c.w && c.y <= c.w) &&
                (c.z >= 0.0f && c.z <= c.w);
        }

        inline bool finite3(const glm::vec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        inline bool depth_test(DepthMode mode, float z, float stored)
        {
            switch (mode)
            {
                case DepthMode::Disabled: return true;
                case DepthMode::Less: return z < stored;
                case DepthMode::LessEqual: return z <= stored;
            }
            return true;
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-8f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        const float u = 1.0f - v - w;
        return glm::vec3(u, v, w);
    }

    // NDC -> pixel. Pixel (x, y)-ийн төв нь ((x + 0.5) / W, (y + 0.5) / H) uv-тэй таарна.
    inline glm::vec2 ndc_to_screen(const glm::vec3& ndc, int w, int h)
    {
        return glm::vec2((ndc.x * 0.5f + 0.5f) * (float)w, (ndc.y * 0.5f + 0.5f) * (float)h);
    }

    // Programmable pipeline-ийн fixed-function хэсэг.
    // vertex_fn(uint32_t index) -> Varyings
    // fragment_fn(const Varyings&, const FragmentCoord&) -> FragmentOut
    // Vertex бүрийг нэг удаа (parallel) ажиллуулж, гурвалжнуудыг дараалан мөрөөр нь хувааж raster хийнэ.
    // Vertex stage-ийн шидсэн exception dispatch хийсэн thread дээр дахин шидэгдэнэ.
    // Depth buffer өнгөний target-тай ижил хэмжээтэй байх ёстой (std::invalid_argument).
    template<typename VertexFn, typename FragmentFn>
    inline RasterizerStats rasterize_indexed(
        IJobSystem* js,
        uint32_t vertex_count,
        std::span<const uint32_t> indices,
        VertexFn&& vertex_fn,
        FragmentFn&& fragment_fn,
        RasterizerTarget target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!target.hdr || vertex_count == 0) return stats;
        const int W = target.hdr->w;
        const int H = target.hdr->h;
        if (W <= 0 || H <= 0) return stats;
        if (target.depth && (target.depth->w != W || target.depth->h != H))
        {
            throw std::invalid_argument("rasterize_indexed: depth buffer size does not match color target");
        }

        std::vector<Varyings> vout((size_t)vertex_count);
        parallel_for_index(js, (size_t)vertex_count, std::max(1, config.parallel_min_vertices), [&](size_t i)
        {
            vout[i] = vertex_fn((uint32_t)i);
        });
        stats.vertex_invocations = vertex_count;

        const bool indexed = !indices.empty();
        const size_t tri_count = indexed ? (indices.size() / 3) : ((size_t)vertex_count / 3);
        std::atomic<uint64_t> fragments{0};

        for (size_t ti = 0; ti < tri_count; ++ti)
        {
            stats.tri_input++;
            const uint32_t i0 = indexed ? indices[ti * 3 + 0] : (uint32_t)(ti * 3 + 0);
            const uint32_t i1 = indexed ? indices[ti * 3 + 1] : (uint32_t)(ti * 3 + 1);
            const uint32_t i2 = indexed ? indices[ti * 3 + 2] : (uint32_t)(ti * 3 + 2);
            if (i0 >= vertex_count || i1 >= vertex_count || i2 >= vertex_count) continue;

            std::vector<Varyings> poly = {vout[i0], vout[i1], vout[i2]};
            if (!(detail::fully_inside_clip(poly[0]) && detail::fully_inside_clip(poly[1]) && detail::fully_inside_clip(poly[2])))
            {
                poly = detail::clip_polygon_frustum(poly);
            }
            if (poly.size() < 3) continue;

            // Клип хийсний дараах олон өнцөгтийг fan аргаар гурвалжилна.
            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                const Varyings& rv0 = poly[0];
                const Varyings& rv1 = poly[k];
                const Varyings& rv2 = poly[k + 1];

                const glm::vec3 n0 = glm::vec3(rv0.clip) / rv0.clip.w;
                const glm::vec3 n1 = glm::vec3(rv1.clip) / rv1.clip.w;
                const glm::vec3 n2 = glm::vec3(rv2.clip) / rv2.clip.w;
                if (!detail::finite3(n0) || !detail::finite3(n1) || !detail::finite3(n2)) continue;

                const glm::vec2 s0 = ndc_to_screen(n0, W, H);
                const glm::vec2 s1 = ndc_to_screen(n1, W, H);
                const glm::vec2 s2 = ndc_to_screen(n2, W, H);

                const glm::vec2 e0 = s1 - s0;
                const glm::vec2 e1 = s2 - s0;
                const float signed_area2 = e0.x * e1.y - e0.y * e1.x;
                if (std::abs(signed_area2) < 1e-10f) continue;
                const bool tri_ccw = signed_area2 > 0.0f;
                const bool is_front = (tri_ccw == config.front_face_ccw);
                if (config.cull_mode == RasterizerCullMode::Back && !is_front) continue;
                if (config.cull_mode == RasterizerCullMode::Front && is_front) continue;

                const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
                const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
                const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
                const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
                if (minx > maxx || miny > maxy) continue;
                stats.tri_raster++;

                const float invw0 = 1.0f / rv0.clip.w;
                const float invw1 = 1.0f / rv1.clip.w;
                const float invw2 = 1.0f / rv2.clip.w;
                const uint32_t mask = rv0.mask | rv1.mask | rv2.mask;
                std::array<glm::vec4, SHP_MAX_VARYINGS> varw0{};
                std::array<glm::vec4, SHP_MAX_VARYINGS> varw1{};
                std::array<glm::vec4, SHP_MAX_VARYINGS> varw2{};
                for (uint32_t i = 0; i < SHP_MAX_VARYINGS; ++i)
                {
                    if ((mask & (1u << i)) == 0u) continue;
                    varw0[i] = rv0.slots[i] * invw0;
                    varw1[i] = rv1.slots[i] * invw1;
                    varw2[i] = rv2.slots[i] * invw2;
                }

                auto raster_rows = [&](int yb, int ye)
                {
                    uint64_t local_fragments = 0;
                    for (int y = yb; y < ye; ++y)
                    {
                        for (int x = minx; x <= maxx; ++x)
                        {
                            const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                            const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                            if (bc.x < -SHP_RASTER_EDGE_EPS || bc.y < -SHP_RASTER_EDGE_EPS || bc.z < -SHP_RASTER_EDGE_EPS) continue;

                            // NDC z нь screen орон зайд шугаман.
                            const float z01 = glm::clamp(bc.x * n0.z + bc.y * n1.z + bc.z * n2.z, 0.0f, 1.0f);
                            if (target.depth && !detail::depth_test(config.depth_mode, z01, target.depth->depth.at(x, y))) continue;

                            // 1/w interpolation: perspective-correct varying.
                            const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                            if (denom <= 1e-10f) continue;
                            const float inv_denom = 1.0f / denom;

                            Varyings fin{};
                            fin.mask = mask;
                            fin.clip = glm::vec4(
                                (p.x / (float)W) * 2.0f - 1.0f,
                                (p.y / (float)H) * 2.0f - 1.0f,
                                z01,
                                1.0f);
                            for (uint32_t i = 0; i < SHP_MAX_VARYINGS; ++i)
                            {
                                if ((mask & (1u << i)) == 0u) continue;
                                fin.slots[i] = (bc.x * varw0[i] + bc.y * varw1[i] + bc.z * varw2[i]) * inv_denom;
                            }

                            FragmentCoord fc{};
                            fc.px = x;
                            fc.py = y;
                            fc.depth01 = z01;

                            const FragmentOut fout = fragment_fn(fin, fc);
                            ++local_fragments;
                            if (fout.discard) continue;

                            if (target.depth && config.depth_write && config.depth_mode != DepthMode::Disabled)
                            {
                                target.depth->depth.at(x, y) = z01;
                            }
                            target.hdr->color.at(x, y) = fout.color;
                        }
                    }
                    fragments.fetch_add(local_fragments, std::memory_order_relaxed);
                };

                const int bbox_rows = maxy - miny + 1;
                if (js && bbox_rows >= std::max(1, config.parallel_min_rows))
                {
                    parallel_for_1d(js, miny, maxy + 1, std::max(1, config.parallel_min_rows), raster_rows);
                }
                else
                {
                    raster_rows(miny, maxy + 1);
                }
            }
        }
        stats.fragments = fragments.load();
        return stats;
    }
}
