#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: primitives_builders.hpp
    МОДУЛЬ: geometry
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн geometry модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

#include "shp/resources/mesh.hpp"

namespace shp
{
    namespace detail
    {
        inline uint32_t add_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv, const glm::vec3& t, const glm::vec3& b)
        {
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            m.tangents.push_back(t);
            m.bitangents.push_back(b);
            return (uint32_t)m.positions.size() - 1;
        }

        inline void add_triangle(MeshData& m, uint32_t a, uint32_t b, uint32_t c)
        {
            m.indices.push_back(a);
            m.indices.push_back(b);
            m.indices.push_back(c);
        }

        // axis_u нь tangent, axis_v нь bitangent чиглэл; uv (0,0) нь origin дээр.
        inline void add_grid_patch(
            MeshData& m,
            const glm::vec3& origin,
            const glm::vec3& axis_u,
            const glm::vec3& axis_v,
            const glm::vec3& normal,
            int seg_u,
            int seg_v
        )
        {
            seg_u = std::max(1, seg_u);
            seg_v = std::max(1, seg_v);
            const uint32_t base = (uint32_t)m.positions.size();
            const glm::vec3 t = glm::normalize(axis_u);
            const glm::vec3 b = glm::normalize(axis_v);

            for (int y = 0; y <= seg_v; ++y)
            {
                const float fv = (float)y / (float)seg_v;
                for (int x = 0; x <= seg_u; ++x)
                {
                    const float fu = (float)x / (float)seg_u;
                    const glm::vec3 p = origin + axis_u * fu + axis_v * fv;
                    add_vertex(m, p, normal, glm::vec2(fu, fv), t, b);
                }
            }

            const uint32_t row = (uint32_t)seg_u + 1u;
            for (int y = 0; y < seg_v; ++y)
            {
                for (int x = 0; x < seg_u; ++x)
                {
                    const uint32_t i0 = base + (uint32_t)y * row + (uint32_t)x;
                    const uint32_t i1 = i0 + 1u;
                    const uint32_t i2 = i0 + row;
                    const uint32_t i3 = i2 + 1u;
                    add_triangle(m, i0, i2, i1);
                    add_triangle(m, i1, i2, i3);
                }
            }
        }
    }

    // XZ хавтгай дээрх +Y рүү харсан квадрат, төв нь эх цэг дээр.
    inline MeshData make_plane(float size_x, float size_z, int seg_x = 1, int seg_z = 1)
    {
        MeshData m{};
        m.label = "plane";
        const glm::vec3 origin{-0.5f * size_x, 0.0f, -0.5f * size_z};
        detail::add_grid_patch(m, origin, glm::vec3(size_x, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, size_z), glm::vec3(0.0f, 1.0f, 0.0f), seg_x, seg_z);
        return m;
    }

    inline MeshData make_box(const glm::vec3& extents)
    {
        MeshData m{};
        m.label = "box";
        const glm::vec3 h = extents * 0.5f;
        // +X, -X, +Y, -Y, +Z, -Z тал бүрт (origin, u, v, n).
        detail::add_grid_patch(m, glm::vec3( h.x, -h.y,  h.z), glm::vec3(0, 0, -extents.z), glm::vec3(0, extents.y, 0), glm::vec3( 1, 0, 0), 1, 1);
        detail::add_grid_patch(m, glm::vec3(-h.x, -h.y, -h.z), glm::vec3(0, 0,  extents.z), glm::vec3(0, extents.y, 0), glm::vec3(-1, 0, 0), 1, 1);
        detail::add_grid_patch(m, glm::vec3(-h.x,  h.y, -h.z), glm::vec3(extents.x, 0, 0), glm::vec3(0, 0, extents.z), glm::vec3(0,  1, 0), 1, 1);
        detail::add_grid_patch(m, glm::vec3(-h.x, -h.y,  h.z), glm::vec3(extents.x, 0, 0), glm::vec3(0, 0, -extents.z), glm::vec3(0, -1, 0), 1, 1);
        detail::add_grid_patch(m, glm::vec3(-h.x, -h.y,  h.z), glm::vec3(extents.x, 0, 0), glm::vec3(0, extents.y, 0), glm::vec3(0, 0,  1), 1, 1);
        detail::add_grid_patch(m, glm::vec3( h.x, -h.y, -h.z), glm::vec3(-extents.x, 0, 0), glm::vec3(0, extents.y, 0), glm::vec3(0, 0, -1), 1, 1);
        return m;
    }

    // positions/normals/uvs/indices-ээс per-vertex tangent/bitangent гаргана
    // (гурвалжны uv gradient-ийг хуримтлуулж, normal-д Gram-Schmidt ортогональ болгоно).
    inline void generate_tangent_basis(MeshData& m)
    {
        const size_t n = m.positions.size();
        if (m.normals.size() != n || m.uvs.size() != n) return;

        std::vector<glm::vec3> tan_acc(n, glm::vec3(0.0f));
        std::vector<glm::vec3> bit_acc(n, glm::vec3(0.0f));
        for (size_t t = 0; t + 2 < m.indices.size(); t += 3)
        {
            const uint32_t i0 = m.indices[t + 0];
            const uint32_t i1 = m.indices[t + 1];
            const uint32_t i2 = m.indices[t + 2];
            if (i0 >= n || i1 >= n || i2 >= n) continue;

            const glm::vec3 e1 = m.positions[i1] - m.positions[i0];
            const glm::vec3 e2 = m.positions[i2] - m.positions[i0];
            const glm::vec2 d1 = m.uvs[i1] - m.uvs[i0];
            const glm::vec2 d2 = m.uvs[i2] - m.uvs[i0];
            const float det = d1.x * d2.y - d2.x * d1.y;
            if (std::abs(det) < 1e-12f) continue;
            const float r = 1.0f / det;
            const glm::vec3 tan = (e1 * d2.y - e2 * d1.y) * r;
            const glm::vec3 bit = (e2 * d1.x - e1 * d2.x) * r;
            for (uint32_t i : {i0, i1, i2})
            {
                tan_acc[i] += tan;
                bit_acc[i] += bit;
            }
        }

        m.tangents.assign(n, glm::vec3(1.0f, 0.0f, 0.0f));
        m.bitangents.assign(n, glm::vec3(0.0f, 0.0f, 1.0f));
        for (size_t i = 0; i < n; ++i)
        {
            const glm::vec3 nn = m.normals[i];
            glm::vec3 t = tan_acc[i] - nn * glm::dot(nn, tan_acc[i]);
            if (glm::length(t) < 1e-8f) continue;
            t = glm::normalize(t);
            const float handedness = glm::dot(glm::cross(nn, t), bit_acc[i]) < 0.0f ? -1.0f : 1.0f;
            m.tangents[i] = t;
            m.bitangents[i] = glm::cross(nn, t) * handedness;
        }
    }
}
