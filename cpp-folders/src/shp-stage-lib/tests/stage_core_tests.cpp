#include <array>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shp/camera/camera_rig.hpp"
#include "shp/camera/camera_uniform.hpp"
#include "shp/camera/convention.hpp"
#include "shp/geometry/primitives_builders.hpp"
#include "shp/math/linalg.hpp"
#include "shp/shader/binding.hpp"
#include "shp/shader/lighting_stage.hpp"
#include "shp/shader/vertex_stage.hpp"
#include "shp/sky/skybox_stage.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_eq(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    bool approx_eq(const glm::vec4& a, const glm::vec4& b, float eps = 1e-4f)
    {
        return approx_eq(glm::vec3(a), glm::vec3(b), eps) && approx_eq(a.w, b.w, eps);
    }

    shp::CameraUniform make_test_camera(const glm::vec3& pos, const glm::quat& rot)
    {
        shp::CameraRig rig{};
        rig.fov_y_degrees = 60.0f;
        rig.aspect = 1.0f;
        rig.znear = 0.1f;
        rig.zfar = 100.0f;
        rig.position = pos;
        rig.rotation = rot;
        const shp::Result<shp::CameraUniform> cu = shp::build_camera_uniform(rig);
        if (!cu.ok) throw std::runtime_error("test camera: " + cu.error);
        return cu.value;
    }

    glm::quat test_camera_rotation()
    {
        return glm::angleAxis(glm::radians(25.0f), glm::normalize(glm::vec3(0.3f, 1.0f, 0.1f)));
    }

    bool test_mat4_column_composition()
    {
        const glm::vec4 c0{1.0f, 2.0f, 3.0f, 0.0f};
        const glm::vec4 c1{0.0f, 1.0f, 0.0f, 0.0f};
        const glm::vec4 c2{0.0f, 0.0f, 2.0f, 0.0f};
        const glm::vec4 c3{5.0f, 6.0f, 7.0f, 1.0f};
        const glm::mat4 m = shp::make_mat4_from_columns(c0, c1, c2, c3);
        const glm::vec3 p{2.0f, 3.0f, 4.0f};
        const glm::vec4 expected = 2.0f * c0 + 3.0f * c1 + 4.0f * c2 + c3;
        if (!approx_eq(shp::transform_point(m, p), expected, 1e-6f)) return false;

        // Дараалал чухал: T * S != S * T.
        const glm::mat4 t = shp::make_translation(glm::vec3(1.0f, 0.0f, 0.0f));
        const glm::mat4 s = shp::make_trs(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), glm::vec3(2.0f));
        const glm::vec4 ts = (t * s) * glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
        const glm::vec4 st = (s * t) * glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
        if (!approx_eq(ts.x, 3.0f) || !approx_eq(st.x, 4.0f)) return false;

        const shp::InstanceTransform inst = shp::InstanceTransform::from_matrix(m);
        return inst.matrix() == m;
    }

    bool test_make_trs_order()
    {
        const glm::quat r = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::mat4 m = shp::make_trs(glm::vec3(10.0f, 0.0f, 0.0f), r, glm::vec3(2.0f));
        // (1,0,0) -> scale (2,0,0) -> Y тэнхлэгээр 90 градус (0,0,-2) -> +10 X.
        return approx_eq(glm::vec3(shp::transform_point(m, glm::vec3(1.0f, 0.0f, 0.0f))), glm::vec3(10.0f, 0.0f, -2.0f));
    }

    bool test_normalize_checked_rejects_zero()
    {
        try
        {
            (void)shp::normalize_checked(glm::vec3(0.0f));
            return false;
        }
        catch (const std::domain_error&)
        {
        }
        if (!shp::is_degenerate(glm::vec3(1e-10f))) return false;
        return approx_eq(shp::normalize_checked(glm::vec3(0.0f, 3.0f, 4.0f)), glm::vec3(0.0f, 0.6f, 0.8f), 1e-6f);
    }

    bool test_project_point_rejects_zero_w()
    {
        glm::mat4 m{1.0f};
        m[3][3] = 0.0f;
        try
        {
            (void)shp::project_point(m, glm::vec3(0.0f));
            return false;
        }
        catch (const std::domain_error&)
        {
        }
        glm::mat4 h{1.0f};
        h[3][3] = 2.0f;
        return approx_eq(shp::project_point(h, glm::vec3(2.0f, 4.0f, 6.0f)), glm::vec3(1.0f, 2.0f, 3.0f), 1e-6f);
    }

    bool test_singular_camera_fails()
    {
        const shp::Result<shp::CameraUniform> bad = shp::make_camera_uniform_from_view_proj(glm::mat4(0.0f), glm::vec3(0.0f));
        if (bad.ok || bad.error.empty()) return false;

        shp::CameraRig rig{};
        rig.znear = 1.0f;
        rig.zfar = 1.0f;
        if (shp::build_camera_uniform(rig).ok) return false;

        const shp::Result<shp::CameraUniform> good = shp::make_camera_uniform(glm::mat4(1.0f), glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
        if (!good.ok) return false;
        return approx_eq(good.value.position(), glm::vec3(1.0f, 2.0f, 3.0f)) && approx_eq(good.value.world_pos.w, 1.0f);
    }

    bool test_camera_rig_projection()
    {
        const shp::CameraUniform cu = make_test_camera(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
        // Left-handed: камер +Z рүү харна, depth [0,1].
        const glm::vec3 ndc = shp::project_point(cu.view_proj, glm::vec3(0.0f, 0.0f, 10.0f));
        if (!approx_eq(ndc.x, 0.0f) || !approx_eq(ndc.y, 0.0f)) return false;
        if (!(ndc.z > 0.0f && ndc.z < 1.0f)) return false;
        const glm::vec3 near_ndc = shp::project_point(cu.view_proj, glm::vec3(0.0f, 0.0f, 0.1f));
        const glm::vec3 far_ndc = shp::project_point(cu.view_proj, glm::vec3(0.0f, 0.0f, 100.0f));
        if (!approx_eq(near_ndc.z, 0.0f) || !approx_eq(far_ndc.z, 1.0f, 1e-3f)) return false;

        const glm::mat4 id = cu.view_proj * cu.inv_view_proj;
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (!approx_eq(id[c][r], c == r ? 1.0f : 0.0f, 1e-4f)) return false;
            }
        }
        return true;
    }

    bool test_identity_vertex_passthrough()
    {
        shp::VertexAttributes v{};
        v.position = glm::vec3(0.25f, -0.5f, 0.75f);
        v.uv = glm::vec2(0.3f, 0.7f);
        v.normal = glm::vec3(0.0f, 0.0f, 1.0f);
        v.tangent = glm::vec3(1.0f, 0.0f, 0.0f);
        v.bitangent = glm::vec3(0.0f, 1.0f, 0.0f);

        const shp::CameraUniform camera{};
        const shp::Varyings o = shp::vertex_stage_full(v, shp::InstanceTransform::identity(), camera);
        if (!approx_eq(o.clip, glm::vec4(v.position, 1.0f), 0.0f)) return false;
        if ((o.mask & shp::SHP_TBN_VARYINGS_MASK) != shp::SHP_TBN_VARYINGS_MASK) return false;
        if (!approx_eq(glm::vec3(o.get(shp::VaryingSemantic::WorldPos)), v.position, 0.0f)) return false;
        if (!approx_eq(o.get(shp::VaryingSemantic::UV0).x, 0.3f, 0.0f)) return false;
        if (!approx_eq(glm::vec3(o.get(shp::VaryingSemantic::NormalWS)), v.normal, 0.0f)) return false;

        const shp::Varyings p = shp::vertex_stage_position_only(v.position, glm::mat4(1.0f));
        return approx_eq(p.clip, glm::vec4(v.position, 1.0f), 0.0f) && p.mask == 0u;
    }

    bool test_vertex_world_directions_normalized()
    {
        shp::VertexAttributes v{};
        v.position = glm::vec3(1.0f, 0.0f, 0.0f);
        const glm::quat r = glm::angleAxis(glm::radians(30.0f), glm::vec3(0.0f, 0.0f, 1.0f));
        const glm::mat4 model = shp::make_trs(glm::vec3(0.0f, 2.0f, 0.0f), r, glm::vec3(3.0f));
        const shp::Varyings o = shp::vertex_stage_full(v, shp::InstanceTransform::from_matrix(model), shp::CameraUniform{});

        if (!approx_eq(glm::length(glm::vec3(o.get(shp::VaryingSemantic::NormalWS))), 1.0f, 1e-5f)) return false;
        if (!approx_eq(glm::length(glm::vec3(o.get(shp::VaryingSemantic::TangentWS))), 1.0f, 1e-5f)) return false;
        if (!approx_eq(glm::length(glm::vec3(o.get(shp::VaryingSemantic::BitangentWS))), 1.0f, 1e-5f)) return false;
        const glm::vec3 expected_world = glm::vec3(model * glm::vec4(v.position, 1.0f));
        if (!approx_eq(glm::vec3(o.get(shp::VaryingSemantic::WorldPos)), expected_world)) return false;

        // Тэг normal-тай vertex NaN гаргахгүй, алдаа шиднэ.
        v.normal = glm::vec3(0.0f);
        try
        {
            (void)shp::vertex_stage_full(v, shp::InstanceTransform::identity(), shp::CameraUniform{});
            return false;
        }
        catch (const std::domain_error&)
        {
        }
        return true;
    }

    bool test_lighting_world_tangent_equivalence()
    {
        const float shininess_values[] = {20.0f, 32.0f};
        const glm::vec3 axes[] = {
            glm::normalize(glm::vec3(1.0f, 0.2f, -0.4f)),
            glm::normalize(glm::vec3(-0.3f, 1.0f, 0.5f)),
            glm::normalize(glm::vec3(0.0f, 0.1f, 1.0f))
        };
        const float angles[] = {0.0f, 37.0f, 121.0f};
        const glm::vec3 normals_ts[] = {
            glm::vec3(0.0f, 0.0f, 1.0f),
            glm::vec3(-0.2f, 0.3f, 0.9f),
            glm::vec3(-0.3f, 0.25f, 0.8f)
        };

        for (float shininess : shininess_values)
        {
            for (size_t i = 0; i < 3; ++i)
            {
                const glm::mat3 r = glm::mat3_cast(glm::angleAxis(glm::radians(angles[i]), axes[i]));
                shp::LightingGeometry g{};
                g.frame.tangent = r[0];
                g.frame.bitangent = r[1];
                g.frame.normal = r[2];
                g.normal_ts = normals_ts[i];
                g.world_pos = glm::vec3(0.2f, -0.1f, 0.3f);
                // Fragment-ийн normal-ийн талд гэрэл, камерыг байрлуулна.
                g.light_pos = g.world_pos + r[2] * 1.5f + r[0] * 0.7f;
                g.camera_pos = g.world_pos + r[2] * 1.2f - r[1] * 0.4f;

                const shp::LightingTerms w = shp::eval_lighting_terms(shp::LightingSpace::World, g, shininess);
                const shp::LightingTerms t = shp::eval_lighting_terms(shp::LightingSpace::Tangent, g, shininess);
                if (!approx_eq(w.diffuse, t.diffuse, 1e-5f)) return false;
                if (!approx_eq(w.specular, t.specular, 1e-5f)) return false;
                if (!(w.diffuse > 0.0f)) return false;
                if (!approx_eq(w.normal_ws, t.normal_ws, 1e-5f)) return false;
            }
        }
        return true;
    }

    // Хоёр ортонормал vertex frame-ийн дундаж (rasterizer-ийн interpolate хийсэнтэй адил).
    bool test_lighting_interpolated_frame_equivalence()
    {
        const glm::mat3 r = glm::mat3_cast(glm::angleAxis(glm::radians(60.0f), glm::normalize(glm::vec3(1.0f, 1.0f, 1.0f))));
        shp::TangentFrame frame{};
        frame.tangent = 0.5f * (glm::vec3(1.0f, 0.0f, 0.0f) + r[0]);
        frame.bitangent = 0.5f * (glm::vec3(0.0f, 1.0f, 0.0f) + r[1]);
        frame.normal = 0.5f * (glm::vec3(0.0f, 0.0f, 1.0f) + r[2]);
        if (approx_eq(glm::dot(glm::normalize(frame.tangent), glm::normalize(frame.bitangent)), 0.0f, 1e-2f)) return false;

        const glm::mat3 tbn = shp::make_tbn(frame);
        for (int c = 0; c < 3; ++c)
        {
            if (!approx_eq(glm::length(tbn[c]), 1.0f, 1e-5f)) return false;
        }
        if (!approx_eq(glm::dot(tbn[0], tbn[1]), 0.0f, 1e-5f)) return false;
        if (!approx_eq(glm::dot(tbn[0], tbn[2]), 0.0f, 1e-5f)) return false;
        if (!approx_eq(glm::dot(tbn[1], tbn[2]), 0.0f, 1e-5f)) return false;
        if (!approx_eq(tbn[2], glm::normalize(frame.normal), 1e-5f)) return false;
        if (!(glm::dot(tbn[1], frame.bitangent) > 0.0f)) return false;

        // Толин тусгал UV: bitangent-ийн тэмдэг хадгалагдана.
        shp::TangentFrame mirrored = frame;
        mirrored.bitangent = -frame.bitangent;
        if (!approx_eq(shp::make_tbn(mirrored)[1], -tbn[1], 1e-5f)) return false;

        const glm::vec3 normals_ts[] = {
            glm::vec3(0.0f, 0.0f, 1.0f),
            glm::vec3(-0.2f, 0.3f, 0.9f)
        };
        for (const shp::TangentFrame& f : {frame, mirrored})
        {
            for (const glm::vec3& n_ts : normals_ts)
            {
                shp::LightingGeometry g{};
                g.frame = f;
                g.normal_ts = n_ts;
                g.world_pos = glm::vec3(0.2f, -0.1f, 0.3f);
                g.light_pos = g.world_pos + tbn[2] * 1.5f + tbn[0] * 0.7f;
                g.camera_pos = g.world_pos + tbn[2] * 1.2f - tbn[1] * 0.4f;

                const shp::LightingTerms w = shp::eval_lighting_terms(shp::LightingSpace::World, g, 32.0f);
                const shp::LightingTerms t = shp::eval_lighting_terms(shp::LightingSpace::Tangent, g, 32.0f);
                if (!(w.diffuse > 0.0f)) return false;
                if (!approx_eq(w.diffuse, t.diffuse, 1e-5f)) return false;
                if (!approx_eq(w.specular, t.specular, 1e-5f)) return false;
                if (!approx_eq(w.normal_ws, t.normal_ws, 1e-5f)) return false;
            }
        }
        return true;
    }

    bool test_lighting_fragment_alpha_from_immediates()
    {
        const shp::Texture2DData diffuse = shp::make_solid_texture(shp::Color{255, 255, 255, 255});
        const shp::Texture2DData normal = shp::make_solid_texture(shp::Color{128, 128, 255, 255});
        const shp::LightingResources res{diffuse, shp::SamplerDesc{}, normal, shp::SamplerDesc{}};

        shp::LightingFragmentIn in{};
        in.world_pos = glm::vec3(0.0f);
        in.uv = glm::vec2(0.5f);
        in.frame.tangent = glm::vec3(1.0f, 0.0f, 0.0f);
        in.frame.bitangent = glm::vec3(0.0f, 0.0f, 1.0f);
        in.frame.normal = glm::vec3(0.0f, 1.0f, 0.0f);

        shp::CameraUniform camera{};
        camera.world_pos = glm::vec4(0.0f, 3.0f, -1.0f, 1.0f);

        shp::LightingConfig cfg{};
        cfg.light.position = glm::vec3(0.0f, 5.0f, 0.0f);
        cfg.light.color = glm::vec3(1.0f);

        shp::DrawImmediates imm{};
        imm.scale = 0.5f;
        const shp::FragmentOut a = shp::lighting_fragment(in, res, camera, cfg, imm);
        if (!approx_eq(a.color.a, 0.5f, 0.0f) || a.discard) return false;
        // Гэрэл шууд дээрээс: diffuse ~ 1, rgb >= ambient + diffuse.
        if (!(a.color.r >= 1.0f)) return false;

        imm.scale = 1.0f;
        const shp::FragmentOut b = shp::lighting_fragment(in, res, camera, cfg, imm);
        if (!approx_eq(b.color.a, 1.0f, 0.0f)) return false;
        if (!approx_eq(a.color.r, b.color.r, 0.0f)) return false;

        cfg.output = shp::LightingOutput::NormalDebug;
        const shp::FragmentOut n = shp::lighting_fragment(in, res, camera, cfg, imm);
        return approx_eq(n.color.g, 1.0f, 1e-2f) && approx_eq(n.color.r, 0.5f, 1e-2f) && approx_eq(n.color.a, 1.0f, 0.0f);
    }

    bool test_decode_normal_sample()
    {
        return approx_eq(shp::decode_normal_sample(glm::vec3(0.5f, 0.0f, 1.0f)), glm::vec3(0.0f, -1.0f, 1.0f), 0.0f);
    }

    bool test_skybox_round_trip()
    {
        const glm::vec3 cam_positions[] = {glm::vec3(0.0f), glm::vec3(3.0f, -2.0f, 7.0f)};
        const glm::vec3 dirs[] = {
            glm::normalize(glm::vec3(0.1f, 0.05f, 1.0f)),
            glm::normalize(glm::vec3(-0.3f, 0.2f, 0.9f)),
            glm::normalize(glm::vec3(0.25f, -0.3f, 0.8f))
        };
        const glm::quat rot = test_camera_rotation();

        for (const glm::vec3& cam_pos : cam_positions)
        {
            const shp::CameraUniform cu = make_test_camera(cam_pos, rot);
            for (const glm::vec3& d_view : dirs)
            {
                const glm::vec3 d = glm::normalize(rot * d_view);
                const glm::vec4 clip = cu.view_proj * glm::vec4(cam_pos + d * 10.0f, 1.0f);

                const glm::vec3 recentered = shp::reconstruct_world_ray(
                    shp::skybox_ray_matrix(cu, shp::ReflectionMode::CameraRecentered), clip);
                if (!approx_eq(recentered, d, 1e-4f)) return false;

                // Far plane дээрх (z = 1) ижил pixel ч мөн адил чиглэл өгнө.
                const glm::vec4 far_clip{clip.x / clip.w, clip.y / clip.w, 1.0f, 1.0f};
                const glm::vec3 far_dir = shp::reconstruct_world_ray(
                    shp::skybox_ray_matrix(cu, shp::ReflectionMode::CameraRecentered), far_clip);
                if (!approx_eq(far_dir, d, 1e-3f)) return false;

                if (cam_pos == glm::vec3(0.0f))
                {
                    const glm::vec3 standard = shp::reconstruct_world_ray(
                        shp::skybox_ray_matrix(cu, shp::ReflectionMode::Standard), clip);
                    if (!approx_eq(standard, d, 1e-4f)) return false;
                }

                const glm::vec3 sampled = shp::skybox_sample_direction(cu, clip, shp::ReflectionMode::CameraRecentered);
                if (!approx_eq(sampled, d * glm::vec3(1.0f, 1.0f, -1.0f), 1e-4f)) return false;
            }
        }
        return true;
    }

    bool test_skybox_recentered_translation_invariance()
    {
        const glm::quat rot = test_camera_rotation();
        const shp::CameraUniform a = make_test_camera(glm::vec3(0.0f), rot);
        const shp::CameraUniform b = make_test_camera(glm::vec3(20.0f, 10.0f, -15.0f), rot);

        bool standard_differs = false;
        for (const glm::vec4& clip : shp::fullscreen_triangle_clip_positions())
        {
            // Дэлгэц доторх цэгүүд.
            const glm::vec4 p{glm::clamp(clip.x, -0.9f, 0.9f), glm::clamp(clip.y, -0.9f, 0.9f), 1.0f, 1.0f};
            const glm::vec3 ra = shp::skybox_sample_direction(a, p, shp::ReflectionMode::CameraRecentered);
            const glm::vec3 rb = shp::skybox_sample_direction(b, p, shp::ReflectionMode::CameraRecentered);
            if (!approx_eq(ra, rb, 1e-3f)) return false;

            const glm::vec3 sa = shp::skybox_sample_direction(a, p, shp::ReflectionMode::Standard);
            const glm::vec3 sb = shp::skybox_sample_direction(b, p, shp::ReflectionMode::Standard);
            if (glm::length(sa - sb) > 1e-2f) standard_differs = true;
        }
        return standard_differs;
    }

    bool test_skybox_vertex_stage()
    {
        const std::array<glm::vec4, 3> tri = shp::fullscreen_triangle_clip_positions();
        for (uint32_t i = 0; i < 3; ++i)
        {
            const shp::Varyings v = shp::skybox_vertex_stage(i);
            if (v.clip != tri[i]) return false;
            if (v.get(shp::VaryingSemantic::Custom0) != tri[i]) return false;
        }
        try
        {
            (void)shp::skybox_vertex_stage(3);
            return false;
        }
        catch (const std::out_of_range&)
        {
        }
        return true;
    }

    bool test_cubemap_face_selection()
    {
        const std::array<shp::Color, 6> colors = {
            shp::Color{255, 0, 0, 255}, shp::Color{0, 255, 0, 255}, shp::Color{0, 0, 255, 255},
            shp::Color{255, 255, 0, 255}, shp::Color{0, 255, 255, 255}, shp::Color{255, 0, 255, 255}
        };
        const shp::CubemapData cube = shp::make_solid_cubemap(colors);
        const glm::vec3 dirs[] = {
            glm::vec3(1.0f, 0.1f, 0.2f), glm::vec3(-1.0f, 0.0f, 0.3f), glm::vec3(0.1f, 1.0f, 0.0f),
            glm::vec3(0.0f, -1.0f, 0.2f), glm::vec3(0.2f, 0.1f, 1.0f), glm::vec3(0.0f, 0.3f, -1.0f)
        };
        for (size_t i = 0; i < 6; ++i)
        {
            if (shp::cube_coord_from_direction(dirs[i]).face != (shp::CubeFace)i) return false;
            const glm::vec4 c = shp::sample_cubemap(cube, shp::SamplerDesc{}, dirs[i]);
            if (!approx_eq(c.r, colors[i].r / 255.0f, 1e-5f)) return false;
            if (!approx_eq(c.g, colors[i].g / 255.0f, 1e-5f)) return false;
            if (!approx_eq(c.b, colors[i].b / 255.0f, 1e-5f)) return false;
        }
        return true;
    }

    bool test_convention_helpers()
    {
        const glm::mat4 view = shp::look_at_lh(glm::vec3(0.0f, 0.0f, -5.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        if (!approx_eq(shp::transform_point(view, glm::vec3(0.0f)), glm::vec4(0.0f, 0.0f, 5.0f, 1.0f), 1e-5f)) return false;

        shp::CameraRig rig{};
        rig.position = glm::vec3(0.0f, 0.0f, -5.0f);
        const glm::mat4 rig_view = shp::camera_view(rig);
        for (int c = 0; c < 4; ++c)
        {
            if (!approx_eq(rig_view[c], view[c], 1e-5f)) return false;
        }

        const glm::mat4 ortho = shp::ortho_lh_zo(-2.0f, 2.0f, -2.0f, 2.0f, 0.0f, 10.0f);
        if (!approx_eq(shp::project_point(ortho, glm::vec3(2.0f, 2.0f, 10.0f)), glm::vec3(1.0f, 1.0f, 1.0f), 1e-5f)) return false;
        if (!approx_eq(shp::project_point(ortho, glm::vec3(0.0f)).z, 0.0f, 1e-6f)) return false;

        // Direction нь translation-д өртөхгүй.
        const glm::mat4 t = shp::make_translation(glm::vec3(5.0f, 0.0f, 0.0f));
        return approx_eq(shp::transform_direction(t, glm::vec3(1.0f, 0.0f, 0.0f)), glm::vec3(1.0f, 0.0f, 0.0f), 0.0f);
    }

    bool test_generate_tangent_basis()
    {
        shp::MeshData m = shp::make_plane(2.0f, 2.0f);
        if (m.triangle_count() != 2u || !m.has_tangent_basis()) return false;
        m.tangents.clear();
        m.bitangents.clear();
        if (m.has_tangent_basis()) return false;

        shp::generate_tangent_basis(m);
        if (!m.has_tangent_basis()) return false;
        for (size_t i = 0; i < m.vertex_count(); ++i)
        {
            // u нь +X, v нь +Z дагуу өснө.
            if (!approx_eq(m.tangents[i], glm::vec3(1.0f, 0.0f, 0.0f), 1e-5f)) return false;
            if (!approx_eq(m.bitangents[i], glm::vec3(0.0f, 0.0f, 1.0f), 1e-5f)) return false;
        }
        return true;
    }

    bool test_link_reports_missing_slot()
    {
        const shp::CameraUniform camera{};
        const shp::Texture2DData diffuse = shp::make_solid_texture(shp::Color{255, 255, 255, 255});
        const shp::DrawImmediates imm{};

        shp::BindingSet b{};
        b.camera = &camera;
        b.diffuse.texture = &diffuse;
        b.immediates = &imm;

        const shp::Result<shp::LinkedStage> missing = shp::link_stage(shp::StageKind::Lighting, b);
        if (missing.ok) return false;
        if (missing.error.find("normal_texture") == std::string::npos) return false;

        b.normal.texture = &diffuse;
        const shp::Result<shp::LinkedStage> linked = shp::link_stage(shp::StageKind::Lighting, b);
        if (!linked.ok) return false;
        if (linked.value.layout_mask != shp::stage_binding_layout(shp::StageKind::Lighting)) return false;

        // Хоосон texture холбогдоогүйтэй адил.
        const shp::Texture2DData empty{};
        b.normal.texture = &empty;
        if (shp::link_stage(shp::StageKind::Lighting, b).ok) return false;

        return shp::link_stage(shp::StageKind::VertexPositionOnly, shp::BindingSet{}).ok;
    }
}

int main()
{
    const bool ok_columns = test_mat4_column_composition();
    const bool ok_trs = test_make_trs_order();
    const bool ok_normalize = test_normalize_checked_rejects_zero();
    const bool ok_project = test_project_point_rejects_zero_w();
    const bool ok_singular = test_singular_camera_fails();
    const bool ok_rig = test_camera_rig_projection();
    const bool ok_vs_identity = test_identity_vertex_passthrough();
    const bool ok_vs_world = test_vertex_world_directions_normalized();
    const bool ok_lighting_eq = test_lighting_world_tangent_equivalence();
    const bool ok_lighting_interp = test_lighting_interpolated_frame_equivalence();
    const bool ok_lighting_alpha = test_lighting_fragment_alpha_from_immediates();
    const bool ok_decode = test_decode_normal_sample();
    const bool ok_sky_round_trip = test_skybox_round_trip();
    const bool ok_sky_invariance = test_skybox_recentered_translation_invariance();
    const bool ok_sky_vs = test_skybox_vertex_stage();
    const bool ok_cube = test_cubemap_face_selection();
    const bool ok_link = test_link_reports_missing_slot();
    const bool ok_convention = test_convention_helpers();
    const bool ok_tangents = test_generate_tangent_basis();

    if (!ok_columns) std::fprintf(stderr, "[stage-tests] mat4 column composition failed\n");
    if (!ok_trs) std::fprintf(stderr, "[stage-tests] TRS composition order failed\n");
    if (!ok_normalize) std::fprintf(stderr, "[stage-tests] checked normalize did not reject zero vector\n");
    if (!ok_project) std::fprintf(stderr, "[stage-tests] project_point did not reject zero w\n");
    if (!ok_singular) std::fprintf(stderr, "[stage-tests] singular camera was accepted\n");
    if (!ok_rig) std::fprintf(stderr, "[stage-tests] camera rig projection failed\n");
    if (!ok_vs_identity) std::fprintf(stderr, "[stage-tests] identity vertex passthrough failed\n");
    if (!ok_vs_world) std::fprintf(stderr, "[stage-tests] world-space vertex directions failed\n");
    if (!ok_lighting_eq) std::fprintf(stderr, "[stage-tests] world/tangent lighting mismatch\n");
    if (!ok_lighting_interp) std::fprintf(stderr, "[stage-tests] interpolated tangent frame lighting mismatch\n");
    if (!ok_lighting_alpha) std::fprintf(stderr, "[stage-tests] lighting alpha from immediates failed\n");
    if (!ok_decode) std::fprintf(stderr, "[stage-tests] normal sample decode failed\n");
    if (!ok_sky_round_trip) std::fprintf(stderr, "[stage-tests] skybox ray round trip failed\n");
    if (!ok_sky_invariance) std::fprintf(stderr, "[stage-tests] recentered skybox translation invariance failed\n");
    if (!ok_sky_vs) std::fprintf(stderr, "[stage-tests] skybox vertex stage failed\n");
    if (!ok_cube) std::fprintf(stderr, "[stage-tests] cubemap face selection failed\n");
    if (!ok_link) std::fprintf(stderr, "[stage-tests] binding link check failed\n");
    if (!ok_convention) std::fprintf(stderr, "[stage-tests] LH convention helpers failed\n");
    if (!ok_tangents) std::fprintf(stderr, "[stage-tests] tangent basis generation failed\n");

    if (!(ok_columns && ok_trs && ok_normalize && ok_project && ok_singular && ok_rig &&
          ok_vs_identity && ok_vs_world && ok_lighting_eq && ok_lighting_interp && ok_lighting_alpha && ok_decode &&
          ok_sky_round_trip && ok_sky_invariance && ok_sky_vs && ok_cube && ok_link &&
          ok_convention && ok_tangents)) return 1;
    std::fprintf(stderr, "[stage-tests] all tests passed\n");
    return 0;
}
