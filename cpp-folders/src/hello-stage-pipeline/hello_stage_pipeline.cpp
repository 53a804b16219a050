/*

Shading stage pipeline (headless)


Нэг кадрыг бүх stage-ээр дамжуулж зурах жишээ

1. PASS-1: Scene
   - Normal-mapped plane + box (vertex full + tangent-space lighting)
   - Skybox: full-screen гурвалжин, камерт төвлөрсөн ray
   - HDR render target

2. PASS-2: Box blur (4 хөрш, төв орохгүй)
3. PASS-3: Overlay (alpha blend)
4. PASS-4: Tonemap -> LDR

Тусдаа: compute stage [1..8] * 2


Ашиглах

  hello_stage_pipeline [--capture out.ppm] [--frames N] [--tangent-space]
                       [--standard-sky] [--opaque] [--threads N]

*/

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shp/camera/camera_rig.hpp"
#include "shp/compute/compute_stage.hpp"
#include "shp/core/context.hpp"
#include "shp/core/log.hpp"
#include "shp/frame/stage_params.hpp"
#include "shp/geometry/primitives_builders.hpp"
#include "shp/job/thread_pool_job_system.hpp"
#include "shp/passes/pass_post_process.hpp"
#include "shp/passes/pass_tonemap.hpp"
#include "shp/render/stage_draws.hpp"

#define CHECKER_SIZE      64
#define CHECKER_CELLS     8
#define ORBIT_RADIUS      6.0f
#define ORBIT_HEIGHT      3.0f

struct CaptureConfig
{
    bool enabled = false;
    std::string path{};
    int frames = 1;
    size_t threads = 0;
};

static bool write_ldr_to_ppm(const shp::RT_ColorLDR& ldr, const std::string& path)
{
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << "P6\n" << ldr.w << " " << ldr.h << "\n255\n";
    // RT-ийн мөр 0 нь доод мөр, PPM дээрээс доош бичигдэнэ.
    for (int y_screen = 0; y_screen < ldr.h; ++y_screen)
    {
        const int y = ldr.h - 1 - y_screen;
        for (int x = 0; x < ldr.w; ++x)
        {
            const shp::Color c = ldr.color.at(x, y);
            const char rgb[3] = {
                (char)c.r,
                (char)c.g,
                (char)c.b
            };
            out.write(rgb, 3);
        }
    }
    return out.good();
}

// Asset ачаалахгүй тул texture-уудыг процедурээр үүсгэнэ.
static shp::Texture2DData make_checker_texture()
{
    shp::Texture2DData tex(CHECKER_SIZE, CHECKER_SIZE, shp::Color{0, 0, 0, 255}, true);
    tex.label = "checker_albedo";
    const int cell = CHECKER_SIZE / CHECKER_CELLS;
    for (int y = 0; y < CHECKER_SIZE; ++y)
    {
        for (int x = 0; x < CHECKER_SIZE; ++x)
        {
            const bool odd = ((x / cell) + (y / cell)) % 2 == 1;
            tex.at(x, y) = odd ? shp::Color{200, 190, 170, 255} : shp::Color{90, 110, 140, 255};
        }
    }
    return tex;
}

// Cell бүрт бөмбөгөр товгор normal.
static shp::Texture2DData make_bump_normal_texture()
{
    shp::Texture2DData tex(CHECKER_SIZE, CHECKER_SIZE, shp::Color{128, 128, 255, 255}, false);
    tex.label = "bump_normal";
    const float cell = (float)CHECKER_SIZE / (float)CHECKER_CELLS;
    for (int y = 0; y < CHECKER_SIZE; ++y)
    {
        for (int x = 0; x < CHECKER_SIZE; ++x)
        {
            const float lx = std::fmod((float)x + 0.5f, cell) / cell * 2.0f - 1.0f;
            const float ly = std::fmod((float)y + 0.5f, cell) / cell * 2.0f - 1.0f;
            const glm::vec3 n = glm::normalize(glm::vec3(lx * 0.6f, ly * 0.6f, 1.0f));
            tex.at(x, y) = shp::encode_unorm8(glm::vec4(n * 0.5f + glm::vec3(0.5f), 1.0f));
        }
    }
    return tex;
}

static shp::CameraRig orbit_camera(int frame, int frame_count, float aspect)
{
    const float t = frame_count > 1 ? (float)frame / (float)frame_count : 0.0f;
    const float angle = glm::radians(200.0f) + t * glm::two_pi<float>();
    shp::CameraRig rig{};
    rig.aspect = aspect;
    rig.position = glm::vec3(std::sin(angle) * ORBIT_RADIUS, ORBIT_HEIGHT, std::cos(angle) * ORBIT_RADIUS);

    // +Z forward (LH). Эх цэг рүү харуулна.
    const glm::vec3 fwd = glm::normalize(-rig.position);
    const float yaw = std::atan2(fwd.x, fwd.z);
    const float pitch = std::asin(glm::clamp(fwd.y, -1.0f, 1.0f));
    rig.rotation = glm::angleAxis(yaw, glm::vec3(0.0f, 1.0f, 0.0f)) * glm::angleAxis(-pitch, glm::vec3(1.0f, 0.0f, 0.0f));
    return rig;
}

int main(int argc, char* argv[])
{
    CaptureConfig capture{};
    shp::StageParams params{};
    shp::DrawImmediates immediates{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--capture" && i + 1 < argc)
        {
            capture.path = argv[++i];
            capture.enabled = !capture.path.empty();
        }
        else if (arg == "--frames" && i + 1 < argc)
        {
            capture.frames = std::max(1, std::atoi(argv[++i]));
        }
        else if (arg == "--threads" && i + 1 < argc)
        {
            capture.threads = (size_t)std::max(0, std::atoi(argv[++i]));
        }
        else if (arg == "--tangent-space")
        {
            params.lighting.space = shp::LightingSpace::Tangent;
        }
        else if (arg == "--standard-sky")
        {
            params.reflection_mode = shp::ReflectionMode::Standard;
        }
        else if (arg == "--opaque")
        {
            immediates.scale = 1.0f;
        }
        else
        {
            shp::log_warn("unknown argument: " + arg);
        }
    }

    std::unique_ptr<shp::ThreadPoolJobSystem> jobs =
        std::make_unique<shp::ThreadPoolJobSystem>(capture.threads == 0 ? shp::default_worker_count() : capture.threads);
    shp::StageContext ctx{};
    ctx.job_system = jobs.get();
    shp::log_info("workers: " + std::to_string(jobs->worker_count()));

    // Resources
    shp::MeshData plane = shp::make_plane(8.0f, 8.0f, 8, 8);
    for (glm::vec2& uv : plane.uvs) uv *= 4.0f;
    const shp::MeshData box = shp::make_box(glm::vec3(1.5f));
    const shp::Texture2DData albedo = make_checker_texture();
    const shp::Texture2DData normal_map = make_bump_normal_texture();
    const shp::CubemapData sky = shp::make_solid_cubemap({
        shp::Color{170, 120, 110, 255}, shp::Color{110, 120, 170, 255},
        shp::Color{140, 180, 230, 255}, shp::Color{60, 55, 50, 255},
        shp::Color{120, 170, 140, 255}, shp::Color{170, 160, 120, 255}
    });

    const shp::InstanceTransform plane_instance = shp::InstanceTransform::identity();
    const shp::InstanceTransform box_instance = shp::InstanceTransform::from_matrix(
        shp::make_trs(glm::vec3(0.0f, 0.75f, 0.0f), glm::angleAxis(glm::radians(30.0f), glm::vec3(0.0f, 1.0f, 0.0f)), glm::vec3(1.0f)));

    // Render targets
    shp::RT_ColorHDR scene(params.w, params.h);
    shp::RT_DepthBuffer depth(params.w, params.h);
    shp::RT_ColorHDR blurred(params.w, params.h);
    shp::RT_ColorHDR composed(params.w, params.h);
    shp::RT_ColorLDR ldr(params.w, params.h);

    const float aspect = (float)params.w / (float)params.h;

    const shp::PassBoxBlur blur_pass{};
    const shp::PassOverlay overlay_pass{};
    const shp::PassTonemap tonemap_pass{};

    for (int frame = 0; frame < capture.frames; ++frame)
    {
        ctx.debug.reset();

        const shp::Result<shp::CameraUniform> camera = shp::build_camera_uniform(orbit_camera(frame, capture.frames, aspect));
        if (!camera.ok) return 1;

        shp::BindingSet bindings{};
        bindings.camera = &camera.value;
        bindings.diffuse.texture = &albedo;
        bindings.normal.texture = &normal_map;
        bindings.environment.cubemap = &sky;
        bindings.immediates = &immediates;

        scene.clear(shp::ColorF{0.0f, 0.0f, 0.0f, 1.0f});
        depth.clear();
        const shp::RasterizerTarget target{&scene, &depth};

        // PASS-1
        bindings.instance = &plane_instance;
        if (!shp::draw_lit_mesh(ctx, plane, bindings, params.lighting, target).ok) return 1;
        bindings.instance = &box_instance;
        if (!shp::draw_lit_mesh(ctx, box, bindings, params.lighting, target).ok) return 1;
        if (params.enable_skybox)
        {
            if (!shp::draw_skybox(ctx, bindings, params.reflection_mode, target).ok) return 1;
        }

        // PASS-2, PASS-3
        const shp::RT_ColorHDR* current = &scene;
        if (params.enable_blur)
        {
            shp::BindingSet pb{};
            pb.scene_color.target = current;
            if (!blur_pass.execute(ctx, shp::PassBoxBlur::Inputs{&params.pass.blur, pb, &blurred}).ok) return 1;
            current = &blurred;
        }
        if (params.enable_overlay)
        {
            shp::BindingSet pb{};
            pb.scene_color.target = current;
            if (!overlay_pass.execute(ctx, shp::PassOverlay::Inputs{&params.pass.overlay, pb, &composed}).ok) return 1;
            current = &composed;
        }

        // PASS-4
        if (!tonemap_pass.execute(ctx, shp::PassTonemap::Inputs{&params.pass.tonemap, current, &ldr}).ok) return 1;

        shp::log_info(
            "frame " + std::to_string(frame) +
            " | draws " + std::to_string(ctx.debug.draws) +
            " | tris " + std::to_string(ctx.debug.tri_raster) + "/" + std::to_string(ctx.debug.tri_input) +
            " | vs " + std::to_string(ctx.debug.vertex_invocations) +
            " | fs " + std::to_string(ctx.debug.fragment_invocations));
    }

    // Compute
    std::vector<float> compute_in((size_t)params.compute.invocation_count());
    for (size_t i = 0; i < compute_in.size(); ++i) compute_in[i] = (float)(i + 1);
    std::vector<float> compute_out(compute_in.size(), 0.0f);
    shp::BindingSet cb{};
    cb.compute_input = compute_in;
    cb.compute_output = compute_out;
    cb.compute_input_bound = true;
    cb.compute_output_bound = true;
    const shp::Result<uint64_t> dispatched = shp::dispatch_compute_linked(ctx, params.compute, cb, shp::scale_kernel(params.compute_scale));
    if (!dispatched.ok) return 1;
    std::string values{};
    for (float v : compute_out) values += std::to_string((int)v) + " ";
    shp::log_info("compute: " + values);

    if (capture.enabled)
    {
        if (!write_ldr_to_ppm(ldr, capture.path))
        {
            shp::log_error("failed to write capture: " + capture.path);
            return 2;
        }
        shp::log_info("captured: " + capture.path);
    }
    return 0;
}
