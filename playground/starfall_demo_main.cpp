//
// Starfall demo scene
// Instanced PBR meshes, transparent quads, billboards, a trail, UI and text
//

#include <starfall/DebugOverlay.hpp>
#include <starfall/GlfwWindow.hpp>
#include <starfall/Logger.hpp>
#include <starfall/RendererCore.hpp>
#include <starfall/TextRenderer.hpp>
#include <chrono>
#include <cmath>
#include <cstring>
#include <exception>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

struct DemoOptions {
    bool overlay = false;
    bool resize_storm = false;
    uint64_t max_frames = 0; ///< 0 runs until the window closes
    std::string font_path;
};

DemoOptions parse_options(int argc, char** argv)
{
    DemoOptions options;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--overlay") == 0) {
            options.overlay = true;
        } else if (std::strcmp(argv[i], "--resize-storm") == 0) {
            options.resize_storm = true;
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            options.max_frames = std::stoull(argv[++i]);
        } else if (std::strcmp(argv[i], "--font") == 0 && i + 1 < argc) {
            options.font_path = argv[++i];
        } else {
            starfall::Logger::instance().warn("Ignoring unknown argument '{}'", argv[i]);
        }
    }
    return options;
}

std::vector<uint8_t> read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

struct DemoScene {
    starfall::MeshTypeId sphere;
    starfall::MeshTypeId cube;
    starfall::MeshTypeId glass;
    starfall::MaterialId gold;
    starfall::MaterialId red;
    std::optional<starfall::TextMesh> title;
    std::optional<starfall::TextMesh> label;
};

std::expected<DemoScene, starfall::Error> build_scene(starfall::RendererCore& renderer, const DemoOptions& options)
{
    using namespace starfall;
    DemoScene scene;

    StandardPbr gold;
    gold.base_color = {1.0f, 0.78f, 0.34f, 1.0f};
    gold.metallic = 1.0f;
    gold.roughness = 0.3f;
    auto gold_id = renderer.create_material(gold);
    if (!gold_id) return std::unexpected(gold_id.error());
    scene.gold = *gold_id;

    StandardPbr red;
    red.base_color = {0.8f, 0.1f, 0.1f, 1.0f};
    red.roughness = 0.6f;
    red.emission = {1.0f, 0.2f, 0.1f};
    red.emission_strength = 0.3f;
    auto red_id = renderer.create_material(red);
    if (!red_id) return std::unexpected(red_id.error());
    scene.red = *red_id;

    auto glass_material = renderer.create_material(Transparent{Unlit{glm::vec4(0.3f, 0.6f, 1.0f, 0.4f)}, AlphaBlend{}, BlendMode::Alpha});
    if (!glass_material) return std::unexpected(glass_material.error());

    auto sphere = renderer.load_mesh(make_icosphere(3), scene.gold);
    if (!sphere) return std::unexpected(sphere.error());
    scene.sphere = *sphere;

    auto cube = renderer.load_mesh(make_cube(), scene.red);
    if (!cube) return std::unexpected(cube.error());
    scene.cube = *cube;

    auto glass = renderer.load_mesh(make_quad(2.0f, 2.0f), *glass_material);
    if (!glass) return std::unexpected(glass.error());
    scene.glass = *glass;

    if (!options.font_path.empty()) {
        auto font = read_file(options.font_path);
        auto text = TextRenderer::create(renderer, font);
        if (!text) {
            Logger::instance().warn("Text disabled: {}", text.error().describe());
        } else {
            auto title = text->create_text(renderer, "Starfall", TextStyle{.space = TextSpace::Screen, .scale = 0.75f});
            auto label = text->create_text(renderer, "Hello\nworld", TextStyle{.space = TextSpace::World, .lit = true, .scale = 1.0f});
            if (title) scene.title = *title;
            if (label) scene.label = *label;
        }
    }
    return scene;
}

void submit_scene(starfall::RendererCore& renderer, const DemoScene& scene, float time)
{
    using namespace starfall;

    renderer.submit_renderable(Renderable{scene.sphere, glm::mat4(1.0f), scene.gold, std::nullopt});

    for (int x = -3; x <= 3; ++x) {
        for (int z = -3; z <= 3; ++z) {
            glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(x * 1.5f, -1.5f, z * 1.5f));
            transform = glm::rotate(transform, time + static_cast<float>(x * z), glm::vec3(0.0f, 1.0f, 0.0f));
            transform = glm::scale(transform, glm::vec3(0.5f));
            float hue = static_cast<float>(x + 3) / 6.0f;
            renderer.submit_renderable(Renderable{scene.cube, transform, scene.red, glm::vec4(1.0f, hue, 1.0f - hue, 1.0f)});
        }
    }

    for (int i = 1; i <= 3; ++i) {
        glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.5f, static_cast<float>(i)));
        renderer.submit_renderable(Renderable{scene.glass, transform, MaterialId{}, std::nullopt});
    }

    for (int i = 0; i < 32; ++i) {
        float angle = time * 0.5f + static_cast<float>(i) * 0.196f;
        Billboard spark;
        spark.position = glm::vec3(std::cos(angle) * 3.0f, 1.5f + std::sin(angle * 3.0f) * 0.3f, std::sin(angle) * 3.0f);
        spark.size = glm::vec3(0.15f);
        spark.color = glm::vec4(1.0f, 0.7f, 0.3f, 1.0f);
        spark.blend = BlendMode::Additive;
        renderer.submit_billboard(spark);
    }

    std::vector<glm::vec3> trail;
    for (int i = 0; i < 10; ++i) {
        float t = time - static_cast<float>(i) * 0.08f;
        trail.emplace_back(std::cos(t) * 2.0f, 2.5f, std::sin(t) * 2.0f);
    }
    renderer.submit_trail(trail, TrailStyle{.width = 0.08f, .head_color = {0.4f, 0.8f, 1.0f, 1.0f}, .tail_color = {0.4f, 0.8f, 1.0f, 0.0f}});

    renderer.submit_ui_panel(UiPanel{.x = 16.0f, .y = 16.0f, .width = 220.0f, .height = 56.0f, .color = {0.0f, 0.0f, 0.0f, 0.6f}});
    if (scene.title) {
        renderer.submit_ui_text(*scene.title, 28.0f, 56.0f);
    }
    if (scene.label) {
        glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(-1.0f, 1.5f, 0.0f));
        transform = glm::scale(transform, glm::vec3(0.01f));
        renderer.submit_renderable(Renderable{scene.label->mesh_type, transform, scene.label->material, glm::vec4(0.9f, 0.9f, 1.0f, 1.0f)});
    }
}

int run(const DemoOptions& options)
{
    using namespace starfall;

    auto window = GlfwWindow::create(1280, 720, "Starfall");
    if (!window) {
        Logger::instance().critical("{}", window.error().describe());
        return exit_code(window.error().kind);
    }

    RendererConfig config;
    config.enable_debug_overlay = options.overlay;
    auto renderer = RendererCore::create(config, *window);
    if (!renderer) {
        Logger::instance().critical("{}", renderer.error().describe());
        return exit_code(renderer.error().kind);
    }

    auto scene = build_scene(**renderer, options);
    if (!scene) {
        Logger::instance().critical("{}", scene.error().describe());
        return exit_code(scene.error().kind);
    }

    std::unique_ptr<DebugOverlay> overlay;
    if (config.enable_debug_overlay) {
        auto created = DebugOverlay::create(**renderer, *window);
        if (!created) {
            Logger::instance().warn("Debug overlay disabled: {}", created.error().describe());
        } else {
            overlay = std::move(*created);
        }
    }

    OrbitCamera camera(1280, 720);
    camera.set_distance(9.0f);
    LightingEnvironment lighting = default_lighting();
    lighting.point_lights.push_back(PointLight{.position = {0.0f, 3.0f, 0.0f}, .color = {0.4f, 0.6f, 1.0f}, .intensity = 2.0f});

    FrameReport last_report;
    auto start = std::chrono::steady_clock::now();
    auto last_frame = start;
    int exit_status = 0;

    while (!window->should_close() && !(*renderer)->shutdown_requested()) {
        window->poll_events();
        if (auto resized = window->take_resize()) {
            (*renderer)->handle_resize(*resized);
            camera.handle_resize(resized->width, resized->height);
        }

        uint64_t frame = (*renderer)->frame_number();
        if (options.resize_storm && frame % 3 == 0 && frame < 30) {
            window->set_size(frame % 6 == 0 ? 1024 : 800, frame % 6 == 0 ? 768 : 600);
        }

        auto now = std::chrono::steady_clock::now();
        float time = std::chrono::duration<float>(now - start).count();
        float frame_ms = std::chrono::duration<float, std::milli>(now - last_frame).count();
        last_frame = now;
        camera.set_rotation(90.0f + time * 10.0f, 20.0f);

        if (auto begun = (*renderer)->begin_frame(camera.state(), lighting); !begun) {
            Logger::instance().critical("{}", begun.error().describe());
            exit_status = exit_code(begun.error().kind);
            break;
        }
        submit_scene(**renderer, *scene, time);
        if (overlay) {
            overlay->build(last_report, frame_ms);
        }

        auto report = (*renderer)->end_frame();
        if (!report) {
            Logger::instance().critical("{}", report.error().describe());
            exit_status = exit_code(report.error().kind);
            break;
        }
        last_report = *report;

        for (const auto& event : (*renderer)->drain_events()) {
            std::visit(overloaded{
                [](const InstancesDropped& dropped) {
                    Logger::instance().debug("Pool {} dropped {} instances in frame {}", dropped.mesh_type.index, dropped.dropped, dropped.frame);
                },
                [](const SwapchainRecreated& recreated) {
                    Logger::instance().debug("Swapchain now {}x{}", recreated.extent.width, recreated.extent.height);
                },
                [](const AssetFallbackUsed& fallback) {
                    Logger::instance().debug("Asset fallback: {}", fallback.message);
                }
            }, event);
        }

        if (options.max_frames != 0 && report->frame_number >= options.max_frames) {
            (*renderer)->request_shutdown();
        }
    }

    overlay.reset();
    (*renderer)->shutdown();
    return exit_status;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    try {
        return run(parse_options(argc, argv));
    } catch (const std::exception& e) {
        starfall::Logger::instance().critical("Unhandled exception: {}", e.what());
        return starfall::exit_code(starfall::ErrorKind::Unknown);
    }
}
