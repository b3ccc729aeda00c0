#include "audio/beacon_receiver.hpp"
#include "config.hpp"
#include "config_io.hpp"
#include "lighting/animation_engine.hpp"
#include "lighting/light_pattern.hpp"
#include "gui/views/magnitude_view.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

// ImGui + OpenGL ES 3
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

using namespace heartlight;

class HeartLightGUI {
public:
    explicit HeartLightGUI(const Config& cfg)
        : config(cfg), engine(cfg, default_light_actions()) {}

    bool init() {
        receiver = audio::BeaconReceiver::create(config);
        if (!receiver) return false;

        // Renderer side of the engine: latest color, picked up every GUI frame
        engine.set_render_callback([this](const Color& c) {
            light_rgb.store((uint32_t(c.r) << 16) | (uint32_t(c.g) << 8) | uint32_t(c.b));
        });
        receiver->set_code_changed_callback([this](int code) {
            engine.on_code_changed(code);
        });
        return true;
    }

    bool init_gui() {
        if (!glfwInit()) return false;

        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(480, 800, "HeartLight", nullptr, nullptr);
        if (!window) {
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1); // Enable vsync

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO(); (void)io;
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
        io.IniFilename = nullptr;

        ImGui::StyleColorsDark();

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 300 es");
        return true;
    }

    int run() {
        if (!init_gui()) {
            std::cerr << "[gui] failed to create window" << std::endl;
            return 1;
        }

        if (!engine.start()) {
            shutdown_gui();
            return 1;
        }
        if (!receiver->start()) {
            std::cerr << "[gui] failed to start audio" << std::endl;
            engine.stop();
            shutdown_gui();
            return 1;
        }

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            render_gui();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            const uint32_t rgb = light_rgb.load();
            glClearColor(((rgb >> 16) & 0xFF) / 255.0f, ((rgb >> 8) & 0xFF) / 255.0f, (rgb & 0xFF) / 255.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        receiver->stop();
        engine.stop();
        shutdown_gui();
        return 0;
    }

private:
    Config config;
    AnimationEngine engine;
    std::unique_ptr<audio::BeaconReceiver> receiver;
    gui::MagnitudeView magnitude_view;
    GLFWwindow* window = nullptr;
    std::atomic<uint32_t> light_rgb{0};
    bool show_panel = true;

    void shutdown_gui() {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        window = nullptr;
    }

    void render_gui() {
        if (ImGui::IsKeyPressed(ImGuiKey_Space, false)) show_panel = !show_panel;
        if (!show_panel) return;

        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowBgAlpha(0.55f);
        ImGui::Begin("HeartLight", nullptr, ImGuiWindowFlags_AlwaysAutoResize);

        const int active = engine.active_code();
        const int detected = engine.detected_code();
        const LightAction* detected_action = find_light_action(default_light_actions(), detected);

        if (active != AnimationEngine::kNoCode) {
            ImGui::Text("Active:   %3d  %s", active, engine.active_name().c_str());
        } else {
            ImGui::Text("Active:   -");
        }
        if (detected != AnimationEngine::kNoCode) {
            ImGui::Text("Detected: %3d  %s", detected, detected_action ? detected_action->name.c_str() : "(undefined)");
        } else {
            ImGui::Text("Detected: -");
        }

        const Color c = engine.last_color();
        ImGui::Text("Color: %s  brightness: %3.0f%%  frames: %ld",
                    to_hex(c).c_str(), luminance(c) * 100.0f, engine.frames_emitted());

        const auto stats = receiver->get_latency_stats();
        ImGui::Text("Decode: avg %.2f ms, max %.2f ms | xruns: %d", stats.avg_ms, stats.max_ms, stats.xruns);
        if (config.feedback_enabled) {
            ImGui::Text("Feedback: dropped %ld | underruns: %d",
                        receiver->dropped_feedback_blocks(), receiver->feedback_underruns());
        }

        ImGui::Checkbox("Log scale", &magnitude_view.log_scale);
        ImDrawList* dl = ImGui::GetWindowDrawList();
        const ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
        const ImVec2 canvas_size(360, 180);
        magnitude_view.draw(dl, canvas_pos, canvas_size.x, canvas_size.y,
                            receiver->latest_magnitudes(), receiver->last_symbol(),
                            config.dominant_floor);
        ImGui::Dummy(canvas_size);
        ImGui::TextDisabled("Space: hide panel");

        ImGui::End();
    }
};

static void print_usage(const char* argv0) {
    std::cout << "HeartLight - ultrasonic beacon light\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>       Load settings (JSON)\n"
              << "  --save-config <path>  Write the effective settings and exit\n"
              << "  --device <name>       ALSA capture device (default: default)\n"
              << "  --feedback            Play the beacon back as audible tones\n"
              << "  --help                Show this help\n";
}

int main(int argc, char* argv[]) {
    Config config;
    std::string save_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            const char* path = argv[++i];
            if (!load_config(path, config)) {
                std::cerr << "Cannot read config " << path << std::endl;
                return 1;
            }
        } else if (arg == "--save-config" && i + 1 < argc) {
            save_path = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            config.device_name = argv[++i];
        } else if (arg == "--feedback") {
            config.feedback_enabled = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::string error;
    if (!validate_config(config, &error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }

    if (!save_path.empty()) {
        if (!save_config(save_path.c_str(), config)) {
            std::cerr << "Cannot write config " << save_path << std::endl;
            return 1;
        }
        std::cout << "Saved settings to " << save_path << std::endl;
        return 0;
    }

    HeartLightGUI app(config);
    if (!app.init()) return 1;
    return app.run();
}
