#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <glm/glm.hpp>

#include "camera.h"
#include "player.h"
#include "terrain_program.h"
#include "terrain_renderer.h"
#include "world.h"

namespace {
std::filesystem::path locateShaderDir() {
    std::filesystem::path current = std::filesystem::current_path();
    for (int i = 0; i < 6; ++i) {
        if (std::filesystem::exists(current / "shaders" / "terrain.vert")) {
            return current / "shaders";
        }
        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }
    return std::filesystem::path(VOXTORUS_PROJECT_DIR) / "shaders";
}

uint32_t clockSeed() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

uint32_t parseSeed(int argc, char** argv) {
    if (argc < 2) {
        return clockSeed();
    }
    try {
        unsigned long value = std::stoul(argv[1]);
        return static_cast<uint32_t>(value);
    } catch (const std::invalid_argument&) {
        std::cerr << "[Main] Invalid seed '" << argv[1] << "', using clock seed" << std::endl;
    } catch (const std::out_of_range&) {
        std::cerr << "[Main] Seed '" << argv[1] << "' out of range, using clock seed" << std::endl;
    }
    return clockSeed();
}

// Pointer motion accumulated between frames.
struct CursorTracker {
    double lastX = 0.0;
    double lastY = 0.0;
    bool first = true;
};

void glfwErrorCallback(int code, const char* desc) {
    std::cerr << "GLFW Error (" << code << "): " << desc << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    WorldConfig config;
    config.seed = parseSeed(argc, argv);

    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        std::cerr << "[Main] Failed to initialize GLFW" << std::endl;
        return -1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    const int initialWidth = 1600;
    const int initialHeight = 900;
    GLFWwindow* window = glfwCreateWindow(initialWidth, initialHeight, "voxtorus", nullptr, nullptr);
    if (!window) {
        std::cerr << "[Main] Failed to create window" << std::endl;
        glfwTerminate();
        return -1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        std::cerr << "[Main] Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_CULL_FACE);
    glCullFace(GL_BACK);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 410");

    int exitCode = 0;
    {
        TerrainProgram terrainProgram;
        if (!terrainProgram.build(locateShaderDir())) {
            std::cerr << "[Main] Terrain shader unavailable" << std::endl;
            exitCode = -1;
        } else {
            World world(config);
            world.camera().setPerspective(75.0f, static_cast<float>(initialWidth) / initialHeight, 0.1f, 1000.0f);

            TerrainRenderer renderer(config.playerRadius, config.playerHeight);
            renderer.sync(world.chunks(), world.initialChunks());

            InputIntent input;
            CursorTracker cursor;
            bool cursorCaptured = false;
            bool escapeLast = false;
            bool wireframe = false;
            const glm::vec3 sky(0x87 / 255.0f, 0xCE / 255.0f, 0xEB / 255.0f);
            const glm::vec3 sunDir(50.0f, 100.0f, 50.0f);

            double lastTime = glfwGetTime();
            while (!glfwWindowShouldClose(window)) {
                double now = glfwGetTime();
                float dt = static_cast<float>(now - lastTime);
                lastTime = now;

                glfwPollEvents();

                bool escapeDown = glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS;
                if (escapeDown && !escapeLast) {
                    if (cursorCaptured) {
                        cursorCaptured = false;
                        glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
                    } else {
                        glfwSetWindowShouldClose(window, GLFW_TRUE);
                    }
                }
                escapeLast = escapeDown;

                if (!cursorCaptured && !io.WantCaptureMouse &&
                    glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS) {
                    cursorCaptured = true;
                    cursor.first = true;
                    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_DISABLED);
                }

                int fbw = 0, fbh = 0;
                glfwGetFramebufferSize(window, &fbw, &fbh);
                glViewport(0, 0, fbw, fbh);
                if (fbh > 0) {
                    world.camera().setAspect(static_cast<float>(fbw) / static_cast<float>(fbh));
                }

                double cursorX = 0.0, cursorY = 0.0;
                glfwGetCursorPos(window, &cursorX, &cursorY);
                if (cursor.first) {
                    cursor.lastX = cursorX;
                    cursor.lastY = cursorY;
                    cursor.first = false;
                }
                input.mouseDeltaX += static_cast<float>(cursorX - cursor.lastX);
                input.mouseDeltaY += static_cast<float>(cursorY - cursor.lastY);
                cursor.lastX = cursorX;
                cursor.lastY = cursorY;

                input.lookActive = cursorCaptured;
                input.forward = glfwGetKey(window, GLFW_KEY_W) == GLFW_PRESS;
                input.back = glfwGetKey(window, GLFW_KEY_S) == GLFW_PRESS;
                input.left = glfwGetKey(window, GLFW_KEY_A) == GLFW_PRESS;
                input.right = glfwGetKey(window, GLFW_KEY_D) == GLFW_PRESS;

                std::vector<ChunkCoord> created = world.update(dt, input);
                renderer.sync(world.chunks(), created);

                glClearColor(sky.r, sky.g, sky.b, 1.0f);
                glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

                terrainProgram.bind();
                terrainProgram.setViewProjection(world.camera().viewProjectionMatrix());
                terrainProgram.setLighting(sunDir, 0.6f, 0.8f);

                glPolygonMode(GL_FRONT_AND_BACK, wireframe ? GL_LINE : GL_FILL);
                renderer.render(terrainProgram);
                glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
                renderer.renderPlayer(terrainProgram, world.player());

                ImGui_ImplOpenGL3_NewFrame();
                ImGui_ImplGlfw_NewFrame();
                ImGui::NewFrame();
                ImGui::Begin("voxtorus HUD");
                ImGui::Text("FPS: %.1f", 1.0f / std::max(dt, 0.0001f));
                const PlayerState& player = world.player();
                ImGui::Text("Player: %.1f %.1f %.1f", player.position.x, player.position.y, player.position.z);
                ImGui::Text("Heading: %.2f rad", player.heading);
                ImGui::Text("Chunks: %d (%d uploaded)", world.chunkCount(), renderer.uploadedCount());
                ImGui::Text("Vertices: %zu", renderer.vertexCount());
                ImGui::Text("Seed: %u", static_cast<unsigned>(world.config().seed));
                ImGui::Checkbox("Wireframe", &wireframe);
                ImGui::TextUnformatted(cursorCaptured ? "Esc releases the pointer" : "Click to look around");
                ImGui::End();

                ImGui::Render();
                ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

                glfwSwapBuffers(window);
            }
        }
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}
