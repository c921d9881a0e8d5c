#include <iostream>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#define IMGUI_IMPL_OPENGL_LOADER_GLEW
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <memory>
#include <plog/Log.h>
#include <GenViewer/AssetFetcher.hpp>
#include <GenViewer/CurlHttpClient.hpp>
#include <GenViewer/GLSceneRenderer.hpp>
#include <GenViewer/Logging.hpp>
#include <GenViewer/OperationCoordinator.hpp>
#include <GenViewer/RenderLoop.hpp>
#include <GenViewer/RotationController.hpp>
#include <GenViewer/ViewerConfig.hpp>
#include <GenViewer/ViewerOverlay.hpp>
#include <GenViewer/ViewerState.hpp>

using namespace GenViewer;

namespace {

// Window callbacks reach the session through the GLFW user pointer
struct WindowContext {
    ViewerState* state = nullptr;
    RenderLoop* loop = nullptr;
};

void glfw_error_callback(int error, const char* description)
{
    PLOGE << "Glfw Error " << error << ": " << description;
}

void framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto ctx = static_cast<WindowContext*>(glfwGetWindowUserPointer(window));
    if(ctx && ctx->state) ctx->state->scene.setViewportSize(width, height);
}

// Iconified windows stop rendering; restoring re-arms the loop
void window_iconify_callback(GLFWwindow* window, int iconified)
{
    auto ctx = static_cast<WindowContext*>(glfwGetWindowUserPointer(window));
    if(!ctx || !ctx->loop) return;
    if(iconified) ctx->loop->stop(); else ctx->loop->start();
}

} // namespace

int main(int argc, char** argv)
{
    ViewerConfig config;
    std::string configError;
    bool configOk = config.parseArgs(argc, argv, &configError);
    initLogging(config);
    if(!configOk){
        PLOGE << "Invalid configuration: " << configError;
        std::cerr << ViewerConfig::usage();
        return 2;
    }
    if(config.showHelp){
        std::cout << ViewerConfig::usage();
        return 0;
    }
    PLOGI << "Asset server: " << config.serverUrl << " (model " << config.modelUrl() << ", generate " << config.generateUrl() << ")";

    // Setup window
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        return 1;

    // GL 3.3 + core profile
    const char* glsl_version = "#version 330";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(config.windowWidth, config.windowHeight, "GenViewer", nullptr, nullptr);
    if (window == nullptr){
        PLOGE << "Failed to create window";
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Initialize GLEW
    if (glewInit() != GLEW_OK) {
        PLOGE << "Failed to initialize GLEW";
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO(); (void)io;
    io.IniFilename = nullptr; // fixed layout, nothing to persist
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    {
        ViewerState state;
        int fbW = 0, fbH = 0;
        glfwGetFramebufferSize(window, &fbW, &fbH);
        state.scene.setViewportSize(fbW, fbH);

        auto http = std::make_shared<CurlHttpClient>();
        http->setTimeoutSeconds(config.timeoutSeconds);
        AssetFetcher fetcher(http, config.modelFormatHint);
        OperationCoordinator coordinator(state, fetcher, config.modelUrl(), config.generateUrl());
        RotationController rotation(state.rotation);
        ViewerOverlay overlay(coordinator, rotation);

        GLSceneRenderer renderer(window);
        if(!renderer.isReady()) PLOGW << "Renderer shaders unavailable; only the UI will be drawn";
        RenderLoop loop(state, renderer);
        loop.setOverlay([](){
            ImGui::Render();
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        });

        WindowContext ctx{&state, &loop};
        glfwSetWindowUserPointer(window, &ctx);
        glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);
        glfwSetWindowIconifyCallback(window, window_iconify_callback);

        if(config.loadOnStartup && !coordinator.requestLoad(LoadTrigger::Startup))
            PLOGW << "Startup load could not be started: " << coordinator.status().describe();
        loop.start();

        while (!glfwWindowShouldClose(window))
        {
            if(loop.isRunning()) glfwPollEvents();
            else glfwWaitEventsTimeout(0.1); // iconified: keep polling network completions slowly

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            overlay.handleInput();
            coordinator.poll();
            overlay.draw();

            if(!loop.tick()) ImGui::EndFrame();
        }
        loop.stop();
        coordinator.cancel();
        if(coordinator.outstandingCount() > 0)
            PLOGW << "Waiting up to " << config.timeoutSeconds << "s for " << coordinator.outstandingCount() << " in-flight request(s) before exit";
        glfwSetWindowUserPointer(window, nullptr);
        PLOGI << "Shutting down after " << loop.frameCount() << " frames";
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();

    return 0;
}
