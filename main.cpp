// main.cpp
#include "Application.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <cstdio>
#include <memory>
#include <string>

static void handleGlfwError(int err, const char* description)
{
    fprintf(stderr, "GLFW Error: %d: %s\n", err, description);
}

int main()
{
    glfwSetErrorCallback(handleGlfwError);
    if (!glfwInit())
    {
        fprintf(stderr, "Failed to initialize GLFW!\n");
        return 1;
    }

    auto app = std::make_unique<Application>();
    const EditorConfig& config = app->loadConfig("jotter.lua");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(config.windowWidth, config.windowHeight,
                                          app->title().c_str(), nullptr, nullptr);
    if (!window)
    {
        fprintf(stderr, "Failed to create window!\n");
        app.reset();
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    app->initGraphics();

    std::string title = app->title();
    while (!glfwWindowShouldClose(window))
    {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        if (app->frame())
            glfwSetWindowShouldClose(window, GLFW_TRUE);

        if (app->title() != title)
        {
            title = app->title();
            glfwSetWindowTitle(window, title.c_str());
        }

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // textures and Lua go before the GL context
    app.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
