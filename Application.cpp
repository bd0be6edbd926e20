// Application.cpp
#include "Application.hpp"
#include "LuaBindings.hpp"
#include "IconManager.hpp"
#include "EditorRenderer.hpp"
#include "OutputPanel.hpp"
#include "imgui.h"
#include <filesystem>

Application::Application()
    : showOutput(true),
      showLineNumbers(true),
      closeRequested(false),
      dialogs_(),
      fileOps_(&dialogs_),
      log_(),
      editor_(&fileOps_, &log_),
      config_()
{
    lua_ = std::make_unique<LuaBindings>(this);
}

Application::~Application() = default;

const EditorConfig& Application::loadConfig(const std::string& path)
{
    if (std::filesystem::exists(path) && lua_->loadScript(path))
        addOutput(OutputIcon::Checkmark, "Loaded config: " + path);

    config_ = EditorConfig::fromLua(lua_->L());
    showLineNumbers = config_.showLineNumbers;
    return config_;
}

void Application::initGraphics()
{
    applyTheme();
    loadFont();

    iconManager_ = std::make_unique<IconManager>(&log_);
    renderer_ = std::make_unique<EditorRenderer>(this, iconManager_.get());
    outputPanel_ = std::make_unique<OutputPanel>(this, iconManager_.get());

    iconManager_->loadIcons(ImGui::GetIO().FontGlobalScale);
    lua_->loadPlugins();

    if (config_.startupFile)
    {
        if (auto task = editor_.openPath(*config_.startupFile))
            runner_.spawn(std::move(*task));
    }
}

void Application::applyTheme()
{
    if (config_.darkTheme)
        ImGui::StyleColorsDark();
    else
        ImGui::StyleColorsLight();

    ImGuiStyle& style = ImGui::GetStyle();
    style.Colors[ImGuiCol_TitleBgActive] = style.Colors[ImGuiCol_TitleBg];
}

void Application::loadFont()
{
    if (config_.fontPath.empty())
        return;

    if (!std::filesystem::exists(config_.fontPath))
    {
        addOutput(OutputIcon::Error, "Font not found: " + config_.fontPath);
        return;
    }

    ImGuiIO& io = ImGui::GetIO();
    ImFont* font = io.Fonts->AddFontFromFileTTF(config_.fontPath.c_str(), config_.fontSize);
    if (font)
    {
        io.FontDefault = font;
        addOutput(OutputIcon::Checkmark, "Loaded font: " + config_.fontPath);
    }
    else
    {
        addOutput(OutputIcon::Error, "Could not load font: " + config_.fontPath);
    }
}

void Application::dispatch(Message message)
{
    if (auto task = editor_.update(std::move(message)))
        runner_.spawn(std::move(*task));
}

bool Application::frame()
{
    for (auto& message : runner_.poll())
        dispatch(std::move(message));

    handleKeyboardShortcuts();

    renderer_->renderMenuBar();

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImVec2 workPos = viewport->WorkPos;
    ImVec2 workSize = viewport->WorkSize;
    float outputHeight = showOutput ? 180.0f : 0.0f;

    ImGui::SetNextWindowPos(workPos, ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(workSize.x, workSize.y - outputHeight), ImGuiCond_Always);
    renderer_->renderEditor();

    if (showOutput)
    {
        outputPanel_->render(workPos, workSize, outputHeight);
    }

    lua_->runHook("on_render");

    return closeRequested;
}

void Application::handleKeyboardShortcuts()
{
    ImGuiIO& io = ImGui::GetIO();

    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_N))
        dispatch(msg::New{});
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_O))
        dispatch(msg::Open{});
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S))
        dispatch(msg::Save{});
}
