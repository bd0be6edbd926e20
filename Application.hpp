// Application.hpp
#pragma once

#include <memory>
#include <string>
#include "Config.hpp"
#include "Editor.hpp"
#include "FileOperations.hpp"
#include "NativeFileDialogs.hpp"
#include "OutputLog.hpp"
#include "TaskRunner.hpp"

class LuaBindings;
class IconManager;
class EditorRenderer;
class OutputPanel;

// Owns the editor state and the UI subsystems around it. One instance per
// window, driven once per frame from main().
class Application
{
public:
    Application();
    ~Application();

    // Runs jotter.lua. Needs no graphics context.
    const EditorConfig& loadConfig(const std::string& path);
    // Needs a current GL context and ImGui context.
    void initGraphics();

    // Returns true once the user asked to quit.
    bool frame();

    void dispatch(Message message);
    void addOutput(OutputIcon icon, const std::string& text) { log_.add(icon, text); }
    void addOutput(const std::string& text) { log_.add(text); }

    const Editor& editor() const { return editor_; }
    const EditorConfig& config() const { return config_; }
    OutputLog& log() { return log_; }
    std::string title() const { return editor_.title(); }

    bool showOutput;
    bool showLineNumbers;
    bool closeRequested;

private:
    void handleKeyboardShortcuts();
    void applyTheme();
    void loadFont();

    NativeFileDialogs dialogs_;
    FileOperations fileOps_;
    OutputLog log_;
    Editor editor_;
    EditorConfig config_;

    std::unique_ptr<LuaBindings> lua_;
    std::unique_ptr<IconManager> iconManager_;
    std::unique_ptr<EditorRenderer> renderer_;
    std::unique_ptr<OutputPanel> outputPanel_;

    // last so pending tasks finish before the dialogs go away
    TaskRunner runner_;
};
