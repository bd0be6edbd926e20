// OutputPanel.hpp
#pragma once

#include "imgui.h"

class Application;
class IconManager;

class OutputPanel
{
public:
    OutputPanel(Application* app, IconManager* icons);
    ~OutputPanel() = default;

    void render(ImVec2 workPos, ImVec2 workSize, float outputHeight);

private:
    Application* app_;
    IconManager* icons_;
    size_t lastLineCount_;
};
