// OutputPanel.cpp
#include "OutputPanel.hpp"
#include "Application.hpp"
#include "IconManager.hpp"

OutputPanel::OutputPanel(Application* app, IconManager* icons)
    : app_(app), icons_(icons), lastLineCount_(0)
{
}

void OutputPanel::render(ImVec2 workPos, ImVec2 workSize, float outputHeight)
{
    ImVec2 outputPos(workPos.x, workPos.y + workSize.y - outputHeight);
    ImVec2 outputSize(workSize.x, outputHeight);
    ImGui::SetNextWindowPos(outputPos, ImGuiCond_Always);
    ImGui::SetNextWindowSize(outputSize, ImGuiCond_Always);

    if (ImGui::Begin("Output", nullptr,
                     ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                     ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus))
    {
        if (ImGui::Button("Clear"))
        {
            app_->log().clear();
        }

        ImGui::Separator();
        ImGui::BeginChild("OutputText");

        const auto& lines = app_->log().lines();
        for (const auto& line : lines)
        {
            ImVec2 pos = ImGui::GetCursorScreenPos();
            float iconSize = 18.0f;

            ImTextureID icon = icons_->icon(line.icon);
            if (icon != (ImTextureID)0)
            {
                ImGui::GetWindowDrawList()->AddImage(
                    icon,
                    pos,
                    ImVec2(pos.x + iconSize, pos.y + iconSize),
                    ImVec2(0, 0), ImVec2(1, 1),
                    IM_COL32_WHITE);
                ImGui::SetCursorScreenPos(ImVec2(pos.x + iconSize + 6, pos.y));
            }

            ImGui::TextWrapped("%s", line.text.c_str());
        }

        // follow new lines unless the user scrolled up
        if (lines.size() != lastLineCount_ && ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        {
            ImGui::SetScrollHereY(1.0f);
        }
        lastLineCount_ = lines.size();

        ImGui::EndChild();
    }
    ImGui::End();
}
