// IconManager.cpp
#include "IconManager.hpp"
#define NANOSVG_IMPLEMENTATION
#include <nanosvg.h>
#define NANOSVGRAST_IMPLEMENTATION
#include <nanosvgrast.h>
#include <GLFW/glfw3.h>
#include <cstdint>
#include <string>
#include <vector>

IconManager::IconManager(OutputLog* log)
    : log_(log)
{
}

IconManager::~IconManager()
{
    for (auto& entry : icons_)
    {
        GLuint tex = (GLuint)(intptr_t)entry.second;
        if (tex != 0)
            glDeleteTextures(1, &tex);
    }
}

ImTextureID IconManager::loadSVGTexture(const char* filename, float targetHeight)
{
    NSVGimage* image = nsvgParseFromFile(filename, "px", 96);
    if (!image)
    {
        log_->add(OutputIcon::Error, std::string("Could not open SVG: ") + filename);
        return (ImTextureID)0;
    }
    if (image->height <= 0.0f)
    {
        log_->add(OutputIcon::Error, std::string("Empty SVG: ") + filename);
        nsvgDelete(image);
        return (ImTextureID)0;
    }

    float scale = targetHeight / image->height;
    int w = (int)(image->width * scale);
    int h = (int)(image->height * scale);

    NSVGrasterizer* rast = nsvgCreateRasterizer();
    std::vector<unsigned char> img(w * h * 4);
    nsvgRasterize(rast, image, 0, 0, scale, img.data(), w, h, w * 4);

    GLuint tex;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0, GL_RGBA,
                 GL_UNSIGNED_BYTE, img.data());

    nsvgDeleteRasterizer(rast);
    nsvgDelete(image);

    return (ImTextureID)(intptr_t)tex;
}

void IconManager::loadIcons(float dpiScale)
{
    float targetIconSize = 40.0f * dpiScale;
    icons_[OutputIcon::Folder] = loadSVGTexture("icons/folder.svg", targetIconSize);
    icons_[OutputIcon::Document] = loadSVGTexture("icons/document.svg", targetIconSize);
    icons_[OutputIcon::Save] = loadSVGTexture("icons/save.svg", targetIconSize);
    icons_[OutputIcon::Error] = loadSVGTexture("icons/error.svg", targetIconSize);
    icons_[OutputIcon::Checkmark] = loadSVGTexture("icons/checkmark.svg", targetIconSize);
}

ImTextureID IconManager::icon(OutputIcon kind) const
{
    auto it = icons_.find(kind);
    if (it == icons_.end())
        return (ImTextureID)0;
    return it->second;
}

bool IconManager::iconTextButton(const char* id, OutputIcon kind, const char* label, const ImVec2& buttonSize)
{
    bool pressed = ImGui::Button(id, buttonSize);

    ImVec2 pos = ImGui::GetItemRectMin();
    ImVec2 size = ImGui::GetItemRectSize();
    float iconSize = 20.0f;
    float padding = 5.0f;
    ImVec2 iconPos(pos.x + padding, pos.y + (size.y - iconSize) * 0.5f);

    ImTextureID tex = icon(kind);
    if (tex != (ImTextureID)0)
    {
        ImGui::GetWindowDrawList()->AddImage(
            tex,
            iconPos,
            ImVec2(iconPos.x + iconSize, iconPos.y + iconSize),
            ImVec2(0, 0), ImVec2(1, 1),
            IM_COL32_WHITE);
    }

    ImVec2 textSize = ImGui::CalcTextSize(label);
    ImVec2 textPos(iconPos.x + iconSize + padding,
                   pos.y + (size.y - textSize.y) * 0.5f);
    ImGui::GetWindowDrawList()->AddText(textPos, ImGui::GetColorU32(ImGuiCol_Text), label);

    return pressed;
}
